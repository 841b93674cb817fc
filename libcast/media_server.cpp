#include "media_server.h"
#include "libupnp/dlna.h"
#include "libutil/trace.h"

LOG_DECL(CAST);

namespace cast {

MediaContentFactory::MediaContentFactory(const std::string& file_root,
					 const std::string& page_root)
    : util::http::FileContentFactory(file_root, page_root)
{
}

/** Known MIME types, as Response::content_type must outlive the
 * response.
 */
static const char *const s_mime_types[] = {
    "video/mp4", "video/x-matroska", "video/x-msvideo", "video/quicktime",
    "video/webm", "video/mpeg", "video/mp2t", "video/ogg", "video/3gpp",
    "video/x-ms-wmv", "audio/mpeg", "audio/mp4", "audio/aac", "audio/flac",
    "audio/ogg", "audio/x-wav", "audio/x-ms-wma", "image/jpeg", "image/png",
    "text/plain",
};

static const char *StaticMimeType(const std::string& mime_type)
{
    for (unsigned int i=0; i<sizeof(s_mime_types)/sizeof(*s_mime_types); ++i)
	if (mime_type == s_mime_types[i])
	    return s_mime_types[i];
    return "application/octet-stream";
}

void MediaContentFactory::OnFile(const std::string& filename,
				 const struct stat&,
				 util::http::Response *rs)
{
    rs->content_type = StaticMimeType(
	upnp::dlna::GuessMimeType(filename, "application/octet-stream"));
    rs->headers["transferMode.dlna.org"] = "Streaming";
    rs->headers["contentFeatures.dlna.org"] = upnp::dlna::ContentFeatures();
    rs->headers["Cache-Control"] = "no-cache";
    rs->headers["Pragma"] = "no-cache";

    LOG(CAST) << "Serving " << filename << " as " << rs->content_type << "\n";
}

} // namespace cast

#ifdef TEST

# include "libutil/socket.h"
# include "libupnp/dlna.h"
# include <assert.h>
# include <stdio.h>
# include <stdlib.h>
# include <unistd.h>

static std::string Exchange(unsigned short port, const std::string& tx)
{
    util::StreamSocket ss;
    ss.SetTimeoutMS(5000);
    util::IPEndPoint ipe = { util::IPAddress::LOOPBACK, port };
    unsigned rc = ss.Connect(ipe);
    assert(rc == 0);
    rc = ss.WriteString(tx);
    assert(rc == 0);

    std::string rxs;
    for (;;)
    {
	char buffer[4096];
	size_t nread;
	rc = ss.Read(buffer, sizeof(buffer), &nread);
	assert(rc == 0);
	if (nread == 0)
	    break;
	rxs.append(buffer, nread);
    }
    return rxs;
}

static bool HasHeader(const std::string& rx, const std::string& header)
{
    return rx.find("\r\n" + header + "\r\n") != std::string::npos;
}

int main()
{
    char dirname[] = "/tmp/media_server.XXXXXX";
    char *dir = mkdtemp(dirname);
    assert(dir);

    std::string content(1000, 'x');
    for (unsigned int i=0; i<content.size(); ++i)
	content[i] = (char)(i & 0xFF);

    std::string filename = std::string(dir) + "/Film & Friends.mkv";
    FILE *f = fopen(filename.c_str(), "wb");
    assert(f);
    fwrite(content.data(), 1, content.size(), f);
    fclose(f);

    util::http::Server ws;
    cast::MediaContentFactory mcf(dir, "/");
    ws.AddContentFactory("/", &mcf);
    unsigned int rc = ws.Init();
    assert(rc == 0);

    std::string rx = Exchange(ws.GetPort(),
			      "GET /Film%20%26%20Friends.mkv HTTP/1.1\r\n"
			      "Range: bytes=100-199\r\n"
			      "Connection: close\r\n"
			      "\r\n");
    assert(rx.find("HTTP/1.1 206 Partial Content\r\n") == 0);
    assert(HasHeader(rx, "Accept-Ranges: bytes"));
    assert(HasHeader(rx, "Content-Type: video/x-matroska"));
    assert(HasHeader(rx, "transferMode.dlna.org: Streaming"));
    assert(HasHeader(rx, "contentFeatures.dlna.org: "
		     + upnp::dlna::ContentFeatures()));
    assert(HasHeader(rx, "Cache-Control: no-cache"));
    assert(HasHeader(rx, "Pragma: no-cache"));
    assert(HasHeader(rx, "Content-Range: bytes 100-199/1000"));
    assert(HasHeader(rx, "Content-Length: 100"));
    assert(HasHeader(rx, "Connection: close"));
    assert(rx.find("\r\nLast-Modified: ") != std::string::npos);
    assert(rx.find("\r\nDate: ") != std::string::npos);
    assert(rx.find("\r\nServer: ") != std::string::npos);
    std::string::size_type blank = rx.find("\r\n\r\n");
    assert(rx.substr(blank+4) == content.substr(100, 100));

    // Malformed range
    rx = Exchange(ws.GetPort(),
		  "GET /Film%20%26%20Friends.mkv HTTP/1.1\r\n"
		  "Range: items=0-5\r\n"
		  "Connection: close\r\n"
		  "\r\n");
    assert(rx.find("HTTP/1.1 200 OK\r\n") == 0);
    assert(HasHeader(rx, "Content-Length: 1000"));
    assert(HasHeader(rx, "transferMode.dlna.org: Streaming"));

    rx = Exchange(ws.GetPort(),
		  "GET /Film%20%26%20Friends.mkv HTTP/1.1\r\n"
		  "Range: bytes=abc-def\r\n"
		  "Connection: close\r\n"
		  "\r\n");
    assert(rx.find("HTTP/1.1 200 OK\r\n") == 0);
    blank = rx.find("\r\n\r\n");
    assert(rx.substr(blank+4) == content);

    // Beyond the end
    rx = Exchange(ws.GetPort(),
		  "GET /Film%20%26%20Friends.mkv HTTP/1.1\r\n"
		  "Range: bytes=1000-\r\n"
		  "Connection: close\r\n"
		  "\r\n");
    assert(rx.find("HTTP/1.1 416 ") == 0);
    assert(HasHeader(rx, "Content-Range: bytes */1000"));

    // Unreadable file is a 500
    if (geteuid() != 0)
    {
	chmod(filename.c_str(), 0);
	rx = Exchange(ws.GetPort(),
		      "GET /Film%20%26%20Friends.mkv HTTP/1.1\r\n"
		      "Connection: close\r\n"
		      "\r\n");
	assert(rx.find("HTTP/1.1 500 Internal Server Error\r\n") == 0);
	chmod(filename.c_str(), 0644);
    }

    ws.Shutdown();

    unlink(filename.c_str());
    rmdir(dir);

    return 0;
}

#endif
