#include "http_server.h"
#include "config.h"
#include "file.h"
#include "http.h"
#include "trace.h"
#include "socket.h"
#include "errors.h"
#include "urlescape.h"
#include "xmlescape.h"
#include "http_parser.h"
#include "file_stream.h"
#include "line_reader.h"
#include "string_stream.h"
#include <sys/stat.h>
#include <sys/utsname.h>
#if HAVE_SYS_SENDFILE_H
#include <sys/sendfile.h>
#endif
#include <fcntl.h>
#include <errno.h>
#include <stdlib.h>
#include <unistd.h>
#include <algorithm>
#include <boost/format.hpp>
#include <boost/scoped_array.hpp>
#include <boost/algorithm/string/predicate.hpp>

LOG_DECL(HTTP);
LOG_DECL(HTTP_SERVER);

namespace util {

namespace http {

void Response::Clear()
{
    content_type = NULL;
    status_line = NULL;
    headers.clear();
    length = 0;
    body_source.reset();
}

/** Per-socket HTTP server subtask
 */
class Server::Connection: private boost::noncopyable
{
    Server *m_parent;
    std::unique_ptr<StreamSocket> m_socket;
    boost::thread m_thread;
    bool m_done; ///< Guarded by parent's m_mutex

    /** Count of requests serviced on this socket.
     */
    unsigned m_count;

    enum { BUFFER_SIZE = 64*1024 };

    /** Largest request body we're prepared to hold in memory */
    enum { MAX_BODY = 1024*1024 };

    unsigned int ReadBody(GreedyLineReader *lr, size_t len,
			  std::string *body);
    unsigned int SendBody(Stream *source, uint64_t offset, uint64_t len);
    unsigned int SendResponse(const Request& rq, Response *rs, bool closing);

    void Run();

public:
    Connection(Server *parent, std::unique_ptr<StreamSocket> client);
    ~Connection();

    /** Spawns the thread; throws boost::thread_resource_error. */
    void Start();

    bool IsDone() const { return m_done; }
    void ShutdownSocket();
    void Join();
};

Server::Connection::Connection(Server *parent,
			       std::unique_ptr<StreamSocket> client)
    : m_parent(parent),
      m_socket(std::move(client)),
      m_done(false),
      m_count(0)
{
}

Server::Connection::~Connection()
{
    LOG(HTTP_SERVER) << "hc" << this << " gone after " << m_count
		     << " requests\n";
}

void Server::Connection::Start()
{
    m_thread = boost::thread(&Connection::Run, this);
}

void Server::Connection::ShutdownSocket()
{
    m_socket->Shutdown();
}

void Server::Connection::Join()
{
    if (m_thread.joinable())
	m_thread.join();
}

unsigned int Server::Connection::ReadBody(GreedyLineReader *lr, size_t len,
					  std::string *body)
{
    body->reserve(len);
    char buffer[4096];

    while (len)
    {
	size_t lump = std::min(len, sizeof(buffer));
	size_t nread = 0;
	if (lr->LeftoverBytes())
	    lr->ReadLeftovers(buffer, lump, &nread);
	else
	{
	    unsigned int rc = m_socket->Read(buffer, lump, &nread);
	    if (rc)
		return rc;
	    if (nread == 0)
		return ECONNRESET;
	}
	body->append(buffer, nread);
	len -= nread;
    }
    return 0;
}

/** Sends len bytes of source, starting at offset.
 *
 * Tries sendfile(2) first; if that's unavailable for this pair of
 * descriptors, falls back to copying through a buffer.
 */
unsigned int Server::Connection::SendBody(Stream *source, uint64_t offset,
					  uint64_t len)
{
    uint64_t sent = 0;

#if HAVE_SYS_SENDFILE_H
    int fd = source->GetHandle();
    if (fd != NOT_POLLABLE && (source->GetStreamFlags() & Stream::SEEKABLE))
    {
	off_t off = (off_t)offset;
	while (sent < len)
	{
	    size_t lump = (size_t)std::min(len - sent,
					   (uint64_t)(1024*1024*1024));
	    ssize_t rc = ::sendfile(m_socket->GetHandle(), fd, &off, lump);
	    if (rc < 0)
	    {
		if (errno == EINTR)
		    continue;
		if (sent == 0 && (errno == EINVAL || errno == ENOSYS
				  || errno == EOPNOTSUPP))
		{
		    LOG(HTTP_SERVER) << "sendfile unsupported (" << errno
				     << "), copying instead\n";
		    break;
		}
		return (unsigned int)errno;
	    }
	    if (rc == 0)
	    {
		// File shrank under us
		TRACE << "Premature EOF at " << (offset+sent) << "\n";
		return EIO;
	    }
	    sent += (uint64_t)rc;
	}
	if (sent == len)
	    return 0;
    }
#endif

    boost::scoped_array<char> buffer(new char[BUFFER_SIZE]);
    while (sent < len)
    {
	size_t lump = (size_t)std::min(len - sent, (uint64_t)BUFFER_SIZE);
	size_t nread = 0;
	unsigned int rc;
	if (source->GetStreamFlags() & Stream::SEEKABLE)
	    rc = source->ReadAt(buffer.get(), offset + sent, lump, &nread);
	else
	    rc = source->Read(buffer.get(), lump, &nread);
	if (rc)
	    return rc;
	if (nread == 0)
	{
	    TRACE << "Premature EOF at " << (offset+sent) << "\n";
	    return EIO;
	}
	rc = m_socket->WriteAll(buffer.get(), nread);
	if (rc)
	    return rc;
	sent += nread;
    }
    return 0;
}

unsigned int Server::Connection::SendResponse(const Request& rq,
					      Response *rs, bool closing)
{
    std::string headers;
    uint64_t len;
    uint64_t offset = 0;
    ByteRange range;
    RangeResult rr = RANGE_NONE;

    if (!rs->body_source)
    {
	if (rs->status_line)
	    headers = rs->status_line;
	else
	    headers = "HTTP/1.1 404 Not Found\r\n";
	rs->body_source.reset(
	    new StringStream("<i>404, it's just not there</i>"));
	rs->content_type = "text/html";
	len = rs->body_source->GetLength();
	LOG(HTTP) << "404ing " << rq.path << "\n";
    }
    else
    {
	len = rs->length ? rs->length : rs->body_source->GetLength();

	if (!rs->status_line
	    && (rs->body_source->GetStreamFlags() & Stream::SEEKABLE))
	{
	    rr = ParseRange(rq.GetHeader("Range"), len, &range);
	}

	switch (rr)
	{
	case RANGE_OK:
	    LOG(HTTP_SERVER) << "Range " << range.start << "-" << range.end
			     << " of " << len << "\n";
	    headers = "HTTP/1.1 206 Partial Content\r\n";
	    break;
	case RANGE_UNSATISFIABLE:
	    LOG(HTTP) << "Range '" << rq.GetHeader("Range")
		      << "' unsatisfiable against " << len << "\n";
	    headers = "HTTP/1.1 416 Requested Range Not Satisfiable\r\n";
	    break;
	case RANGE_NONE:
	default:
	    headers = rs->status_line ? rs->status_line : "HTTP/1.1 200 OK\r\n";
	    break;
	}
    }

    headers += "Date: " + FormatDate(::time(NULL)) + "\r\n";
    headers += m_parent->GetServerHeader();
    headers += "Accept-Ranges: bytes\r\n";
    headers += "Content-Type: ";
    headers += rs->content_type ? rs->content_type : "text/html";
    headers += "\r\n";

    for (std::map<std::string, std::string>::const_iterator i = rs->headers.begin();
	 i != rs->headers.end();
	 ++i)
	headers += i->first + ": " + i->second + "\r\n";

    uint64_t total = len;
    if (rr == RANGE_OK)
    {
	headers += (boost::format("Content-Range: bytes %llu-%llu/%llu\r\n")
		    % range.start % range.end % total).str();
	offset = range.start;
	len = range.Length();
    }
    else if (rr == RANGE_UNSATISFIABLE)
    {
	headers += (boost::format("Content-Range: bytes */%llu\r\n")
		    % total).str();
	len = 0;
    }

    headers += (boost::format("Content-Length: %llu\r\n") % len).str();
    headers += closing ? "Connection: close\r\n" : "Connection: keep-alive\r\n";
    headers += "\r\n";

    LOG(HTTP) << "Response headers:\n" << headers;

    unsigned int rc = m_socket->WriteString(headers);
    if (rc)
	return rc;

    if (rq.verb == "HEAD" || len == 0)
	return 0;

    rc = SendBody(rs->body_source.get(), offset, len);
    if (rc == 0)
	LOG(HTTP) << "hc" << this << ": wrote " << len << " bytes\n";
    return rc;
}

void Server::Connection::Run()
{
    GreedyLineReader lr(m_socket.get());
    Parser parser(&lr);
    IPEndPoint local_ep = m_socket->GetLocalEndPoint();

    LOG(HTTP_SERVER) << "hc" << this << " serving "
		     << m_socket->GetRemoteEndPoint().ToString() << "\n";

    for (;;)
    {
	Request rq;
	rq.local_ep = local_ep;

	unsigned int rc = parser.GetRequestLine(&rq.verb, &rq.path,
						&rq.version);
	if (rc)
	{
	    if (rc != ENODATA && rc != ECONNRESET)
		LOG(HTTP_SERVER) << "hc" << this << " unreadable " << rc
				 << " (request " << m_count << ")\n";
	    break;
	}

	++m_count;

	LOG(HTTP) << "Got request " << m_count << ": " << rq.verb << " "
		  << rq.path << " " << rq.version << "\n";

	bool closing = (rq.version == "HTTP/1.0");
	uint64_t body_length = 0;

	for (;;)
	{
	    std::string key, value;
	    rc = parser.GetHeaderLine(&key, &value);
	    if (rc || key.empty())
		break;

	    LOG(HTTP) << "Got header '" << key << "' = '" << value << "'\n";

	    if (!strcasecmp(key.c_str(), "Connection"))
	    {
		if (boost::algorithm::icontains(value, "close"))
		    closing = true;
		else if (boost::algorithm::icontains(value, "keep-alive"))
		    closing = false;
	    }
	    else if (!strcasecmp(key.c_str(), "Content-Length"))
		body_length = strtoull(value.c_str(), NULL, 10);

	    rq.headers[key] = value;
	}
	if (rc)
	    break;

	if (body_length > MAX_BODY)
	{
	    TRACE << "Request body too big (" << body_length << ")\n";
	    break;
	}
	if (body_length)
	{
	    rc = ReadBody(&lr, (size_t)body_length, &rq.body);
	    if (rc)
	    {
		TRACE << "Reading body failed " << rc << "\n";
		break;
	    }
	}

	Response rs;
	m_parent->StreamForPath(&rq, &rs);

	rc = SendResponse(rq, &rs, closing);
	if (rc)
	{
	    // Renderers drop connections mid-body all the time, e.g. when
	    // seeking
	    if (rc == EPIPE || rc == ECONNRESET)
		LOG(HTTP_SERVER) << "hc" << this << " client went away\n";
	    else
		TRACE << "hc" << this << " sending " << rq.path
		      << " failed: " << rc << "\n";
	    break;
	}

	if (closing)
	{
	    LOG(HTTP) << "hc" << this << " closing connection now\n";
	    break;
	}
    }

    m_socket->Shutdown();

    boost::mutex::scoped_lock lock(m_parent->m_mutex);
    m_done = true;
}


        /* Server itself */


Server::Server()
    : m_port(0),
      m_shutting_down(false)
{
    struct utsname ubuf;

    if (uname(&ubuf) == 0)
	m_server_header = (boost::format("Server: %s/%s UPnP/1.0 %s/%s\r\n")
			   % ubuf.sysname % ubuf.release
			   % PACKAGE_NAME % PACKAGE_VERSION).str();
    else
	m_server_header = "Server: UPnP/1.0 " PACKAGE_NAME "/"
	    PACKAGE_VERSION "\r\n";

    LOG(HTTP_SERVER) << m_server_header;
}

Server::~Server()
{
    LOG(HTTP_SERVER) << "~Server calls shutdown\n";
    Shutdown();
}

unsigned Server::Init(unsigned short port, const SocketOptions& options)
{
    IgnoreSigPipe();

    m_options = options;
    m_listener.reset(new StreamSocket);
    if (!m_listener->IsOpen())
	return EMFILE;

    IPEndPoint ep = { IPAddress::ANY, port };
    unsigned int rc = m_listener->Bind(ep);
    if (rc != 0)
    {
	TRACE << "Server bind to port " << port << " failed " << rc << "\n";
	m_listener.reset();
	return rc;
    }

    // Best-effort tuning; accepted sockets inherit all of these
    rc = m_listener->SetNoDelay(options.no_delay);
    if (rc)
	LOG(HTTP_SERVER) << "TCP_NODELAY failed " << rc << "\n";
    rc = m_listener->SetBufferSizes(options.send_buffer, options.recv_buffer);
    if (rc)
	LOG(HTTP_SERVER) << "Buffer sizes failed " << rc << "\n";
    rc = m_listener->SetKeepAlive(options.keep_alive, options.keep_idle_sec);
    if (rc)
	LOG(HTTP_SERVER) << "Keepalive failed " << rc << "\n";

    rc = m_listener->Listen();
    if (rc)
    {
	TRACE << "Listen failed " << rc << "\n";
	m_listener.reset();
	return rc;
    }

    m_port = m_listener->GetLocalEndPoint().port;
    m_shutting_down = false;

    try
    {
	m_acceptor = boost::thread(&Server::AcceptorLoop, this);
    }
    catch (const boost::thread_resource_error& e)
    {
	TRACE << "Can't start acceptor thread: " << e.what() << "\n";
	m_listener.reset();
	m_port = 0;
	return EAGAIN;
    }

    TRACE << "http::Server got port " << m_port << "\n";
    return 0;
}

void Server::ReapConnections()
{
    std::list<Connection*> dead;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	for (std::list<Connection*>::iterator i = m_connections.begin();
	     i != m_connections.end(); )
	{
	    if ((*i)->IsDone())
	    {
		dead.push_back(*i);
		i = m_connections.erase(i);
	    }
	    else
		++i;
	}
    }

    for (std::list<Connection*>::iterator i = dead.begin();
	 i != dead.end();
	 ++i)
    {
	(*i)->Join();
	delete *i;
    }
}

void Server::AcceptorLoop()
{
    for (;;)
    {
	{
	    boost::mutex::scoped_lock lock(m_mutex);
	    if (m_shutting_down)
		break;
	}

	ReapConnections();

	unsigned int rc = m_listener->WaitForRead(250);
	if (rc == EWOULDBLOCK)
	    continue;

	std::unique_ptr<StreamSocket> ssp;
	if (rc == 0)
	    rc = m_listener->Accept(&ssp);
	if (rc)
	{
	    boost::mutex::scoped_lock lock(m_mutex);
	    if (m_shutting_down)
		break;
	    TRACE << "Accept failed " << rc << "\n";
	    lock.unlock();
	    ::usleep(100*1000);
	    continue;
	}

	Connection *c = new Connection(this, std::move(ssp));

	boost::mutex::scoped_lock lock(m_mutex);
	if (m_shutting_down)
	{
	    delete c;
	    break;
	}
	try
	{
	    c->Start();
	}
	catch (const boost::thread_resource_error& e)
	{
	    TRACE << "Can't start connection thread: " << e.what() << "\n";
	    delete c;
	    continue;
	}
	m_connections.push_back(c);
    }

    LOG(HTTP_SERVER) << "Acceptor exiting\n";
}

void Server::Shutdown()
{
    {
	boost::mutex::scoped_lock lock(m_mutex);
	m_shutting_down = true;
    }

    if (m_listener)
	m_listener->Shutdown();
    if (m_acceptor.joinable())
	m_acceptor.join();

    std::list<Connection*> connections;
    {
	boost::mutex::scoped_lock lock(m_mutex);
	connections.swap(m_connections);
	for (std::list<Connection*>::iterator i = connections.begin();
	     i != connections.end();
	     ++i)
	    (*i)->ShutdownSocket();
    }

    for (std::list<Connection*>::iterator i = connections.begin();
	 i != connections.end();
	 ++i)
    {
	(*i)->Join();
	delete *i;
    }

    if (m_listener)
    {
	LOG(HTTP_SERVER) << "Releasing port " << m_port << "\n";
	m_listener.reset();
    }
}

void Server::StreamForPath(const Request *rq, Response *rs)
{
    for (list_t::iterator i = m_content.begin();
	 i != m_content.end();
	 ++i)
    {
	bool taken = (*i)->StreamForPath(rq, rs);
	if (taken)
	    return;
    }

    if (rq->verb == "OPTIONS")
    {
	/* We don't support any options, but send 200 and an empty
	 * body to say so.
	 */
	rs->body_source.reset(new util::StringStream());
    }
}

void Server::AddContentFactory(const std::string&, ContentFactory *cf)
{
    m_content.push_back(cf);
}


        /* FileContentFactory */


FileContentFactory::FileContentFactory(const std::string& file_root,
				       const std::string& page_root)
    : m_file_root(file_root),
      m_page_root(page_root)
{
    while (m_file_root.length() > 1 && m_file_root[m_file_root.length()-1] == '/')
	m_file_root.erase(m_file_root.length()-1);
}

FileContentFactory::~FileContentFactory()
{
}

static const struct { const char *extension; const char *mimetype; }
    mimemap[] = {
	{ "htm",  "text/html" },
	{ "html", "text/html" },
	{ "ico",  "image/x-icon" },
	{ "jpg",  "image/jpeg" },
	{ "png",  "image/png" },
	{ "srt",  "text/plain" },
	{ "txt",  "text/plain" },
	{ "xml",  "text/xml" },
    };

static const char *ContentType(const std::string& path)
{
    std::string extension = GetExtension(path.c_str());

    for (unsigned int i=0; i<sizeof(mimemap)/sizeof(*mimemap); ++i)
    {
	if (!strcasecmp(extension.c_str(), mimemap[i].extension))
	    return mimemap[i].mimetype;
    }
    return "application/octet-stream";
}

void FileContentFactory::ListDirectory(const std::string& dir,
				       const std::string& urlpath,
				       Response *rs)
{
    std::vector<Dirent> entries;
    unsigned int rc = ReadDirectory(dir, &entries);
    if (rc)
    {
	TRACE << "Can't list '" << dir << "': " << rc << "\n";
	rs->status_line = "HTTP/1.1 500 Internal Server Error\r\n";
	rs->body_source.reset(new StringStream("<i>Can't list directory</i>"));
	return;
    }

    std::string base = urlpath;
    if (base.empty() || base[base.length()-1] != '/')
	base += "/";

    std::string title = XmlEscape("Directory listing for " + base);
    std::string html = "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\">"
	"<title>" + title + "</title></head>\n<body><h1>" + title
	+ "</h1>\n<hr>\n<ul>\n";
    for (std::vector<Dirent>::const_iterator i = entries.begin();
	 i != entries.end();
	 ++i)
    {
	std::string name = i->name;
	if (S_ISDIR(i->st.st_mode))
	    name += "/";
	html += "<li><a href=\"" + XmlEscape(URLEscape(name)) + "\">"
	    + XmlEscape(name) + "</a></li>\n";
    }
    html += "</ul>\n<hr>\n</body></html>\n";

    rs->body_source.reset(new StringStream(html));
    rs->content_type = "text/html; charset=utf-8";
}

bool FileContentFactory::StreamForPath(const Request *rq, Response *rs)
{
    if (strncmp(rq->path.c_str(), m_page_root.c_str(), m_page_root.length()))
	return false;

    if (rq->verb != "GET" && rq->verb != "HEAD")
	return false;

    std::string urlpath = rq->path;
    std::string::size_type query = urlpath.find_first_of("?#");
    if (query != std::string::npos)
	urlpath.erase(query);

    std::string relative = URLUnEscape(std::string(urlpath,
						   m_page_root.length()));

    if (HasParentReference(relative))
    {
	TRACE << "Refusing '" << rq->path << "'\n";
	return true; // Body-less, so 404
    }

    std::string path2 = m_file_root;
    if (relative.empty() || relative[0] != '/')
	path2 += "/";
    path2 += relative;

    struct stat st;
    if (::stat(path2.c_str(), &st) < 0)
    {
	LOG(HTTP) << "Resolved file '" << path2 << "' not found\n";
	return false;
    }

    if (S_ISDIR(st.st_mode))
    {
	ListDirectory(path2, urlpath, rs);
	return true;
    }

    if (!S_ISREG(st.st_mode))
    {
	TRACE << "Resolved file '" << path2 << "' not a file\n";
	return false;
    }

    unsigned int rc = util::OpenFileStream(path2.c_str(), util::READ,
					   &rs->body_source);
    if (rc != 0)
    {
	TRACE << "Resolved file '" << path2 << "' won't open " << rc
	      << "\n";
	rs->status_line = "HTTP/1.1 500 Internal Server Error\r\n";
	rs->body_source.reset(new StringStream("<i>Can't open file</i>"));
	return true;
    }

    rs->content_type = ContentType(path2);
    rs->headers["Last-Modified"] = FormatDate(st.st_mtime);

    OnFile(path2, st, rs);

    LOG(HTTP) << "Path '" << rq->path << "' is file '" << path2 << "'\n";
    return true;
}

} // namespace http

} // namespace util

#ifdef TEST

# include <assert.h>
# include <stdio.h>
# include <unistd.h>

class EchoContentFactory: public util::http::ContentFactory
{
public:
    bool StreamForPath(const util::http::Request *rq,
		       util::http::Response *rs) override
    {
	if (strncmp(rq->path.c_str(), "/echo", 5))
	    return false;
	rs->body_source.reset(new util::StringStream(rq->verb + " "
						     + rq->body));
	rs->content_type = "text/plain";
	return true;
    }
};

static bool EqualButForStars(const char *got, const char *pattern)
{
    while (*got && *pattern)
    {
	if (*pattern != '*' && *got != *pattern)
	{
	    return false;
	}
	if (*pattern != '*' || got[1] == pattern[1])
	    ++pattern;
	++got;
    }
    return !*got && !*pattern;
}

/** Sends tx, then reads until the server closes the connection.
 */
static std::string Exchange(unsigned short port, const char *tx)
{
    util::StreamSocket ss;
    ss.SetTimeoutMS(5000);
    util::IPEndPoint ipe = { util::IPAddress::LOOPBACK, port };
    unsigned rc = ss.Connect(ipe);
    assert(rc == 0);
    rc = ss.WriteAll(tx, strlen(tx));
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

static void CheckHeaders(const std::string& rx, const char *pattern,
			 std::string *body)
{
    std::string::size_type blank = rx.find("\r\n\r\n");
    assert(blank != std::string::npos);
    std::string headers = rx.substr(0, blank+4);
    bool ok = EqualButForStars(headers.c_str(), pattern);
    if (!ok)
    {
	fprintf(stderr, "Expected:%s\nGot:%s\n", pattern, headers.c_str());
    }
    assert(ok);
    *body = rx.substr(blank+4);
}

int main(int, char*[])
{
    char dirname[] = "/tmp/http_server.XXXXXX";
    char *dir = mkdtemp(dirname);
    assert(dir);

    std::string content;
    for (unsigned int i=0; i<1000; ++i)
	content += (char)('a' + i%26);

    std::string filename = std::string(dir) + "/film one.mp4";
    FILE *f = fopen(filename.c_str(), "wb");
    assert(f);
    fwrite(content.data(), 1, content.size(), f);
    fclose(f);
    std::string subdir = std::string(dir) + "/sub";
    mkdir(subdir.c_str(), 0755);

    util::http::Server ws;
    EchoContentFactory ecf;
    util::http::FileContentFactory fcf(dir, "/");
    ws.AddContentFactory("/", &ecf);
    ws.AddContentFactory("/", &fcf);

    unsigned rc = ws.Init();
    assert(rc == 0);
    unsigned short port = ws.GetPort();
    assert(port != 0);

    std::string body;

    // Whole file from a range request
    CheckHeaders(Exchange(port,
			  "GET /film%20one.mp4 HTTP/1.1\r\n"
			  "Range: bytes=0-\r\n"
			  "Connection: close\r\n"
			  "\r\n"),
		 "HTTP/1.1 206 Partial Content\r\n"
		 "Date: *\r\n"
		 "Server: * UPnP/1.0 " PACKAGE_NAME "/*\r\n"
		 "Accept-Ranges: bytes\r\n"
		 "Content-Type: application/octet-stream\r\n"
		 "Last-Modified: *\r\n"
		 "Content-Range: bytes 0-999/1000\r\n"
		 "Content-Length: 1000\r\n"
		 "Connection: close\r\n"
		 "\r\n", &body);
    assert(body == content);

    // Open-ended tail
    CheckHeaders(Exchange(port,
			  "GET /film%20one.mp4 HTTP/1.1\r\n"
			  "Range: bytes=500-\r\n"
			  "Connection: close\r\n"
			  "\r\n"),
		 "HTTP/1.1 206 Partial Content\r\n"
		 "Date: *\r\n"
		 "Server: *\r\n"
		 "Accept-Ranges: bytes\r\n"
		 "Content-Type: application/octet-stream\r\n"
		 "Last-Modified: *\r\n"
		 "Content-Range: bytes 500-999/1000\r\n"
		 "Content-Length: 500\r\n"
		 "Connection: close\r\n"
		 "\r\n", &body);
    assert(body == content.substr(500));

    // Bounded range
    CheckHeaders(Exchange(port,
			  "GET /film%20one.mp4 HTTP/1.1\r\n"
			  "Range: bytes=100-199\r\n"
			  "Connection: close\r\n"
			  "\r\n"),
		 "HTTP/1.1 206 Partial Content\r\n"
		 "Date: *\r\n"
		 "Server: *\r\n"
		 "Accept-Ranges: bytes\r\n"
		 "Content-Type: application/octet-stream\r\n"
		 "Last-Modified: *\r\n"
		 "Content-Range: bytes 100-199/1000\r\n"
		 "Content-Length: 100\r\n"
		 "Connection: close\r\n"
		 "\r\n", &body);
    assert(body == content.substr(100, 100));

    // Beyond the end
    CheckHeaders(Exchange(port,
			  "GET /film%20one.mp4 HTTP/1.1\r\n"
			  "Range: bytes=1000-\r\n"
			  "Connection: close\r\n"
			  "\r\n"),
		 "HTTP/1.1 416 Requested Range Not Satisfiable\r\n"
		 "Date: *\r\n"
		 "Server: *\r\n"
		 "Accept-Ranges: bytes\r\n"
		 "Content-Type: application/octet-stream\r\n"
		 "Last-Modified: *\r\n"
		 "Content-Range: bytes */1000\r\n"
		 "Content-Length: 0\r\n"
		 "Connection: close\r\n"
		 "\r\n", &body);
    assert(body.empty());

    // Malformed range falls back to the whole thing
    CheckHeaders(Exchange(port,
			  "GET /film%20one.mp4 HTTP/1.1\r\n"
			  "Range: bytes=200-100\r\n"
			  "Connection: close\r\n"
			  "\r\n"),
		 "HTTP/1.1 200 OK\r\n"
		 "Date: *\r\n"
		 "Server: *\r\n"
		 "Accept-Ranges: bytes\r\n"
		 "Content-Type: application/octet-stream\r\n"
		 "Last-Modified: *\r\n"
		 "Content-Length: 1000\r\n"
		 "Connection: close\r\n"
		 "\r\n", &body);
    assert(body == content);

    // HEAD, and HTTP/1.0 implying close
    CheckHeaders(Exchange(port,
			  "HEAD /film%20one.mp4 HTTP/1.0\r\n"
			  "\r\n"),
		 "HTTP/1.1 200 OK\r\n"
		 "Date: *\r\n"
		 "Server: *\r\n"
		 "Accept-Ranges: bytes\r\n"
		 "Content-Type: application/octet-stream\r\n"
		 "Last-Modified: *\r\n"
		 "Content-Length: 1000\r\n"
		 "Connection: close\r\n"
		 "\r\n", &body);
    assert(body.empty());

    // Missing file
    CheckHeaders(Exchange(port,
			  "GET /nothere.mkv HTTP/1.1\r\n"
			  "Connection: close\r\n"
			  "\r\n"),
		 "HTTP/1.1 404 Not Found\r\n"
		 "Date: *\r\n"
		 "Server: *\r\n"
		 "Accept-Ranges: bytes\r\n"
		 "Content-Type: text/html\r\n"
		 "Content-Length: *\r\n"
		 "Connection: close\r\n"
		 "\r\n", &body);

    // Escaping the root
    std::string rx = Exchange(port,
			      "GET /sub/../../etc/passwd HTTP/1.1\r\n"
			      "Connection: close\r\n"
			      "\r\n");
    assert(rx.find("HTTP/1.1 404 Not Found\r\n") == 0);

    // Directory listing
    CheckHeaders(Exchange(port,
			  "GET / HTTP/1.1\r\n"
			  "Connection: close\r\n"
			  "\r\n"),
		 "HTTP/1.1 200 OK\r\n"
		 "Date: *\r\n"
		 "Server: *\r\n"
		 "Accept-Ranges: bytes\r\n"
		 "Content-Type: text/html; charset=utf-8\r\n"
		 "Content-Length: *\r\n"
		 "Connection: close\r\n"
		 "\r\n", &body);
    assert(body.find("<a href=\"film%20one.mp4\">film one.mp4</a>")
	   != std::string::npos);
    assert(body.find("<a href=\"sub/\">sub/</a>") != std::string::npos);

    // Keep-alive and pipelining, with request bodies
    rx = Exchange(port,
		  "POST /echo HTTP/1.1\r\n"
		  "Content-Length: 6\r\n"
		  "\r\n"
		  "ptang\n"
		  "GET /film%20one.mp4 HTTP/1.1\r\n"
		  "Range: bytes=0-9\r\n"
		  "\r\n"
		  "POST /echo HTTP/1.1\r\n"
		  "Content-Length: 6\r\n"
		  "Connection: close\r\n"
		  "\r\n"
		  "frink\n");
    std::string::size_type first = rx.find("\r\n\r\nPOST ptang\n");
    assert(first != std::string::npos);
    std::string::size_type second = rx.find("\r\n\r\nabcdefghij", first);
    assert(second != std::string::npos);
    std::string::size_type third = rx.find("\r\n\r\nPOST frink\n", second);
    assert(third != std::string::npos);
    assert(rx.find("Connection: keep-alive\r\n") < second);
    assert(rx.find("Connection: close\r\n") > second);

    // Clients hanging up mid-body (as renderers do when seeking) must
    // cost only that connection
    std::string bigname = std::string(dir) + "/big.mkv";
    f = fopen(bigname.c_str(), "wb");
    assert(f);
    std::string mib(1024*1024, 'z');
    for (unsigned int i=0; i<8; ++i)
	fwrite(mib.data(), 1, mib.size(), f);
    fclose(f);

    for (unsigned int i=0; i<3; ++i)
    {
	util::StreamSocket quitter;
	quitter.SetTimeoutMS(5000);
	util::IPEndPoint ipe = { util::IPAddress::LOOPBACK, port };
	rc = quitter.Connect(ipe);
	assert(rc == 0);
	rc = quitter.WriteString("GET /big.mkv HTTP/1.1\r\n"
				 "Range: bytes=0-\r\n"
				 "\r\n");
	assert(rc == 0);
	char buffer[4096];
	size_t nread;
	rc = quitter.Read(buffer, sizeof(buffer), &nread);
	assert(rc == 0);
	assert(nread > 0);
	assert(!strncmp(buffer, "HTTP/1.1 206", 12));
	quitter.Close();
    }
    usleep(200*1000);

    CheckHeaders(Exchange(port,
			  "GET /big.mkv HTTP/1.1\r\n"
			  "Range: bytes=8388600-\r\n"
			  "Connection: close\r\n"
			  "\r\n"),
		 "HTTP/1.1 206 Partial Content\r\n"
		 "Date: *\r\n"
		 "Server: *\r\n"
		 "Accept-Ranges: bytes\r\n"
		 "Content-Type: *\r\n"
		 "Last-Modified: *\r\n"
		 "Content-Range: bytes 8388600-8388607/8388608\r\n"
		 "Content-Length: 8\r\n"
		 "Connection: close\r\n"
		 "\r\n", &body);
    assert(body == "zzzzzzzz");
    unlink(bigname.c_str());

    // Shutdown releases the port
    ws.Shutdown();
    ws.Shutdown();
    util::StreamSocket again;
    util::IPEndPoint ep = { util::IPAddress::ANY, port };
    rc = again.Bind(ep);
    assert(rc == 0);

    unlink(filename.c_str());
    rmdir(subdir.c_str());
    rmdir(dir);

    return 0;
}

#endif
