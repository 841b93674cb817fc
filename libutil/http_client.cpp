#include "config.h"
#include "http_client.h"
#include "http.h"
#include "socket.h"
#include "tls.h"
#include "line_reader.h"
#include "trace.h"
#include "errors.h"
#include <stdlib.h>
#include <string.h>
#include <memory>
#include <algorithm>
#include <boost/format.hpp>
#include <boost/algorithm/string/predicate.hpp>

LOG_DECL(HTTP_CLIENT);

namespace util {

namespace http {

namespace {

/** Reads exactly n bytes of body, starting with whatever the line
 * reader has already buffered.
 */
unsigned int ReadExactly(GreedyLineReader *lr, Stream *s, size_t n,
			 std::string *body)
{
    char buffer[4096];

    while (n)
    {
	size_t lump = std::min(n, sizeof(buffer));
	size_t nread = 0;
	if (lr->LeftoverBytes())
	    lr->ReadLeftovers(buffer, lump, &nread);
	else
	{
	    unsigned int rc = s->Read(buffer, lump, &nread);
	    if (rc)
		return rc;
	    if (nread == 0)
		return EIO; // Premature EOF
	}
	body->append(buffer, nread);
	n -= nread;
    }
    return 0;
}

unsigned int ReadToEOF(GreedyLineReader *lr, Stream *s, std::string *body)
{
    char buffer[4096];

    for (;;)
    {
	size_t nread = 0;
	if (lr->LeftoverBytes())
	    lr->ReadLeftovers(buffer, sizeof(buffer), &nread);
	else
	{
	    unsigned int rc = s->Read(buffer, sizeof(buffer), &nread);
	    if (rc)
		return rc;
	    if (nread == 0)
		return 0;
	}
	body->append(buffer, nread);
    }
}

unsigned int ReadChunked(GreedyLineReader *lr, Stream *s, std::string *body)
{
    for (;;)
    {
	std::string line;
	unsigned int rc = lr->GetLine(&line);
	if (rc)
	    return rc;

	// Chunk extensions after ';' are ignored
	char *endptr = NULL;
	unsigned long chunk = strtoul(line.c_str(), &endptr, 16);
	if (endptr == line.c_str())
	{
	    TRACE << "Bad chunk header '" << line << "'\n";
	    return EINVAL;
	}

	if (chunk == 0)
	{
	    // Trailers, up to the blank line
	    do {
		rc = lr->GetLine(&line);
		if (rc == ENODATA)
		    return 0;
		if (rc)
		    return rc;
	    } while (!line.empty());
	    return 0;
	}

	rc = ReadExactly(lr, s, chunk, body);
	if (rc)
	    return rc;

	rc = lr->GetLine(&line); // CRLF after the data
	if (rc)
	    return rc;
    }
}

} // anon namespace

Fetcher::Fetcher(const std::string& url,
		 const char *extra_headers,
		 const char *body,
		 const char *verb,
		 unsigned int timeout_ms)
    : m_url(url),
      m_extra_headers(extra_headers ? extra_headers : ""),
      m_body(body ? body : ""),
      m_verb(verb ? verb : (body ? "POST" : "GET")),
      m_timeout_ms(timeout_ms),
      m_status(0)
{
}

Fetcher::~Fetcher()
{
}

unsigned int Fetcher::FetchToString(std::string *presult)
{
    m_status = 0;
    m_headers.clear();
    presult->clear();

    URL url;
    unsigned int rc = ParseURL(m_url, &url);
    if (rc)
    {
	TRACE << "Can't fetch '" << m_url << "': not an http(s) URL\n";
	return rc;
    }

    IPEndPoint ep;
    ep.addr = IPAddress::Resolve(url.host.c_str());
    ep.port = url.port;
    if (ep.addr == IPAddress::ANY)
	return EHOSTUNREACH;

    StreamSocket socket;
    if (!socket.IsOpen())
	return EMFILE;
    socket.SetTimeoutMS(m_timeout_ms);

    rc = socket.Connect(ep);
    if (rc)
    {
	LOG(HTTP_CLIENT) << "Connect to " << ep.ToString() << " failed: "
			 << rc << "\n";
	return rc;
    }
    m_local_endpoint = socket.GetLocalEndPoint();

    Stream *stream = &socket;
    std::unique_ptr<TlsStream> tls;
    if (url.scheme == "https")
    {
	tls.reset(new TlsStream(&socket));
	rc = tls->Handshake(url.host);
	if (rc)
	    return rc;
	stream = tls.get();
    }

    std::string request = (boost::format("%s %s HTTP/1.1\r\n"
					 "Host: %s\r\n"
					 "User-Agent: %s/%s\r\n"
					 "Connection: close\r\n")
			   % m_verb % url.path % url.HostHeader()
			   % PACKAGE_NAME % PACKAGE_VERSION).str();
    if (!m_body.empty() || !strcmp(m_verb, "POST"))
	request += (boost::format("Content-Length: %u\r\n")
		    % m_body.length()).str();
    request += m_extra_headers;
    request += "\r\n";
    request += m_body;

    LOG(HTTP_CLIENT) << m_verb << " " << m_url << "\n";

    rc = stream->WriteString(request);
    if (rc)
    {
	LOG(HTTP_CLIENT) << "Send failed: " << rc << "\n";
	return rc;
    }

    GreedyLineReader lr(stream);
    Parser parser(&lr);

    std::string version;
    rc = parser.GetResponseLine(&m_status, &version);
    if (rc == ENODATA)
	return ECONNRESET;
    if (rc)
	return rc;
    rc = parser.GetHeaders(&m_headers);
    if (rc)
	return rc;

    LOG(HTTP_CLIENT) << "Status " << m_status << "\n";

    std::string body;
    if (!strcmp(m_verb, "HEAD") || m_status == 204 || m_status == 304
	|| (m_status >= 100 && m_status < 200))
	rc = 0;
    else if (boost::algorithm::icontains(GetHeader("Transfer-Encoding"),
					 "chunked"))
	rc = ReadChunked(&lr, stream, &body);
    else
    {
	std::string cl = GetHeader("Content-Length");
	if (!cl.empty())
	    rc = ReadExactly(&lr, stream, (size_t)strtoull(cl.c_str(), NULL, 10),
			     &body);
	else
	    rc = ReadToEOF(&lr, stream, &body);
    }

    if (rc)
    {
	LOG(HTTP_CLIENT) << "Body read failed: " << rc << "\n";
	return rc;
    }

    presult->swap(body);
    return 0;
}

} // namespace http

} // namespace util

#ifdef TEST

#include <assert.h>
#include <boost/thread/thread.hpp>

/** Serves one canned response to one connection, and remembers the
 * request it got.
 */
static void ServeOnce(util::StreamSocket *listener, const char *response,
		      std::string *request)
{
    std::unique_ptr<util::StreamSocket> conn;
    unsigned int rc = listener->Accept(&conn);
    assert(rc == 0);

    conn->SetTimeoutMS(2000);
    char buffer[1024];
    size_t nread = 0;
    rc = conn->Read(buffer, sizeof(buffer), &nread);
    assert(rc == 0);
    request->assign(buffer, nread);

    rc = conn->WriteString(response);
    assert(rc == 0);
}

static unsigned int FetchCanned(const char *response, const char *body,
				util::http::Fetcher **pf, std::string *result,
				std::string *request)
{
    util::StreamSocket listener;
    util::IPEndPoint any = { util::IPAddress::ANY, 0 };
    unsigned int rc = listener.Bind(any);
    assert(rc == 0);
    rc = listener.Listen();
    assert(rc == 0);

    boost::thread server(&ServeOnce, &listener, response, request);

    std::string url = (boost::format("http://127.0.0.1:%u/ctl")
		       % listener.GetLocalEndPoint().port).str();
    *pf = new util::http::Fetcher(url, "X-Test: 1\r\n", body, NULL, 2000);
    rc = (*pf)->FetchToString(result);
    server.join();
    return rc;
}

int main()
{
    util::http::Fetcher *f;
    std::string result, request;

    unsigned int rc = FetchCanned("HTTP/1.1 200 OK\r\n"
				  "Content-Type: text/xml\r\n"
				  "Content-Length: 5\r\n"
				  "\r\n"
				  "hello", NULL, &f, &result, &request);
    assert(rc == 0);
    assert(f->GetStatus() == 200);
    assert(f->GetHeader("content-type") == "text/xml");
    assert(result == "hello");
    assert(request.find("GET /ctl HTTP/1.1\r\n") == 0);
    assert(request.find("Host: 127.0.0.1:") != std::string::npos);
    assert(request.find("X-Test: 1\r\n") != std::string::npos);
    assert(request.find("Connection: close\r\n") != std::string::npos);
    delete f;

    rc = FetchCanned("HTTP/1.1 200 OK\r\n"
		     "Transfer-Encoding: chunked\r\n"
		     "\r\n"
		     "5\r\nhello\r\n"
		     "7;ext=1\r\n, world\r\n"
		     "0\r\n"
		     "\r\n", "<body/>", &f, &result, &request);
    assert(rc == 0);
    assert(result == "hello, world");
    assert(request.find("POST /ctl HTTP/1.1\r\n") == 0);
    assert(request.find("Content-Length: 7\r\n") != std::string::npos);
    assert(request.find("\r\n\r\n<body/>") != std::string::npos);
    delete f;

    // No length: read to EOF. Error statuses still return the body.
    rc = FetchCanned("HTTP/1.0 500 Internal Server Error\r\n"
		     "\r\n"
		     "<s:Fault/>", NULL, &f, &result, &request);
    assert(rc == 0);
    assert(f->GetStatus() == 500);
    assert(result == "<s:Fault/>");
    delete f;

    // Truncated body
    rc = FetchCanned("HTTP/1.1 200 OK\r\n"
		     "Content-Length: 50\r\n"
		     "\r\n"
		     "short", NULL, &f, &result, &request);
    assert(rc == EIO);
    delete f;

    // Nobody listening
    util::StreamSocket s;
    util::IPEndPoint any = { util::IPAddress::ANY, 0 };
    rc = s.Bind(any);
    assert(rc == 0);
    std::string url = (boost::format("http://127.0.0.1:%u/")
		       % s.GetLocalEndPoint().port).str();
    util::http::Fetcher f2(url, NULL, NULL, NULL, 1000);
    rc = f2.FetchToString(&result);
    assert(rc == ECONNREFUSED);

    util::http::Fetcher f3("ftp://127.0.0.1/");
    rc = f3.FetchToString(&result);
    assert(rc == EINVAL);

    return 0;
}

#endif
