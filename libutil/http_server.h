#ifndef LIBUTIL_HTTP_SERVER_H
#define LIBUTIL_HTTP_SERVER_H 1

#include <map>
#include <list>
#include <memory>
#include <string>
#include <string.h>
#include <strings.h>
#include <stdint.h>
#include <sys/stat.h>
#include <boost/noncopyable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include "ip.h"
#include "stream.h"

namespace util {

class StreamSocket;

namespace http {

/** Caseless string compare, for HTTP headers.
 *
 * Assumed ASCII-only.
 */
struct CaselessCompare
{
    bool operator()(const std::string& s1, const std::string& s2) const
    {
	return strcasecmp(s1.c_str(), s2.c_str()) < 0;
    }
};

/** Passed to the ContentFactory, filled-in by the http::Server.
 */
struct Request: public boost::noncopyable
{
    std::string verb;
    std::string path;    ///< As sent, i.e. still percent-encoded
    std::string version;
    std::string body;    ///< Any Content-Length body, e.g. a SOAP request
    IPEndPoint local_ep; ///< The IP/port on which the client found us
    typedef std::map<std::string, std::string, CaselessCompare> headers_t;
    headers_t headers;

    void Clear()
    {
	verb.clear();
	path.clear();
	version.clear();
	body.clear();
	headers.clear();
    }

    std::string GetHeader(const char *s) const
    {
	headers_t::const_iterator i = headers.find(s);
	if (i == headers.end())
	    return std::string();
	return i->second;
    }
};

/** Filled-in by the ContentFactory, passed back to the http::Server.
 */
struct Response: public boost::noncopyable
{
    /** The stream to return to the client as the outgoing body.
     *
     * If it's seekable, the server honours Range requests against it.
     */
    std::unique_ptr<util::Stream> body_source;

    /** The HTTP Content-Type to return; if left NULL, "text/html" is used.
     */
    const char *content_type;

    /** The HTTP status line to return, including its CRLF; if left
     * NULL, a 200 (or 206/416 for ranges) is used if body_source is
     * non-NULL, a 404 otherwise.
     */
    const char *status_line;

    /** Any additional HTTP headers to return.
     */
    std::map<std::string, std::string> headers;

    /** Body length (Content-Length) to return.
     *
     * If zero, body_source->GetLength() is used (which is usually what
     * you want).
     */
    uint64_t length;

    void Clear();

    Response()
	: content_type(NULL), status_line(NULL), length(0) {}
};

/** A http::Server plug-in, responsible for all the content under a
 * certain root.
 */
class ContentFactory
{
public:
    virtual ~ContentFactory() {}

    /** Return true if you recognise path, false if you don't.
     *
     * Called on connection threads, possibly several at once.
     */
    virtual bool StreamForPath(const Request*, Response*) = 0;
};

/** A ContentFactory which exposes a directory on the server's filesystem.
 *
 * Paths containing ".." components are refused (404); directories get
 * an HTML listing; files which exist but won't open give a 500.
 */
class FileContentFactory: public ContentFactory
{
    std::string m_file_root;
    std::string m_page_root;

    void ListDirectory(const std::string& dir, const std::string& urlpath,
		       Response *rs);

protected:
    /** Called for each regular file served, after the body, the
     * Content-Type and Last-Modified are set; subclasses add more.
     */
    virtual void OnFile(const std::string& /*filename*/,
			const struct stat& /*st*/, Response* /*rs*/) {}

public:
    FileContentFactory(const std::string& file_root,
		       const std::string& page_root);
    ~FileContentFactory();

    // Being a ContentFactory
    bool StreamForPath(const Request*, Response*) override;
};

/** Socket tuning for the listening socket, applied once at bind time;
 * accepted sockets inherit it.
 */
struct SocketOptions
{
    bool no_delay;               ///< TCP_NODELAY
    unsigned int send_buffer;    ///< SO_SNDBUF, 0 for system default
    unsigned int recv_buffer;    ///< SO_RCVBUF, 0 for system default
    bool keep_alive;             ///< SO_KEEPALIVE
    unsigned int keep_idle_sec;  ///< TCP_KEEPIDLE, where available

    SocketOptions()
	: no_delay(true),
	  send_buffer(256*1024),
	  recv_buffer(256*1024),
	  keep_alive(true),
	  keep_idle_sec(60)
    {}
};

/** An HTTP/1.1 web server.
 *
 * One acceptor thread, plus one thread per connection. Connections are
 * kept alive until the client asks otherwise.
 */
class Server: private boost::noncopyable
{
    typedef std::list<ContentFactory*> list_t;
    list_t m_content;
    SocketOptions m_options;
    std::unique_ptr<StreamSocket> m_listener;
    unsigned short m_port;
    std::string m_server_header;

    class Connection;
    friend class Connection;

    boost::mutex m_mutex;
    std::list<Connection*> m_connections;
    bool m_shutting_down;
    boost::thread m_acceptor;

    void AcceptorLoop();
    void ReapConnections();

public:
    Server();
    ~Server();

    /** Binds all interfaces; pass port==0 to get a random unassigned port.
     */
    unsigned Init(unsigned short port = 0,
		  const SocketOptions& options = SocketOptions());

    unsigned short GetPort() const { return m_port; }

    const std::string& GetServerHeader() const { return m_server_header; }

    /** Mounts a virtual filesystem on the given "mount point".
     *
     * Note that cf->StreamForPath should also check against page_root, as
     * it may be handed requests for other pages. This also lets you mount
     * the same ContentFactory at several mount-points.
     */
    void AddContentFactory(const std::string& page_root, ContentFactory *cf);

    void StreamForPath(const Request*, Response*);

    /** Stops accepting, shuts down live connections, waits for all
     * threads, and releases the port. Idempotent.
     */
    void Shutdown();
};

} // namespace http

} // namespace util

#endif
