#ifndef LIBUTIL_HTTP_CLIENT_H
#define LIBUTIL_HTTP_CLIENT_H 1

#include <string>
#include "ip.h"
#include "http_parser.h"

namespace util {

/** Classes implementing HTTP/1.1
 */
namespace http {

/** Simple, synchronous HTTP fetcher.
 *
 * One request per connection ("Connection: close"); http and https
 * (OpenSSL). Connecting, sending and receiving are each bounded by the
 * timeout.
 */
class Fetcher
{
    std::string m_url;
    std::string m_extra_headers;
    std::string m_body;
    const char *m_verb;
    unsigned int m_timeout_ms;

    unsigned int m_status;
    Headers m_headers;
    IPEndPoint m_local_endpoint;

public:
    /** Passing a NULL verb means POST (if body != NULL) or GET (otherwise).
     *
     * Extra headers, if any, must each end in "\r\n".
     */
    Fetcher(const std::string& url,
	    const char *extra_headers = NULL,
	    const char *body = NULL,
	    const char *verb = NULL,
	    unsigned int timeout_ms = 5000);
    ~Fetcher();

    /** Returns transport errors only (ETIMEDOUT, ECONNREFUSED, EPROTO for
     * TLS failures, EINVAL for bad URLs or responses); check GetStatus()
     * for the HTTP outcome. The body is returned whatever the status.
     */
    unsigned int FetchToString(std::string *presult);

    unsigned int GetStatus() const { return m_status; }

    std::string GetHeader(const std::string& name) const
    {
	return util::http::GetHeader(m_headers, name);
    }

    /** Returns the local IP address which was used to contact the server.
     *
     * This is mainly useful on multi-homed hosts.
     */
    IPEndPoint GetLocalEndPoint() const { return m_local_endpoint; }
};

} // namespace http

} // namespace util

#endif
