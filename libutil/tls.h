#ifndef LIBUTIL_TLS_H
#define LIBUTIL_TLS_H 1

#include <string>
#include <boost/noncopyable.hpp>
#include "stream.h"

typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace util {

class Socket;

/** A TLS client session (OpenSSL) over an already-connected socket.
 *
 * The socket must outlive the TlsStream. Timeouts are whatever the
 * socket's SetTimeoutMS says.
 */
class TlsStream final: public Stream, private boost::noncopyable
{
    Socket *m_socket;
    SSL_CTX *m_ctx;
    SSL *m_ssl;
    bool m_connected;

    unsigned int Error(int ret, const char *what);

public:
    explicit TlsStream(Socket *socket);
    ~TlsStream();

    /** Performs the client handshake, checking the server's certificate
     * against the system trust store and the given host name (which is
     * also sent as SNI).
     *
     * Returns EPROTO if the handshake or verification fails.
     */
    unsigned int Handshake(const std::string& hostname);

    // Being a Stream
    unsigned GetStreamFlags() const override { return READABLE|WRITABLE; }
    unsigned Read(void *buffer, size_t len, size_t *pread) override;
    unsigned Write(const void *buffer, size_t len, size_t *pwrote) override;
};

} // namespace util

#endif
