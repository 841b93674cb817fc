#ifndef LIBUTIL_SOCKET_H
#define LIBUTIL_SOCKET_H

#include <stdlib.h>
#include <memory>
#include <string>
#include <boost/noncopyable.hpp>
#include "stream.h"
#include "ip.h"

namespace util {

/** Thin veneer round BSD-style sockets API.
 *
 * Contains only calls useful to both UDP and TCP sockets.
 */
class Socket: public Stream, private boost::noncopyable
{
protected:
    int m_fd;

    /** Timeout for synchronous operations, 0 for none */
    unsigned int m_timeout_ms;

    Socket();
    explicit Socket(int fd);
    ~Socket();

public:
    /** Wait, up to the given length of time, for the socket to become
     * readable.
     *
     * Return code: 0 for readable, EWOULDBLOCK for not-readable, other errors
     * probably serious.
     */
    unsigned WaitForRead(unsigned int ms);

    /** Wait, up to the given length of time, for the socket to become
     * writable.
     *
     * Return code: 0 for writable, EWOULDBLOCK for not-writable, other errors
     * probably serious.
     */
    unsigned WaitForWrite(unsigned int ms);

    /** Binds, with SO_REUSEADDR set first. */
    unsigned Bind(const IPEndPoint&);

    /** Connects, giving up with ETIMEDOUT after the socket timeout (if any).
     */
    unsigned Connect(const IPEndPoint&);

    IPEndPoint GetLocalEndPoint();
    IPEndPoint GetRemoteEndPoint();

    bool IsOpen() const;
    unsigned Close();

    /** Shuts down both directions without closing the descriptor.
     *
     * Any thread blocked in Read() or Write() on this socket returns.
     */
    void Shutdown();

    /** Best-effort SO_SNDBUF/SO_RCVBUF. Zero leaves the default. */
    unsigned SetBufferSizes(unsigned int send_bytes, unsigned int recv_bytes);

    // Being a Stream
    unsigned GetStreamFlags() const override { return READABLE|WRITABLE|POLLABLE; }
    unsigned Read(void *buffer, size_t len, size_t *pread) override;
    unsigned Write(const void *buffer, size_t len, size_t *pwrote) override;
    int GetHandle() override { return m_fd; }

    /** Set the (automatic) timeout on Connect, Read and Write, after
     * which they return ETIMEDOUT. Default is 0, meaning wait forever.
     *
     * Also sets SO_RCVTIMEO/SO_SNDTIMEO, so that code using the
     * descriptor directly (TLS) is bounded too.
     */
    void SetTimeoutMS(unsigned int ms);
};

/** UDP socket
 *
 * Note that a UDP socket isn't quite like other Streams, in that Read() has
 * the UDP recv() semantics.
 */
class DatagramSocket: public Socket
{
public:
    DatagramSocket();
    ~DatagramSocket();

    unsigned SetOutgoingMulticastInterface(IPAddress);
    unsigned SetMulticastTTL(unsigned int ttl);

    using Stream::Read;
    unsigned Read(std::string*, IPEndPoint *wasfrom);

    using Stream::Write;
    unsigned Write(const void *buffer, size_t buflen, const IPEndPoint& to);
    unsigned Write(const std::string&, const IPEndPoint& to);
};

/** TCP socket */
class StreamSocket: public Socket
{
    explicit StreamSocket(int fd);

public:
    StreamSocket();
    ~StreamSocket();

    unsigned Listen(unsigned int queue = 64);
    unsigned Accept(std::unique_ptr<StreamSocket> *accepted);

    /** TCP_NODELAY */
    unsigned SetNoDelay(bool nodelay);

    /** SO_KEEPALIVE, plus TCP_KEEPIDLE where the platform has it. */
    unsigned SetKeepAlive(bool keepalive, unsigned int idle_sec);
};

/** Makes writes to a dead peer fail with EPIPE rather than killing the
 * process. Covers sendfile(2) and OpenSSL, which don't pass
 * MSG_NOSIGNAL. Idempotent.
 */
void IgnoreSigPipe();

} // namespace util

#endif
