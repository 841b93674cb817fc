#include "config.h"
#include "socket.h"
#include <unistd.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <sys/time.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <signal.h>
#include <boost/scoped_array.hpp>
#include "errors.h"
#include "trace.h"

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

LOG_DECL(SOCKET);

namespace util {

namespace {

enum { NO_SOCKET = (int)-1 };

unsigned int SocketError()
{
    unsigned int e = (unsigned int)errno;
    if (e == EAGAIN)
	return EWOULDBLOCK;
    return e;
}

void SetUpSockaddr(const IPEndPoint& ep, struct sockaddr_in *sin)
{
    memset(sin, 0, sizeof(*sin));
    sin->sin_family = AF_INET;
    sin->sin_port = (unsigned short)htons(ep.port);
    sin->sin_addr.s_addr = ep.addr.addr;
}

unsigned int PollFor(int fd, short events, unsigned int ms)
{
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;

    int rc;
    do {
	rc = ::poll(&pfd, 1, (int)ms);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0)
	return SocketError();
    if (rc == 0)
	return EWOULDBLOCK;
    return 0;
}

} // anon namespace

unsigned ParsePort(const char *s, unsigned short *port)
{
    if (!s || *s < '0' || *s > '9')
	return EINVAL;
    errno = 0;
    char *endptr = NULL;
    unsigned long ul = strtoul(s, &endptr, 10);
    if (*endptr)
	return EINVAL;
    if (errno == ERANGE || ul > 65535)
	return ERANGE;
    *port = (unsigned short)ul;
    return 0;
}

void IgnoreSigPipe()
{
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_IGN;
    sigemptyset(&sa.sa_mask);
    if (sigaction(SIGPIPE, &sa, NULL) < 0)
	TRACE << "Can't ignore SIGPIPE: " << errno << "\n";
}

Socket::Socket()
    : m_fd(NO_SOCKET),
      m_timeout_ms(0)
{
}

Socket::Socket(int fd)
    : m_fd(fd),
      m_timeout_ms(0)
{
}

Socket::~Socket()
{
    if (IsOpen())
	Close();
}

unsigned Socket::Bind(const IPEndPoint& ep)
{
    int i = 1;
    ::setsockopt(m_fd, SOL_SOCKET, SO_REUSEADDR, &i, sizeof(i));

    union {
	sockaddr_in sin;
	sockaddr sa;
    } u;

    SetUpSockaddr(ep, &u.sin);

    int rc = ::bind(m_fd, &u.sa, sizeof(u.sin));
    if (rc < 0)
	return SocketError();
    return 0;
}

unsigned Socket::Connect(const IPEndPoint& ep)
{
    union {
	sockaddr_in sin;
	sockaddr sa;
    } u;

    SetUpSockaddr(ep, &u.sin);

    LOG(SOCKET) << "Connecting to " << ep.ToString() << "\n";

    if (!m_timeout_ms)
    {
	int rc = ::connect(m_fd, &u.sa, sizeof(u.sin));
	if (rc < 0)
	    return SocketError();
	return 0;
    }

    // Non-blocking connect, so that an unreachable host can't hold us
    // up for the kernel's (minutes-long) SYN timeout
    int flags = ::fcntl(m_fd, F_GETFL, 0);
    ::fcntl(m_fd, F_SETFL, flags | O_NONBLOCK);

    unsigned int result = 0;
    int rc = ::connect(m_fd, &u.sa, sizeof(u.sin));
    if (rc < 0)
    {
	if (errno != EINPROGRESS)
	    result = SocketError();
	else
	{
	    result = PollFor(m_fd, POLLOUT, m_timeout_ms);
	    if (result == EWOULDBLOCK)
		result = ETIMEDOUT;
	    else if (result == 0)
	    {
		int err = 0;
		socklen_t len = sizeof(err);
		::getsockopt(m_fd, SOL_SOCKET, SO_ERROR, &err, &len);
		result = (unsigned int)err;
	    }
	}
    }

    ::fcntl(m_fd, F_SETFL, flags);

    if (result)
	LOG(SOCKET) << "Connect to " << ep.ToString() << " failed: "
		    << result << "\n";
    return result;
}

IPEndPoint Socket::GetLocalEndPoint()
{
    union {
	sockaddr_in sin;
	sockaddr sa;
    } u;
    socklen_t sinlen = sizeof(u);

    int rc = ::getsockname(m_fd, &u.sa, &sinlen);

    IPEndPoint ep;
    if (rc < 0)
    {
	ep.addr.addr = 0;
	ep.port = 0;
    }
    else
    {
	ep.addr.addr = u.sin.sin_addr.s_addr;
	ep.port = ntohs(u.sin.sin_port);
    }
    return ep;
}

IPEndPoint Socket::GetRemoteEndPoint()
{
    union {
	sockaddr_in sin;
	sockaddr sa;
    } u;
    socklen_t sinlen = sizeof(u);

    int rc = ::getpeername(m_fd, &u.sa, &sinlen);

    IPEndPoint ep;
    if (rc < 0)
    {
	ep.addr.addr = 0;
	ep.port = 0;
    }
    else
    {
	ep.addr.addr = u.sin.sin_addr.s_addr;
	ep.port = ntohs(u.sin.sin_port);
    }
    return ep;
}

bool Socket::IsOpen() const
{
    return (m_fd != NO_SOCKET);
}

unsigned Socket::Close()
{
    if (!IsOpen())
	return 0;

    LOG(SOCKET) << "Closing " << this << " fd " << m_fd << "\n";
    int rc = ::close(m_fd);
    m_fd = NO_SOCKET;
    return (rc<0) ? SocketError() : 0;
}

void Socket::Shutdown()
{
    if (IsOpen())
	::shutdown(m_fd, SHUT_RDWR);
}

unsigned Socket::SetBufferSizes(unsigned int send_bytes,
				unsigned int recv_bytes)
{
    unsigned int result = 0;
    if (send_bytes)
    {
	int i = (int)send_bytes;
	if (::setsockopt(m_fd, SOL_SOCKET, SO_SNDBUF, &i, sizeof(i)) < 0)
	    result = SocketError();
    }
    if (recv_bytes)
    {
	int i = (int)recv_bytes;
	if (::setsockopt(m_fd, SOL_SOCKET, SO_RCVBUF, &i, sizeof(i)) < 0)
	    result = SocketError();
    }
    return result;
}

void Socket::SetTimeoutMS(unsigned int ms)
{
    m_timeout_ms = ms;

    struct timeval tv;
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    ::setsockopt(m_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(m_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

unsigned Socket::WaitForRead(unsigned int ms)
{
    return PollFor(m_fd, POLLIN, ms);
}

unsigned Socket::WaitForWrite(unsigned int ms)
{
    return PollFor(m_fd, POLLOUT, ms);
}

unsigned Socket::Read(void *buffer, size_t len, size_t *pread)
{
    if (len == 0)
    {
	*pread = 0;
	return 0;
    }

    if (m_timeout_ms)
    {
	unsigned int rc = WaitForRead(m_timeout_ms);
	if (rc == EWOULDBLOCK)
	    return ETIMEDOUT;
	if (rc)
	    return rc;
    }

    ssize_t rc;
    do {
	rc = ::recv(m_fd, (char*)buffer, len, MSG_NOSIGNAL);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0)
	return SocketError();
    *pread = (size_t)rc;
    return 0;
}

unsigned Socket::Write(const void *buffer, size_t len, size_t *pwrote)
{
    if (m_timeout_ms)
    {
	unsigned int rc = WaitForWrite(m_timeout_ms);
	if (rc == EWOULDBLOCK)
	    return ETIMEDOUT;
	if (rc)
	    return rc;
    }

    ssize_t rc;
    do {
	rc = ::send(m_fd, (const char*)buffer, len, MSG_NOSIGNAL);
    } while (rc < 0 && errno == EINTR);

    if (rc < 0)
	return SocketError();
    *pwrote = (size_t)rc;
    return 0;
}


        /* IPAddress */


const IPAddress IPAddress::ANY = { 0 };
const IPAddress IPAddress::LOOPBACK = { htonl(INADDR_LOOPBACK) };

std::string IPAddress::ToString() const
{
    char buffer[INET_ADDRSTRLEN];
    struct in_addr ina;
    ina.s_addr = addr;
    if (!::inet_ntop(AF_INET, &ina, buffer, sizeof(buffer)))
	return "0.0.0.0";
    return buffer;
}

IPAddress IPAddress::FromDottedQuad(unsigned char a, unsigned char b,
				    unsigned char c, unsigned char d)
{
    uint32_t hostorder = ((unsigned)a<<24) + ((unsigned)b<<16)
	+ ((unsigned)c<<8) + d;
    IPAddress ip;
    ip.addr = htonl(hostorder);
    return ip;
}

IPAddress IPAddress::FromNetworkOrder(uint32_t netorder)
{
    IPAddress ip;
    ip.addr = netorder;
    return ip;
}

IPAddress IPAddress::Resolve(const char *host)
{
    struct in_addr ina;
    if (::inet_pton(AF_INET, host, &ina) == 1)
	return FromNetworkOrder(ina.s_addr);

    struct addrinfo hints;
    struct addrinfo *list = NULL;
    memset(&hints, '\0', sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;
    int rc = ::getaddrinfo(host, NULL, &hints, &list);
    if (rc != 0 || !list)
    {
	TRACE << "Can't resolve '" << host << "': " << gai_strerror(rc)
	      << "\n";
	return IPAddress::ANY;
    }

    const sockaddr_in *sin = (const sockaddr_in*)list->ai_addr;
    uint32_t netorder = sin->sin_addr.s_addr;

    ::freeaddrinfo(list);

    return FromNetworkOrder(netorder);
}


        /* IPEndPoint */


std::string IPEndPoint::ToString() const
{
    char buffer[16];
    snprintf(buffer, sizeof(buffer), ":%u", (unsigned)port);
    return addr.ToString() + buffer;
}


        /* DatagramSocket */


DatagramSocket::DatagramSocket()
    : Socket()
{
    m_fd = ::socket(PF_INET, SOCK_DGRAM|SOCK_CLOEXEC, 0);
    if (m_fd < 0)
	TRACE << "Can't create UDP socket: " << errno << "\n";
}

DatagramSocket::~DatagramSocket()
{
}

unsigned DatagramSocket::SetOutgoingMulticastInterface(IPAddress addr)
{
    struct in_addr ina;
    ina.s_addr = addr.addr;
    int rc = ::setsockopt(m_fd, IPPROTO_IP, IP_MULTICAST_IF,
			  &ina, sizeof(ina));
    if (rc < 0)
    {
	LOG(SOCKET) << "IP_MULTICAST_IF failed " << errno << "\n";
	return (unsigned)errno;
    }

    return 0;
}

unsigned DatagramSocket::SetMulticastTTL(unsigned int ttl)
{
    unsigned char c = (unsigned char)ttl;
    int rc = ::setsockopt(m_fd, IPPROTO_IP, IP_MULTICAST_TTL, &c, sizeof(c));
    if (rc < 0)
    {
	LOG(SOCKET) << "IP_MULTICAST_TTL failed " << errno << "\n";
	return (unsigned)errno;
    }
    return 0;
}

/** Receive a single datagram, however big.
 */
unsigned DatagramSocket::Read(std::string *s, IPEndPoint *wasfrom)
{
    // Note that ioctl(FIONREAD) returns the total size of ALL waiting
    // packets (UNP vol1 sec13.7) which is not what we want.
    char nobuf;
    ssize_t rc = ::recv(m_fd, &nobuf, 1, MSG_PEEK | MSG_TRUNC);
    if (rc < 0)
	return SocketError();
    if (rc == 0)
    {
	// Zero-length datagram; consume it
	rc = ::recv(m_fd, &nobuf, 1, 0);
	s->clear();
	return 0;
    }

    size_t buflen = (size_t)rc;
    boost::scoped_array<char> buffer(new char[buflen]);

    union {
	sockaddr sa;
	sockaddr_in sin;
    } u;
    socklen_t sinlen = sizeof(u);

    rc = ::recvfrom(m_fd, buffer.get(), buflen, 0, &u.sa, &sinlen);
    if (rc < 0)
	return SocketError();

    s->assign(buffer.get(), buffer.get() + rc);
    if (wasfrom)
    {
	wasfrom->addr.addr = u.sin.sin_addr.s_addr;
	wasfrom->port = ntohs(u.sin.sin_port);
    }
    return 0;
}

unsigned DatagramSocket::Write(const void *buffer, size_t buflen,
			       const IPEndPoint& to)
{
    union {
	sockaddr_in sin;
	sockaddr sa;
    } u;

    SetUpSockaddr(to, &u.sin);

    ssize_t rc = ::sendto(m_fd, (const char*)buffer, buflen, 0, &u.sa,
			  sizeof(u.sin));
    if (rc < 0)
	return SocketError();

    return 0;
}

unsigned DatagramSocket::Write(const std::string& s, const IPEndPoint& to)
{
    return Write(s.data(), s.length(), to);
}


        /* StreamSocket */


StreamSocket::StreamSocket()
    : Socket()
{
    m_fd = ::socket(PF_INET, SOCK_STREAM|SOCK_CLOEXEC, 0);
    if (m_fd < 0)
	TRACE << "Can't create TCP socket: " << errno << "\n";
}

StreamSocket::StreamSocket(int fd)
    : Socket(fd)
{
}

StreamSocket::~StreamSocket()
{
}

unsigned StreamSocket::Listen(unsigned int queue)
{
    int rc = ::listen(m_fd, (int)queue);
    if (rc<0)
	return SocketError();
    return 0;
}

unsigned StreamSocket::Accept(std::unique_ptr<StreamSocket> *accepted)
{
    struct sockaddr sa;
    socklen_t sl = sizeof(sa);
    int rc = ::accept4(m_fd, &sa, &sl, SOCK_CLOEXEC);
    if (rc < 0)
	return SocketError();

    LOG(SOCKET) << "Accepted fd " << rc << "\n";

    accepted->reset(new StreamSocket(rc));
    return 0;
}

unsigned StreamSocket::SetNoDelay(bool nodelay)
{
    int i = nodelay;
    int rc = ::setsockopt(m_fd, IPPROTO_TCP, TCP_NODELAY, &i, sizeof(i));
    if (rc<0)
	return SocketError();
    return 0;
}

unsigned StreamSocket::SetKeepAlive(bool keepalive, unsigned int idle_sec)
{
    int i = keepalive;
    int rc = ::setsockopt(m_fd, SOL_SOCKET, SO_KEEPALIVE, &i, sizeof(i));
    if (rc<0)
	return SocketError();
#if HAVE_TCP_KEEPIDLE
    if (keepalive && idle_sec)
    {
	int idle = (int)idle_sec;
	rc = ::setsockopt(m_fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
	if (rc<0)
	    return SocketError();
    }
#else
    (void)idle_sec;
#endif
    return 0;
}

} // namespace util

#ifdef TEST

#include <assert.h>

static const struct {
    const char *text;
    unsigned int rc;
    unsigned short port;
} port_tests[] = {
    { "0",       0,      0 },
    { "8080",    0,      8080 },
    { "65535",   0,      65535 },
    { "65536",   ERANGE, 0 },
    { "70000",   ERANGE, 0 },
    { "99999999999999999999999", ERANGE, 0 },
    { "",        EINVAL, 0 },
    { "80x",     EINVAL, 0 },
    { "-1",      EINVAL, 0 },
    { " 80",     EINVAL, 0 },
    { "http",    EINVAL, 0 },
};

int main()
{
    for (unsigned int i=0; i<sizeof(port_tests)/sizeof(port_tests[0]); ++i)
    {
	unsigned short port = 1234;
	unsigned int rc = util::ParsePort(port_tests[i].text, &port);
	assert(rc == port_tests[i].rc);
	assert(port == (rc ? 1234 : port_tests[i].port));
    }

    assert(util::IPAddress::FromDottedQuad(192,168,1,50).ToString()
	   == "192.168.1.50");
    assert(util::IPAddress::Resolve("10.0.0.7")
	   == util::IPAddress::FromDottedQuad(10,0,0,7));
    assert(util::IPAddress::LOOPBACK.ToString() == "127.0.0.1");

    util::IPEndPoint ep = { util::IPAddress::FromDottedQuad(239,255,255,250),
			    1900 };
    assert(ep.ToString() == "239.255.255.250:1900");

    // Loopback TCP conversation
    util::StreamSocket listener;
    util::IPEndPoint any = { util::IPAddress::ANY, 0 };
    unsigned int rc = listener.Bind(any);
    assert(rc == 0);
    rc = listener.Listen();
    assert(rc == 0);
    unsigned short port = listener.GetLocalEndPoint().port;
    assert(port != 0);

    util::StreamSocket client;
    client.SetTimeoutMS(2000);
    util::IPEndPoint there = { util::IPAddress::LOOPBACK, port };
    rc = client.Connect(there);
    assert(rc == 0);
    rc = client.SetNoDelay(true);
    assert(rc == 0);

    std::unique_ptr<util::StreamSocket> server;
    rc = listener.Accept(&server);
    assert(rc == 0);
    rc = server->SetKeepAlive(true, 60);
    assert(rc == 0);
    rc = server->SetBufferSizes(256*1024, 256*1024);
    assert(rc == 0);

    rc = client.WriteString("ping");
    assert(rc == 0);
    char buffer[4];
    rc = server->ReadAll(buffer, 4);
    assert(rc == 0);
    assert(!memcmp(buffer, "ping", 4));

    // Nothing more to read: timeout, not a hang
    size_t nread;
    rc = client.Read(buffer, sizeof(buffer), &nread);
    assert(rc == ETIMEDOUT);

    // Peer shutdown gives EOF
    server->Shutdown();
    rc = client.Read(buffer, sizeof(buffer), &nread);
    assert(rc == 0);
    assert(nread == 0);

    // Writing to a closed peer is an error, not a signal
    util::IgnoreSigPipe();
    struct sigaction old_sa;
    sigaction(SIGPIPE, NULL, &old_sa);
    assert(old_sa.sa_handler == SIG_IGN);
    server.reset();
    client.Close();
    util::StreamSocket client2;
    client2.SetTimeoutMS(2000);
    rc = client2.Connect(there);
    assert(rc == 0);
    rc = listener.Accept(&server);
    assert(rc == 0);
    client2.Close();
    int fd = server->GetHandle();
    std::string lump(64*1024, 'x');
    ssize_t wrc = 0;
    for (unsigned int i=0; i<100 && wrc >= 0; ++i)
	wrc = ::write(fd, lump.data(), lump.size());
    assert(wrc < 0);
    assert(errno == EPIPE || errno == ECONNRESET);

    // Loopback UDP
    util::DatagramSocket rx, tx;
    rc = rx.Bind(any);
    assert(rc == 0);
    util::IPEndPoint rxep = { util::IPAddress::LOOPBACK,
			      rx.GetLocalEndPoint().port };
    rc = tx.Write(std::string("HTTP/1.1 200 OK\r\n\r\n"), rxep);
    assert(rc == 0);
    rc = rx.WaitForRead(2000);
    assert(rc == 0);
    std::string packet;
    util::IPEndPoint wasfrom;
    rc = rx.Read(&packet, &wasfrom);
    assert(rc == 0);
    assert(packet == "HTTP/1.1 200 OK\r\n\r\n");
    assert(wasfrom.addr == util::IPAddress::LOOPBACK);

    return 0;
}

#endif
