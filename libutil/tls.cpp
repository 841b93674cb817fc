#include "tls.h"
#include "socket.h"
#include "trace.h"
#include <errno.h>
#include <limits.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

LOG_DECL(TLS);

namespace util {

TlsStream::TlsStream(Socket *socket)
    : m_socket(socket),
      m_ctx(NULL),
      m_ssl(NULL),
      m_connected(false)
{
}

TlsStream::~TlsStream()
{
    if (m_ssl)
    {
	if (m_connected)
	    SSL_shutdown(m_ssl);
	SSL_free(m_ssl);
    }
    if (m_ctx)
	SSL_CTX_free(m_ctx);
}

unsigned int TlsStream::Error(int ret, const char *what)
{
    int err = SSL_get_error(m_ssl, ret);
    unsigned long e = ERR_get_error();
    char buffer[256];
    buffer[0] = '\0';
    if (e)
	ERR_error_string_n(e, buffer, sizeof(buffer));
    ERR_clear_error();

    switch (err)
    {
    case SSL_ERROR_ZERO_RETURN:
	return 0;
    case SSL_ERROR_SYSCALL:
	if (errno == EAGAIN || errno == EWOULDBLOCK)
	    return ETIMEDOUT;
	if (errno)
	    return (unsigned int)errno;
	return ECONNRESET;
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
	return ETIMEDOUT;
    default:
	TRACE << what << " failed: " << err << " " << buffer << "\n";
	return EPROTO;
    }
}

unsigned int TlsStream::Handshake(const std::string& hostname)
{
    // SSL_write goes straight to write(2), with no MSG_NOSIGNAL
    IgnoreSigPipe();

    m_ctx = SSL_CTX_new(TLS_client_method());
    if (!m_ctx)
	return ENOMEM;

    SSL_CTX_set_min_proto_version(m_ctx, TLS1_2_VERSION);
    SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER, NULL);
    if (SSL_CTX_set_default_verify_paths(m_ctx) != 1)
	TRACE << "No default trust store\n";

    m_ssl = SSL_new(m_ctx);
    if (!m_ssl)
	return ENOMEM;

    SSL_set_tlsext_host_name(m_ssl, hostname.c_str());
    X509_VERIFY_PARAM *param = SSL_get0_param(m_ssl);
    X509_VERIFY_PARAM_set_hostflags(param,
				    X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
    X509_VERIFY_PARAM_set1_host(param, hostname.c_str(), 0);

    SSL_set_fd(m_ssl, m_socket->GetHandle());

    int ret = SSL_connect(m_ssl);
    if (ret != 1)
    {
	unsigned int rc = Error(ret, "SSL_connect");
	long verify = SSL_get_verify_result(m_ssl);
	if (verify != X509_V_OK)
	    TRACE << "Certificate for " << hostname << " not trusted: "
		  << X509_verify_cert_error_string(verify) << "\n";
	return rc ? rc : EPROTO;
    }

    m_connected = true;
    LOG(TLS) << "TLS to " << hostname << " using " << SSL_get_version(m_ssl)
	     << " " << SSL_get_cipher(m_ssl) << "\n";
    return 0;
}

unsigned TlsStream::Read(void *buffer, size_t len, size_t *pread)
{
    if (!m_connected)
	return ENOTCONN;
    if (len > INT_MAX)
	len = INT_MAX;

    int ret = SSL_read(m_ssl, buffer, (int)len);
    if (ret > 0)
    {
	*pread = (size_t)ret;
	return 0;
    }

    *pread = 0;
    return Error(ret, "SSL_read");
}

unsigned TlsStream::Write(const void *buffer, size_t len, size_t *pwrote)
{
    if (!m_connected)
	return ENOTCONN;
    if (len > INT_MAX)
	len = INT_MAX;

    int ret = SSL_write(m_ssl, buffer, (int)len);
    if (ret > 0)
    {
	*pwrote = (size_t)ret;
	return 0;
    }

    unsigned int rc = Error(ret, "SSL_write");
    return rc ? rc : EPIPE;
}

} // namespace util

#ifdef TEST

#include "ip.h"
#include <assert.h>

int main()
{
    // Handshaking with something that isn't a TLS server must fail
    // cleanly, not hang or crash
    util::StreamSocket listener;
    util::IPEndPoint any = { util::IPAddress::ANY, 0 };
    unsigned int rc = listener.Bind(any);
    assert(rc == 0);
    rc = listener.Listen();
    assert(rc == 0);

    util::StreamSocket client;
    client.SetTimeoutMS(1000);
    util::IPEndPoint ep = { util::IPAddress::LOOPBACK,
			    listener.GetLocalEndPoint().port };
    rc = client.Connect(ep);
    assert(rc == 0);

    std::unique_ptr<util::StreamSocket> server;
    rc = listener.Accept(&server);
    assert(rc == 0);
    rc = server->WriteString("HTTP/1.1 400 Bad Request\r\n\r\n");
    assert(rc == 0);

    util::TlsStream tls(&client);
    rc = tls.Handshake("localhost");
    assert(rc != 0);

    // Not connected
    util::TlsStream tls2(&client);
    char buffer[4];
    size_t nread;
    rc = tls2.Read(buffer, sizeof(buffer), &nread);
    assert(rc == ENOTCONN);

    return 0;
}

#endif
