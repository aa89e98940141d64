#include "tlsstream.h"

#include <sys/socket.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>

#include <openssl/err.h>

#define net_read read
#define net_write write
#define net_close close

tlscontext::tlscontext(const tlsconfig &cfg) : m_ctx(NULL), m_verify(cfg.verify), m_hascert(false)
{
	OPENSSL_init_ssl(0, NULL);

	m_ctx = SSL_CTX_new(TLS_method());
	if (m_ctx == NULL)
	{
		SetError("SSL_CTX_new()");
		return;
	}

	if (m_verify)
	{
		SSL_CTX_set_verify(m_ctx, SSL_VERIFY_PEER, NULL);
		if (SSL_CTX_set_default_verify_paths(m_ctx) != 1)
		{
			SetError("SSL_CTX_set_default_verify_paths()");
		}
		if (!cfg.cafile.empty() && (SSL_CTX_load_verify_locations(m_ctx, cfg.cafile.c_str(), NULL) != 1))
		{
			SetError(cfg.cafile.c_str());
			SSL_CTX_free(m_ctx);
			m_ctx = NULL;
			return;
		}
	}
	else
	{
		SSL_CTX_set_verify(m_ctx, SSL_VERIFY_NONE, NULL);
	}

	if (!cfg.certfile.empty())
	{
		const char *key = cfg.keyfile.empty() ? cfg.certfile.c_str() : cfg.keyfile.c_str();

		if ((SSL_CTX_use_certificate_chain_file(m_ctx, cfg.certfile.c_str()) != 1)
		        || (SSL_CTX_use_PrivateKey_file(m_ctx, key, SSL_FILETYPE_PEM) != 1)
		        || (SSL_CTX_check_private_key(m_ctx) != 1))
		{
			SetError(cfg.certfile.c_str());
			SSL_CTX_free(m_ctx);
			m_ctx = NULL;
			return;
		}
		m_hascert = true;
	}
}

tlscontext::~tlscontext()
{
	if (m_ctx != NULL)
	{
		SSL_CTX_free(m_ctx);
	}
}

void tlscontext::SetError(const char *what)
{
	char buf[256];
	unsigned long e = ERR_get_error();

	m_error = what;
	if (e != 0)
	{
		ERR_error_string_n(e, buf, sizeof(buf));
		m_error += ": ";
		m_error += buf;
	}
	ERR_clear_error();
}

/*
 * NewSession - create a SSL object for one connection
 *
 * The server role never asks the peer for a certificate. In client role
 * the peer name is checked against host when verification is on.
 */
SSL* tlscontext::NewSession(role r, const char *host)
{
	SSL *ssl;

	if (m_ctx == NULL)
	{
		return NULL;
	}
	ssl = SSL_new(m_ctx);
	if (ssl == NULL)
	{
		SetError("SSL_new()");
		return NULL;
	}
	if (r == server)
	{
		SSL_set_verify(ssl, SSL_VERIFY_NONE, NULL);
	}
	else if (m_verify && (host != NULL) && *host)
	{
		SSL_set_tlsext_host_name(ssl, host);
		if (SSL_set1_host(ssl, host) != 1)
		{
			SetError("SSL_set1_host()");
			SSL_free(ssl);
			return NULL;
		}
	}
	return ssl;
}

tlsstream::tlsstream(int fd) : m_fd(fd), m_ssl(NULL)
{
}

tlsstream::~tlsstream()
{
	Close();
}

void tlsstream::Attach(int fd)
{
	Close();
	m_fd = fd;
}

void tlsstream::Close()
{
	if (m_ssl != NULL)
	{
		SSL_shutdown(m_ssl);
		SSL_free(m_ssl);
		m_ssl = NULL;
	}
	if (m_fd != -1)
	{
		shutdown(m_fd, SHUT_RDWR);
		net_close(m_fd);
		m_fd = -1;
	}
}

/*
 * Handshake - put TLS on top of the connected socket
 *
 * return 1 if successful, 0 otherwise
 */
int tlsstream::Handshake(tlscontext &ctx, tlscontext::role r, const char *host)
{
	int ret;

	if (m_fd == -1)
	{
		m_error = "not connected";
		return 0;
	}
	if (m_ssl != NULL)
	{
		m_error = "TLS already active";
		return 0;
	}
	if ((r == tlscontext::server) && !ctx.HasCertificate())
	{
		m_error = "server side handshake needs a certificate and key";
		return 0;
	}

	m_ssl = ctx.NewSession(r, host);
	if (m_ssl == NULL)
	{
		m_error = ctx.LastError();
		return 0;
	}
	SSL_set_fd(m_ssl, m_fd);

	if (r == tlscontext::client)
	{
		ret = SSL_connect(m_ssl);
	}
	else
	{
		ret = SSL_accept(m_ssl);
	}

	if (ret != 1)
	{
		char buf[256];
		unsigned long e = ERR_get_error();

		m_error = (r == tlscontext::client) ? "SSL_connect()" : "SSL_accept()";
		if (e != 0)
		{
			ERR_error_string_n(e, buf, sizeof(buf));
			m_error += ": ";
			m_error += buf;
		}
		if (SSL_get_verify_result(m_ssl) != X509_V_OK)
		{
			m_error += ": ";
			m_error += X509_verify_cert_error_string(SSL_get_verify_result(m_ssl));
		}
		ERR_clear_error();
		SSL_free(m_ssl);
		m_ssl = NULL;
		return 0;
	}
	return 1;
}

/*
 * Shutdown - leave TLS, the socket stays open
 *
 * return 1 if successful, 0 otherwise
 */
int tlsstream::Shutdown()
{
	if (m_ssl == NULL)
	{
		return 1;
	}
	int ret = SSL_shutdown(m_ssl);
	if (ret == 0)
	{
		// wait for the peer's close_notify, after it the socket is clear
		ret = SSL_shutdown(m_ssl);
	}
	if (ret < 0)
	{
		m_error = "SSL_shutdown()";
		ERR_clear_error();
		SSL_free(m_ssl);
		m_ssl = NULL;
		return 0;
	}
	SSL_free(m_ssl);
	m_ssl = NULL;
	return 1;
}

ssize_t tlsstream::Read(void *buf, size_t max)
{
	if (m_ssl != NULL)
	{
		int len = SSL_read(m_ssl, buf, static_cast<int>(max));
		if (len < 0)
		{
			m_error = "SSL_read()";
			ERR_clear_error();
			return -1;
		}
		return len;
	}

	ssize_t len;
	do
	{
		len = net_read(m_fd, buf, max);
	}
	while ((len == -1) && (errno == EINTR));
	if (len == -1)
	{
		m_error = strerror(errno);
	}
	return len;
}

ssize_t tlsstream::Write(const void *buf, size_t len)
{
	const char *p = static_cast<const char *>(buf);
	size_t left = len;

	while (left > 0)
	{
		ssize_t w;

		if (m_ssl != NULL)
		{
			w = SSL_write(m_ssl, p, static_cast<int>(left));
			if (w <= 0)
			{
				m_error = "SSL_write()";
				ERR_clear_error();
				return -1;
			}
		}
		else
		{
			w = net_write(m_fd, p, left);
			if (w == -1)
			{
				if (errno == EINTR)
				{
					continue;
				}
				m_error = strerror(errno);
				return -1;
			}
		}
		p += w;
		left -= static_cast<size_t>(w);
	}
	return static_cast<ssize_t>(len);
}

X509* tlsstream::PeerCertificate() const
{
	if (m_ssl == NULL)
	{
		return NULL;
	}
	return SSL_get_peer_certificate(m_ssl);
}
