/***************************************************************************
                          tlsstream.h  -  description
                             -------------------
    begin                : Sat Oct 17 2026
    copyright            : (C) 2026 by the fxplib developers
 ***************************************************************************/

/***************************************************************************
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU Lesser General Public License as        *
 *   published by the Free Software Foundation; either version 2.1 of the  *
 *   License, or (at your option) any later version.                       *
 *                                                                         *
 ***************************************************************************/

#ifndef FXPLIB_TLSSTREAM_H
#define FXPLIB_TLSSTREAM_H

#include <sys/types.h>
#include <string>

#include <openssl/ssl.h>

typedef bool (*FxpCallbackCert)(void *arg, X509 *cert);

/**
  * TLS settings of one session. Peer verification is on unless the caller
  * explicitly turns it off.
  */
struct tlsconfig
{
	bool verify;
	std::string cafile;     // optional, in addition to the system store
	std::string certfile;   // client certificate (PEM)
	std::string keyfile;    // private key of certfile (PEM)

	tlsconfig() : verify(true) {}
};

class tlscontext
{
public:

	enum role
	{
		client = 0,
		server
	};

	explicit tlscontext(const tlsconfig &cfg);
	~tlscontext();

	/* 1 if the context and the optional certificate/key were loaded */
	int Ok() const
	{
		return m_ctx != NULL;
	}
	bool HasCertificate() const
	{
		return m_hascert;
	}
	bool Verify() const
	{
		return m_verify;
	}
	const char* LastError() const
	{
		return m_error.c_str();
	}

	SSL* NewSession(role r, const char *host);

private:
	tlscontext(const tlscontext &);
	tlscontext& operator=(const tlscontext &);

	void SetError(const char *what);

	SSL_CTX *m_ctx;
	bool m_verify;
	bool m_hascert;
	std::string m_error;
};

/**
  * A connected socket, optionally running TLS on top of it. Owns the
  * descriptor and the SSL session.
  */
class tlsstream
{
public:
	explicit tlsstream(int fd = -1);
	~tlsstream();

	int Handle() const
	{
		return m_fd;
	}

	void Attach(int fd);
	void Close();

	/* start TLS on the socket, acting as given role
	 * return 1 if the handshake succeeded, 0 otherwise */
	int Handshake(tlscontext &ctx, tlscontext::role r, const char *host);

	/* send close_notify and continue in plaintext on the same socket */
	int Shutdown();

	/* decrypted bytes already buffered inside the SSL session */
	bool Pending() const
	{
		return (m_ssl != NULL) && (SSL_pending(m_ssl) > 0);
	}

	ssize_t Read(void *buf, size_t max);
	ssize_t Write(const void *buf, size_t len);

	/* peer certificate, caller must X509_free() it */
	X509* PeerCertificate() const;

	const char* LastError() const
	{
		return m_error.c_str();
	}

private:
	tlsstream(const tlsstream &);
	tlsstream& operator=(const tlsstream &);

	int m_fd;
	SSL *m_ssl;
	std::string m_error;
};

#endif
