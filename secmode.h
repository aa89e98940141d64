/***************************************************************************
                          secmode.h  -  description
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

#ifndef FXPLIB_SECMODE_H
#define FXPLIB_SECMODE_H

#include <string>

#include "ftpcontrol.h"
#include "tlsstream.h"

/**
  * TLS state of one control connection and of the data connections opened
  * through it.
  *
  * Control channel encryption (AUTH/CCC) and data channel protection (PROT)
  * are tracked separately: CCC leaves the PROT level alone.
  *
  * Servers known to support SSCN: glftpd, surgeftp, Gene6, RaidenFTPD,
  * Serv-U. CPSV: glftpd, surgeftp, vsftpd, ioftpd, RaidenFTPD, but not
  * Serv-U.
  */
class secmode
{
public:

	enum authmode
	{
		tls = 0,
		ssl
	};

	enum result
	{
		ok = 0,
		ioerror,        // control connection failed
		replyerror,     // server answered with an unexpected code
		tlserror,       // handshake or certificate failure
		autherror,      // login failed after the handshake
		refused         // rejected before sending, see LastError()
	};

	secmode(ftpcontrol &ctl, const tlsconfig &cfg);

	/* AUTH TLS|SSL, handshake, login, PBSZ 0, PROT P */
	result NegotiateTLS(authmode mode, const char *user, const char *pass, const char *acct = NULL);

	/* PROT P|E|S|C, preceded by PBSZ 0 if that was never sent */
	result SetProtectionLevel(char level);

	/* CCC; a refusal is returned as replyerror with the server's reply */
	result ClearCommandChannel(ftpreply &reply);

	/* SSCN ON|OFF; ON needs PROT P and is refused without it */
	result ToggleSSCN(bool on, ftpreply &reply);

	/* CPSV, refused while SSCN ON is in effect */
	result Cpsv(ftpreply &reply);

	/* handshake role for a data connection we open ourselves */
	tlscontext::role DataRole(bool passive) const;

	/* put TLS on a data connection if PROT P is in effect
	 * return 1 if successful or nothing to do, 0 otherwise */
	int WrapDataConnection(tlsstream &data, tlscontext::role r);

	bool ControlSecure() const
	{
		return m_ctrlsecure;
	}
	bool DataProtected() const
	{
		return m_prot == 'P';
	}
	bool SSCN() const
	{
		return m_sscn;
	}
	char ProtectionLevel() const
	{
		return m_prot;
	}

	const char* LastError() const
	{
		return m_error.c_str();
	}

	void SetCallbackCertFunction(FxpCallbackCert pointer, void *arg);

private:
	secmode(const secmode &);
	secmode& operator=(const secmode &);

	result Prot(char level, ftpreply &reply);
	result Fail(result r, const char *msg);

	ftpcontrol &m_ctl;
	tlscontext m_ctx;
	bool m_ctrlsecure;
	bool m_pbsz;
	bool m_sscn;
	char m_prot;
	FxpCallbackCert m_certcb;
	void *m_cbarg;
	std::string m_error;
};

#endif
