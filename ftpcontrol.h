/***************************************************************************
                          ftpcontrol.h  -  description
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

#ifndef FXPLIB_FTPCONTROL_H
#define FXPLIB_FTPCONTROL_H

#include <mutex>

#include "ftpreply.h"
#include "tlsstream.h"

/**
  * The control channel of one logged in FTP server.
  *
  * Only one command may be in flight per channel: callers hold Mutex()
  * around each command/reply exchange. The primitives below never lock.
  */
class ftpcontrol
{
public:
	virtual ~ftpcontrol() {}

	/* write "cmd\r\n" and read the complete reply
	 * return 1 if a reply was read, 0 on I/O failure */
	virtual int SendCmd(const char *cmd, ftpreply &reply) = 0;

	/* read the next reply without sending anything */
	virtual int ReadResp(ftpreply &reply) = 0;

	/* USER/PASS[/ACCT], return 1 if logged in */
	virtual int Login(const char *user, const char *pass, const char *acct) = 0;

	/* run TLS on the control socket as client, return 1 on success */
	virtual int StartTls(tlscontext &ctx) = 0;

	/* drop TLS from the control socket, return 1 on success */
	virtual int StopTls() = 0;

	/* certificate the server showed on the control channel, X509_free() it */
	virtual X509* PeerCertificate() = 0;

	/* replace the host part of a PASV reply if configured to do so */
	virtual int CorrectPasv(hostport &hp) = 0;

	virtual bool Passive() const = 0;
	virtual bool Debug() const = 0;
	virtual const char* Host() const = 0;

	/* SendCmd, return 1 only if the reply starts with expresp */
	int FtpSendCmd(const char *cmd, char expresp, ftpreply &reply)
	{
		if (!SendCmd(cmd, reply))
		{
			return 0;
		}
		return (reply.Code() / 100 == expresp - '0') ? 1 : 0;
	}

	std::mutex& Mutex()
	{
		return m_mutex;
	}

private:
	std::mutex m_mutex;
};

#endif
