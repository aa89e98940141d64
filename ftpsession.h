/***************************************************************************
                          ftpsession.h  -  description
                             -------------------
    begin                : Son Jul 27 2003
    copyright            : (C) 2013 by magnus kulke
    email                : mkulke@gmail.com
 ***************************************************************************/

/***************************************************************************
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU Lesser General Public License as        *
 *   published by the Free Software Foundation; either version 2.1 of the  *
 *   License, or (at your option) any later version.                       *
 *                                                                         *
 ***************************************************************************/

/***************************************************************************
 * Note: ftplib, on which ftplibpp was originally based upon used to be    *
 * licensed as GPL 2.0 software, as of Jan. 26th 2013 its author Thomas    *
 * Pfau allowed the distribution of ftplib via LGPL. Thus the license of   *
 * ftplibpp changed aswell.                                                *
 ***************************************************************************/

#ifndef FXPLIB_FTPSESSION_H
#define FXPLIB_FTPSESSION_H

#include <unistd.h>
#include <sys/time.h>
#include <sys/types.h>

#include <string>

#include "ftpcontrol.h"
#include "ftpreply.h"
#include "tlsstream.h"

/* socket buffer size */
#define FXPLIB_BUFSIZ   (20 * 1024)
#define FXPLIB_ACCEPT_TIMEOUT  30

typedef int (*FxpCallbackIdle)(void *arg);
typedef void (*FxpCallbackLog)(const char *str, void* arg, bool in);

class secmode;

/**
  * A BSD socket control connection.
  *
  *@author mkulke
  */
class ftpsession : public ftpcontrol
{
public:

	enum transfermode
	{
		ascii = 'A',
		image = 'I'
	};

	enum connmode
	{
		pasv = 1,
		port
	};

	ftpsession();
	~ftpsession();

	const char* LastResponse();
	int Connect(const char *host, const char *port = "21");
	int Login(const char *user, const char *pass, const char *acct = NULL);
	int Quit();

	int Dir(const char *outputfile, const char *path);
	int Nlst(const char *outputfile, const char *path);
	int Get(const char *outputfile, const char *path, transfermode mode = image);
	int Put(const char *inputfile, const char *path, transfermode mode = image);

	/* data connections are wrapped by sec from now on, NULL for plain */
	void SetSecureMode(secmode *sec)
	{
		m_sec = sec;
	}
	void SetConnmode(connmode mode)
	{
		m_cmode = mode;
	}
	void SetDebug(bool b)
	{
		m_debug = b;
	}
	void SetCorrectPasv(bool b)
	{
		m_correctpasv = b;
	}
	void SetCallbackIdleFunction(FxpCallbackIdle pointer);
	void SetCallbackLogFunction(FxpCallbackLog pointer);
	void SetCallbackArg(void *arg);
	void SetCallbackIdletime(int time);

	int SendCmd(const char *cmd, ftpreply &reply);
	int ReadResp(ftpreply &reply);
	int StartTls(tlscontext &ctx);
	int StopTls();
	X509* PeerCertificate();
	int CorrectPasv(hostport &hp);

	bool Passive() const
	{
		return m_cmode == pasv;
	}
	bool Debug() const
	{
		return m_debug;
	}
	const char* Host() const
	{
		return m_host.c_str();
	}

private:

	enum accesstype
	{
		dir = 1,
		dirverbose,
		fileread,
		filewrite
	};

	ftpsession(const ftpsession &);
	ftpsession& operator=(const ftpsession &);

	int socket_wait(int fd, bool out);
	int readline(std::string &line);
	void Log(const char *str, bool in);

	int FtpXfer(const char *localfile, const char *path, accesstype type, transfermode mode);
	int FtpAccess(const char *path, accesstype type, transfermode mode, tlsstream &data);
	int FtpOpenPasv(const char *cmd, tlsstream &data);
	int FtpOpenPort(const char *cmd, tlsstream &data);
	int FtpAcceptConnection(int listener, tlsstream &data);

	tlsstream m_ctrl;
	char m_buf[FXPLIB_BUFSIZ];
	size_t m_cget;
	size_t m_cavail;

	std::string m_host;
	connmode m_cmode;
	bool m_debug;
	bool m_correctpasv;
	struct timeval m_idletime;
	FxpCallbackIdle m_idlecb;
	FxpCallbackLog m_logcb;
	void *m_cbarg;
	secmode *m_sec;
	std::string m_response;
};

#endif
