/***************************************************************************
                          fxpcmd.h  -  description
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

#ifndef FXPLIB_FXPCMD_H
#define FXPLIB_FXPCMD_H

#include "ftpcontrol.h"
#include "ftpreply.h"

/**
  * FTP extension commands used for server to server transfers.
  *
  * Every call holds the session lock for its whole exchange and returns
  * 1 if a reply was read (0 on I/O failure); the reply itself is not judged
  * unless noted.
  */
class fxpcmd
{
public:
	explicit fxpcmd(ftpcontrol &ctl) : m_ctl(ctl) {}

	/* PASV, the caller parses the tuple */
	int Pasv(ftpreply &reply);

	/* PORT h,h,h,h,p,p; 1 only for a 2xx reply */
	int Port(const hostport &hp, ftpreply &reply);

	/* TYPE I + STOR path on the destination, before Retr on the source;
	 * 1 only for a 1xx reply */
	int Stor(const char *path, ftpreply &reply);

	/* TYPE I + RETR path on the source; 1 only for a 1xx reply */
	int Retr(const char *path, ftpreply &reply);

	/* block until the final reply of a running transfer arrives */
	int Wait(ftpreply &reply);

	/* FEAT */
	int Feat(ftpreply &reply);

	/* SITE XDUPE, queries the current mode */
	int Xdupe(ftpreply &reply);

	/* SITE XDUPE mode
	 * mode=0 : disables extended dupe checking
	 * mode=1 : several file names per X-DUPE line
	 * mode=2 : one file name per X-DUPE line
	 * mode=3 : one file name per X-DUPE line, no truncation
	 * mode=4 : all files on one line, up to 1024 characters */
	int Xdupe(int mode, ftpreply &reply);

	/* STAT -l [path], a cheaper LIST; path may be NULL */
	int FastList(const char *path, ftpreply &reply);

	bool FileExists(const char *path);
	bool PathExists(const char *path);

private:
	int Prepare(const char *verb, const char *path, ftpreply &reply);
	bool ScanList(const char *path, bool filesonly);

	ftpcontrol &m_ctl;
};

#endif
