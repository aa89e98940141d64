/***************************************************************************
                          fxp.h  -  description
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

#ifndef FXPLIB_FXP_H
#define FXPLIB_FXP_H

#include <string>

#include "ftpcontrol.h"
#include "ftpreply.h"
#include "secmode.h"

/**
  * One side of a server to server transfer. The session is borrowed, the
  * caller keeps it connected and logged in.
  */
struct fxpendpoint
{
	ftpcontrol *ctl;
	secmode *sec;       // NULL for a plain session
	std::string path;

	fxpendpoint(ftpcontrol &c, const char *p, secmode *s = NULL) : ctl(&c), sec(s), path((p != NULL) ? p : "") {}
};

/**
  * Outcome of one transfer. srcresp/dstresp hold whatever the servers
  * answered, also when the transfer failed.
  */
struct fxpresult
{
	enum kind
	{
		ok = 0,
		srcfailed,      // source did not answer 226
		dstfailed,      // destination did not answer 226
		negotiation     // failed before any data was moved
	};

	kind status;
	ftpreply srcresp;
	ftpreply dstresp;
	std::string reason;

	fxpresult() : status(negotiation) {}

	bool Ok() const
	{
		return status == ok;
	}
};

class fxp
{
public:
	/* PASV on the source, PORT on the destination, no TLS involved */
	static fxpresult Transfer(fxpendpoint &src, fxpendpoint &dst);

	/* PROT P + CPSV on the source, PORT on the destination. A destination
	 * left in SSCN ON is switched back to OFF first; a source in SSCN ON is
	 * refused. */
	static fxpresult TransferViaCPSV(fxpendpoint &src, fxpendpoint &dst);

	/* SSCN OFF on the source, SSCN ON on the destination, then PASV/PORT.
	 * Do not mix with CPSV for the same transfer. */
	static fxpresult TransferViaSSCN(fxpendpoint &src, fxpendpoint &dst);

private:
	static void Run(fxpendpoint &src, fxpendpoint &dst, const ftpreply &pasv, fxpresult &res);
	static int CheckPaths(const fxpendpoint &src, const fxpendpoint &dst, fxpresult &res);
	static int Protect(fxpendpoint &ep, const char *side, fxpresult &res);
	static void Fail(fxpresult &res, fxpresult::kind k, const char *side, const ftpreply &reply, const char *what);
};

#endif
