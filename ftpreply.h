/***************************************************************************
                          ftpreply.h  -  description
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

#ifndef FXPLIB_FTPREPLY_H
#define FXPLIB_FTPREPLY_H

#include <string>
#include <vector>

/**
  * One complete server reply. Multi-line replies keep every line, the
  * "123-" opening line first and the "123 " closing line last.
  */
struct ftpreply
{
	std::vector<std::string> lines;

	void Clear()
	{
		lines.clear();
	}

	bool Empty() const
	{
		return lines.empty();
	}

	/* first line, or "" if nothing could be read */
	std::string Text() const;

	/* 3 digit code of the first line, 0 if missing or malformed */
	int Code() const;

	bool Preliminary() const
	{
		return Code() / 100 == 1;
	}

	bool Positive() const
	{
		return Code() / 100 == 2;
	}

	/* true only for "226", other 2xx codes do not count */
	bool TransferComplete() const;
};

/**
  * Address/port tuple of a PASV or CPSV reply: h1,h2,h3,h4,p1,p2
  */
struct hostport
{
	unsigned char v[6];
	std::string raw;    // tuple text as the server sent it, "" if built locally

	hostport();

	/* parse a full reply line such as
	 * "227 Entering Passive Mode (10,0,0,1,195,80)"
	 * return 1 if exactly six numeric components were found, 0 otherwise */
	int Parse(const char *reply);

	/* "h1,h2,h3,h4,p1,p2" as used by PORT; a parsed tuple is repeated
	 * exactly as received unless the host was replaced since */
	std::string Encode() const;

	std::string Host() const;
	unsigned short Port() const;

	void SetHost(const unsigned char addr[4]);
};

#endif
