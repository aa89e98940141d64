#include "fxpcmd.h"

#include <stdio.h>
#include <string>

int fxpcmd::Pasv(ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	return m_ctl.SendCmd("PASV", reply);
}

int fxpcmd::Port(const hostport &hp, ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	std::string cmd("PORT ");

	cmd += hp.Encode();
	return m_ctl.FtpSendCmd(cmd.c_str(), '2', reply);
}

/*
 * Prepare - binary type, then STOR/RETR
 *
 * return 1 if the server answered the transfer command with 1xx
 */
int fxpcmd::Prepare(const char *verb, const char *path, ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	std::string cmd(verb);

	if ((path == NULL) || (*path == '\0'))
	{
		reply.Clear();
		return 0;   // nothing sent
	}
	if (!m_ctl.FtpSendCmd("TYPE I", '2', reply))
	{
		return 0;
	}
	cmd += ' ';
	cmd += path;
	return m_ctl.FtpSendCmd(cmd.c_str(), '1', reply);
}

int fxpcmd::Stor(const char *path, ftpreply &reply)
{
	return Prepare("STOR", path, reply);
}

int fxpcmd::Retr(const char *path, ftpreply &reply)
{
	return Prepare("RETR", path, reply);
}

int fxpcmd::Wait(ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	return m_ctl.ReadResp(reply);
}

int fxpcmd::Feat(ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	return m_ctl.SendCmd("FEAT", reply);
}

int fxpcmd::Xdupe(ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	return m_ctl.SendCmd("SITE XDUPE", reply);
}

int fxpcmd::Xdupe(int mode, ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	char buf[32];

	sprintf(buf, "SITE XDUPE %d", mode);
	return m_ctl.SendCmd(buf, reply);
}

int fxpcmd::FastList(const char *path, ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	std::string cmd("STAT -l");

	if (path != NULL)
	{
		cmd += ' ';
		cmd += path;
	}
	return m_ctl.SendCmd(cmd.c_str(), reply);
}

/*
 * ScanList - look for entries in a STAT -l listing
 *
 * Lines starting with 213 are the status banner around the listing and are
 * skipped, so are blank lines. A regular file shows up as "-rw...".
 */
bool fxpcmd::ScanList(const char *path, bool filesonly)
{
	ftpreply reply;

	if (!FastList(path, reply) || !reply.Positive())
	{
		return false;
	}
	for (size_t i = 0; i < reply.lines.size(); i++)
	{
		const std::string &line = reply.lines[i];
		std::string::size_type pos = line.find_first_not_of(' ');

		if ((pos == std::string::npos) || (line.compare(0, 3, "213") == 0))
		{
			continue;
		}
		if (!filesonly || (line.compare(pos, 3, "-rw") == 0))
		{
			return true;
		}
	}
	return false;
}

bool fxpcmd::FileExists(const char *path)
{
	return ScanList(path, true);
}

bool fxpcmd::PathExists(const char *path)
{
	return ScanList(path, false);
}
