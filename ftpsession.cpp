#include <err.h>
#include "ftpsession.h"
#include "secmode.h"

#include <sys/socket.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <netdb.h>
#include <arpa/inet.h>

#include <stdio.h>
#include <string.h>
#include <errno.h>

#define net_close close

/*
 * Constructor
 */
ftpsession::ftpsession()
	: m_cget(0), m_cavail(0), m_cmode(pasv), m_debug(false), m_correctpasv(false),
	  m_idlecb(NULL), m_logcb(NULL), m_cbarg(NULL), m_sec(NULL)
{
	m_idletime.tv_sec = m_idletime.tv_usec = 0;
}

/*
 * Destructor
 */
ftpsession::~ftpsession()
{
}

/*
 * socket_wait - wait for socket to receive or flush data
 *
 * return 1 if no user callback, otherwise, return value returned by
 * user callback
 */
int ftpsession::socket_wait(int fd, bool out)
{
	fd_set fds, *rfd = NULL, *wfd = NULL;
	struct timeval tv;
	int rv = 0;     // default error

	if (m_idlecb == NULL)
	{
		return 1;   // ok
	}

	if (out)
	{
		wfd = &fds;
	}
	else
	{
		rfd = &fds;
	}

	do
	{
		FD_ZERO(&fds);
		FD_SET(fd, &fds);
		tv = m_idletime;
		rv = select(fd + 1, rfd, wfd, NULL, &tv);
		if (rv == -1)
		{
			if (errno == EINTR)
			{
				continue;
			}
			rv = 0; // error
			m_response = strerror(errno);
			break;
		}
		else if (rv > 0)
		{
			rv = 1; // ok
			break;
		} // else timeout
	}
	while ((rv = m_idlecb(m_cbarg)));

	return rv;
}

void ftpsession::Log(const char *str, bool in)
{
	if (m_logcb != NULL)
	{
		m_logcb(str, m_cbarg, in);
	}
}

/*
 * read a line of text from the control connection, without CRLF
 *
 * return -1 on error or bytecount
 */
int ftpsession::readline(std::string &line)
{
	line.clear();

	while (1)
	{
		if (m_cavail > 0)
		{
			char *start = m_buf + m_cget;
			char *end = static_cast<char *>(memchr(start, '\n', m_cavail));

			if (end != NULL)
			{
				size_t x = static_cast<size_t>(end - start) + 1;

				line.assign(start, x);
				m_cget += x;
				m_cavail -= x;
				break;
			}
			if ((m_cget == 0) && (m_cavail == sizeof(m_buf)))
			{
				// overlong line, hand it out in pieces
				line.assign(start, m_cavail);
				m_cget = m_cavail = 0;
				break;
			}
			memmove(m_buf, start, m_cavail);
		}
		m_cget = 0;

		if (!m_ctrl.Pending() && !socket_wait(m_ctrl.Handle(), false))
		{
			return -1;  // aborted by callback
		}

		ssize_t len = m_ctrl.Read(m_buf + m_cavail, sizeof(m_buf) - m_cavail);
		if (len == -1)
		{
			warnx("read(): %s", m_ctrl.LastError());
			return -1;
		}
		if (len == 0)
		{
			return -1;  // eof before a complete line
		}
		m_cavail += static_cast<size_t>(len);
	}

	Log(line.c_str(), true);

	while (!line.empty() && ((line[line.size() - 1] == '\n') || (line[line.size() - 1] == '\r')))
	{
		line.erase(line.size() - 1);
	}
	return static_cast<int>(line.size());
}

/*
 * ReadResp - read a complete (possibly multi-line) reply
 *
 * return 1 if a reply was read, 0 otherwise
 */
int ftpsession::ReadResp(ftpreply &reply)
{
	std::string line;

	reply.Clear();
	if (readline(line) == -1)
	{
		m_response = "Control socket read failed";
		if (m_debug)
		{
			warnx("%s: %s", m_host.c_str(), m_response.c_str());
		}
		return 0;
	}
	reply.lines.push_back(line);

	if ((line.size() > 3) && (line[3] == '-'))
	{
		std::string match(line, 0, 3);
		match += ' ';
		do
		{
			if (readline(line) == -1)
			{
				m_response = "Control socket read failed";
				reply.Clear();
				return 0;
			}
			reply.lines.push_back(line);
		}
		while (line.compare(0, 4, match) != 0);
	}
	m_response = reply.Text();
	return 1;
}

/*
 * LastResponse - return a pointer to the last response received
 */
const char* ftpsession::LastResponse()
{
	return m_response.c_str();
}

/*
 * ftpsession::Connect - connect to remote server
 *
 * return 1 if connected, 0 if not
 */
int ftpsession::Connect(const char *host, const char *port)
{
	int sControl = -1;
	struct addrinfo hints, *res, *res0 = NULL;
	int error;
	const char *cause = NULL;
	ftpreply reply;

	m_ctrl.Close();
	m_cget = m_cavail = 0;
	m_host = host;

	memset(&hints, 0, sizeof(hints));
	hints.ai_family = PF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	error = getaddrinfo(host, port, &hints, &res0);

	if (error)
	{
		warnx("getaddrinfo(%s): %s", host, gai_strerror(error));
		return 0;
	}
	for (res = res0; res; res = res->ai_next)
	{
		sControl = socket(res->ai_family, res->ai_socktype,
		                  res->ai_protocol);
		if (sControl < 0)
		{
			cause = "socket";
			continue;
		}

		if (connect(sControl, res->ai_addr, res->ai_addrlen) < 0)
		{
			cause = "connect";
			net_close(sControl);
			sControl = -1;
			continue;
		}

		break;  /* okay we got one */
	}
	freeaddrinfo(res0);
	if (sControl < 0)
	{
		warn("%s", cause);
		return 0;
	}

	m_ctrl.Attach(sControl);

	if (!ReadResp(reply) || !reply.Positive())
	{
		m_ctrl.Close();
		return 0;
	}

	return 1;
}

/*
 * SendCmd - send a command and read the reply
 *
 * return 1 if a reply was received, 0 otherwise
 */
int ftpsession::SendCmd(const char *cmd, ftpreply &reply)
{
	std::string buf(cmd);

	reply.Clear();
	if (m_ctrl.Handle() == -1)
	{
		m_response = "not connected";
		return 0;
	}
	buf += "\r\n";

	if (!socket_wait(m_ctrl.Handle(), true))
	{
		return 0;
	}
	if (m_ctrl.Write(buf.data(), buf.size()) == -1)
	{
		warnx("write(): %s", m_ctrl.LastError());
		m_response = m_ctrl.LastError();
		return 0;
	}

	if (strncmp(cmd, "PASS ", 5) == 0)
	{
		Log("PASS ****\r\n", false);
	}
	else
	{
		Log(buf.c_str(), false);
	}

	return ReadResp(reply);
}

/*
 * Login - log in to remote server
 *
 * return 1 if logged in, 0 otherwise
 */
int ftpsession::Login(const char *user, const char *pass, const char *acct)
{
	std::string cmd("USER ");
	ftpreply reply;

	cmd += user;
	if (!SendCmd(cmd.c_str(), reply))
	{
		return 0;
	}
	if (reply.Positive())
	{
		return 1;
	}
	if (reply.Code() / 100 != 3)
	{
		return 0;
	}

	cmd = "PASS ";
	cmd += (pass != NULL) ? pass : "";
	if (!SendCmd(cmd.c_str(), reply))
	{
		return 0;
	}
	if (reply.Positive())
	{
		return 1;
	}
	if ((reply.Code() / 100 != 3) || (acct == NULL))
	{
		return 0;
	}

	cmd = "ACCT ";
	cmd += acct;
	return FtpSendCmd(cmd.c_str(), '2', reply);
}

int ftpsession::StartTls(tlscontext &ctx)
{
	if (m_cavail != 0)
	{
		// plaintext after the AUTH reply would be injected into the session
		m_response = "unexpected data before TLS handshake";
		return 0;
	}
	if (!m_ctrl.Handshake(ctx, tlscontext::client, m_host.c_str()))
	{
		m_response = m_ctrl.LastError();
		warnx("%s: %s", m_host.c_str(), m_response.c_str());
		return 0;
	}
	return 1;
}

int ftpsession::StopTls()
{
	if (!m_ctrl.Shutdown())
	{
		m_response = m_ctrl.LastError();
		warnx("%s: %s", m_host.c_str(), m_response.c_str());
		return 0;
	}
	return 1;
}

X509* ftpsession::PeerCertificate()
{
	return m_ctrl.PeerCertificate();
}

/*
 * CorrectPasv - use the address we are connected to instead of the one a
 * server behind NAT reports
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::CorrectPasv(hostport &hp)
{
	union
	{
		struct sockaddr sa;
		struct sockaddr_storage ss;
		struct sockaddr_in sin4;
		struct sockaddr_in6 sin6;
	} sin;
	socklen_t l = sizeof(sin.ss);

	if (!m_correctpasv)
	{
		return 1;
	}
	if (getpeername(m_ctrl.Handle(), &sin.sa, &l) == -1)
	{
		perror("getpeername()");
		return 0;
	}
	if (sin.ss.ss_family == AF_INET)
	{
		hp.SetHost(reinterpret_cast<const unsigned char *>(&sin.sin4.sin_addr.s_addr));
		return 1;
	}
	if ((sin.ss.ss_family == AF_INET6) && IN6_IS_ADDR_V4MAPPED(&sin.sin6.sin6_addr))
	{
		hp.SetHost(&sin.sin6.sin6_addr.s6_addr[12]);
		return 1;
	}
	m_response = "PASV needs an IPv4 control connection";
	return 0;
}

/*
 * FtpAcceptConnection - accept connection from server
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::FtpAcceptConnection(int listener, tlsstream &data)
{
	int sData;
	struct sockaddr_storage addr;
	socklen_t l;
	int i;
	struct timeval tv;
	fd_set mask;
	int rv = 0; // error

	FD_ZERO(&mask);
	FD_SET(m_ctrl.Handle(), &mask);
	FD_SET(listener, &mask);
	tv.tv_usec = 0;
	tv.tv_sec = FXPLIB_ACCEPT_TIMEOUT;
	i = m_ctrl.Handle();
	if (i < listener)
	{
		i = listener;
	}
	i = select(i + 1, &mask, NULL, NULL, &tv);

	if (i == -1)
	{
		m_response = strerror(errno);
	}
	else if (i == 0)
	{
		m_response = "timed out waiting for connection";
	}
	else if (FD_ISSET(listener, &mask))
	{
		l = sizeof(addr);
		sData = accept(listener, reinterpret_cast<struct sockaddr *>(&addr), &l);
		if (sData >= 0)      // NOTE: accept return -1 on error!
		{
			data.Attach(sData);
			rv = 1; // OK
		}
		else
		{
			m_response = strerror(errno);
		}
	}
	else
	{
		// the server gave up before connecting
		ftpreply reply;
		ReadResp(reply);
	}
	net_close(listener);
	return rv;
}

/*
 * FtpOpenPasv - connect to the address announced by PASV, then send cmd
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::FtpOpenPasv(const char *cmd, tlsstream &data)
{
	struct sockaddr_in sin4;
	hostport hp;
	ftpreply reply;
	int sData;

	if (!FtpSendCmd("PASV", '2', reply))
	{
		return 0;
	}
	if (!hp.Parse(reply.Text().c_str()))
	{
		m_response = "malformed PASV reply: " + reply.Text();
		return 0;   // protocol error
	}
	if (!CorrectPasv(hp))
	{
		return 0;
	}
	if (m_debug)
	{
		warnx("peer %s:%d", hp.Host().c_str(), hp.Port());
	}

	memset(&sin4, 0, sizeof(sin4));
	sin4.sin_family = AF_INET;
	sin4.sin_port = htons(hp.Port());
	memcpy(&sin4.sin_addr.s_addr, hp.v, 4);

	sData = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
	if (sData == -1)
	{
		perror("socket()");
		return 0;
	}
	if (connect(sData, reinterpret_cast<struct sockaddr *>(&sin4), sizeof(sin4)) == -1)
	{
		perror("connect");
		net_close(sData);
		return 0;
	}
	data.Attach(sData);

	if (!FtpSendCmd(cmd, '1', reply))
	{
		data.Close();
		return 0;
	}
	return 1;
}

/*
 * FtpOpenPort - listen on our side, announce it with PORT, send cmd and
 * wait for the server to connect
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::FtpOpenPort(const char *cmd, tlsstream &data)
{
	union
	{
		struct sockaddr sa;
		struct sockaddr_storage ss;
		struct sockaddr_in sin4;
		struct sockaddr_in6 sin6;
	} sin;
	struct sockaddr_in local;
	socklen_t l;
	int on = 1;
	int sData;
	unsigned char addr[4];
	hostport hp;
	ftpreply reply;

	/* find our own address, bind, and listen */
	l = sizeof(sin.ss);
	if (getsockname(m_ctrl.Handle(), &sin.sa, &l) == -1)
	{
		perror("getsockname()");
		return 0;
	}
	if (sin.ss.ss_family == AF_INET)
	{
		memcpy(addr, &sin.sin4.sin_addr.s_addr, 4);
	}
	else if ((sin.ss.ss_family == AF_INET6) && IN6_IS_ADDR_V4MAPPED(&sin.sin6.sin6_addr))
	{
		memcpy(addr, &sin.sin6.sin6_addr.s6_addr[12], 4);
	}
	else
	{
		m_response = "PORT needs an IPv4 control connection";
		return 0;
	}

	sData = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
	if (sData == -1)
	{
		perror("socket()");
		return 0;
	}
	if (setsockopt(sData, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) == -1)
	{
		perror("setsockopt()");
		net_close(sData);
		return 0;
	}

	memset(&local, 0, sizeof(local));
	local.sin_family = AF_INET;
	memcpy(&local.sin_addr.s_addr, addr, 4);
	local.sin_port = 0;
	if (bind(sData, reinterpret_cast<struct sockaddr *>(&local), sizeof(local)) == -1)
	{
		perror("bind()");
		net_close(sData);
		return 0;
	}
	if (listen(sData, 1) == -1)
	{
		perror("listen()");
		net_close(sData);
		return 0;
	}

	/* find what port we're on and tell the server */
	l = sizeof(local);
	if (getsockname(sData, reinterpret_cast<struct sockaddr *>(&local), &l) == -1)
	{
		perror("getsockname()");
		net_close(sData);
		return 0;
	}
	hp.SetHost(addr);
	hp.v[4] = static_cast<unsigned char>(ntohs(local.sin_port) >> 8);
	hp.v[5] = static_cast<unsigned char>(ntohs(local.sin_port) & 0xff);

	std::string buf("PORT ");
	buf += hp.Encode();
	if (!FtpSendCmd(buf.c_str(), '2', reply))
	{
		net_close(sData);
		return 0;
	}
	if (!FtpSendCmd(cmd, '1', reply))
	{
		net_close(sData);
		return 0;
	}
	return FtpAcceptConnection(sData, data);
}

/*
 * FtpAccess - open a data connection for one transfer command
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::FtpAccess(const char *path, accesstype type, transfermode mode, tlsstream &data)
{
	char buf[8];
	std::string cmd;
	ftpreply reply;

	if ((path == NULL) && ((type == fileread) || (type == filewrite)))
	{
		m_response = "Missing path argument for file transfer";
		return 0;
	}
	sprintf(buf, "TYPE %c", mode);
	if (!FtpSendCmd(buf, '2', reply))
	{
		return 0;
	}

	switch (type)
	{
	case dir:
		cmd = "NLST";
		break;
	case dirverbose:
		cmd = "LIST";
		break;
	case fileread:
		cmd = "RETR";
		break;
	case filewrite:
		cmd = "STOR";
		break;
	default:
		m_response = "Invalid open type";
		return 0;
	}
	if (path != NULL)
	{
		cmd += ' ';
		cmd += path;
	}

	if (m_cmode == pasv)
	{
		if (!FtpOpenPasv(cmd.c_str(), data))
		{
			return 0;
		}
	}
	else
	{
		if (!FtpOpenPort(cmd.c_str(), data))
		{
			return 0;
		}
	}

	if (m_sec != NULL)
	{
		if (!m_sec->WrapDataConnection(data, m_sec->DataRole(m_cmode == pasv)))
		{
			m_response = m_sec->LastError();
			data.Close();
			ReadResp(reply);    // the server's verdict on the broken transfer
			return 0;
		}
	}
	return 1;
}

/*
 * FtpXfer - issue a command and transfer data
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::FtpXfer(const char *localfile, const char *path, accesstype type, transfermode mode)
{
	std::lock_guard<std::mutex> lock(Mutex());
	FILE *local = NULL;
	tlsstream data;
	ftpreply reply;
	char dbuf[FXPLIB_BUFSIZ];
	int rv = 1; // default ok

	if (localfile != NULL)
	{
		const char *ac;
		if (type == filewrite)
		{
			ac = (mode == image) ? "rb" : "r";
		}
		else
		{
			ac = (mode == image) ? "wb" : "w";
		}
		local = fopen(localfile, ac);
		if (local == NULL)
		{
			m_response = strerror(errno);
			return 0;
		}
	}
	else
	{
		local = (type == filewrite) ? stdin : stdout;
	}

	if (!FtpAccess(path, type, mode, data))
	{
		if (localfile != NULL)
		{
			fclose(local);
		}
		return 0;   // error
	}

	if (type == filewrite)
	{
		size_t len;
		while ((len = fread(dbuf, 1, sizeof(dbuf), local)) > 0)
		{
			if (!socket_wait(data.Handle(), true) || (data.Write(dbuf, len) == -1))
			{
				warnx("data write: %s", data.LastError());
				rv = 0; // error
				break;
			}
		}
	}
	else
	{
		ssize_t len;
		while (1)
		{
			if (!data.Pending() && !socket_wait(data.Handle(), false))
			{
				rv = 0; // aborted by callback
				break;
			}
			len = data.Read(dbuf, sizeof(dbuf));
			if (len <= 0)
			{
				if (len == -1)
				{
					warnx("data read: %s", data.LastError());
					rv = 0;
				}
				break;
			}
			if (fwrite(dbuf, 1, static_cast<size_t>(len), local) != static_cast<size_t>(len))
			{
				perror("localfile write");
				rv = 0; // error
				break;
			}
		}
	}

	fflush(local);
	if (localfile != NULL)
	{
		fclose(local);
	}
	data.Close();

	if (!ReadResp(reply) || !reply.Positive())
	{
		rv = 0;
	}
	return rv;
}

/*
 * Nlst - issue an NLST command and write response to output
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::Nlst(const char *outputfile, const char *path)
{
	return FtpXfer(outputfile, path, dir, ascii);
}

/*
 * Dir - issue a LIST command and write response to output
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::Dir(const char *outputfile, const char *path)
{
	return FtpXfer(outputfile, path, dirverbose, ascii);
}

/*
 * Get - issue a RETR command and write received data to output
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::Get(const char *outputfile, const char *path, transfermode mode)
{
	return FtpXfer(outputfile, path, fileread, mode);
}

/*
 * Put - issue a STOR command and send data from input
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::Put(const char *inputfile, const char *path, transfermode mode)
{
	return FtpXfer(inputfile, path, filewrite, mode);
}

/*
 * Quit - disconnect from remote
 *
 * return 1 if successful, 0 otherwise
 */
int ftpsession::Quit()
{
	std::lock_guard<std::mutex> lock(Mutex());
	ftpreply reply;
	int rv;

	if (m_ctrl.Handle() == -1)
	{
		m_response = "error: no anwser from server";
		return 0;
	}
	rv = FtpSendCmd("QUIT", '2', reply);
	m_ctrl.Close();
	m_cget = m_cavail = 0;
	return rv;
}

void ftpsession::SetCallbackIdleFunction(FxpCallbackIdle pointer)
{
	m_idlecb = pointer;
}

void ftpsession::SetCallbackLogFunction(FxpCallbackLog pointer)
{
	m_logcb = pointer;
}

void ftpsession::SetCallbackArg(void *arg)
{
	m_cbarg = arg;
}

void ftpsession::SetCallbackIdletime(int time)
{
	m_idletime.tv_sec = time / 1000;
	m_idletime.tv_usec = (time % 1000) * 1000;
}
