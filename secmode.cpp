#include "secmode.h"

#include <err.h>
#include <stdio.h>
#include <string.h>

secmode::secmode(ftpcontrol &ctl, const tlsconfig &cfg)
	: m_ctl(ctl), m_ctx(cfg), m_ctrlsecure(false), m_pbsz(false), m_sscn(false), m_prot('C'),
	  m_certcb(NULL), m_cbarg(NULL)
{
	if (!m_ctx.Ok())
	{
		m_error = m_ctx.LastError();
		warnx("tls context: %s", m_error.c_str());
	}
	else if (!m_ctx.Verify() && m_ctl.Debug())
	{
		warnx("%s: peer certificates are not verified", m_ctl.Host());
	}
}

secmode::result secmode::Fail(result r, const char *msg)
{
	m_error = msg;
	if (m_ctl.Debug())
	{
		warnx("%s: %s", m_ctl.Host(), msg);
	}
	return r;
}

/*
 * Prot - PBSZ/PROT exchange, caller holds the session lock
 */
secmode::result secmode::Prot(char level, ftpreply &reply)
{
	char buf[8];

	if (!m_pbsz)
	{
		// FTP-TLS does not buffer, but PBSZ must precede PROT
		if (!m_ctl.SendCmd("PBSZ 0", reply))
		{
			return Fail(ioerror, "PBSZ 0: no reply");
		}
		if (!reply.Positive())
		{
			return Fail(replyerror, reply.Text().c_str());
		}
		m_pbsz = true;
	}

	// P private, E confidential, S safe, C clear; TLS only knows P and C
	sprintf(buf, "PROT %c", level);
	if (!m_ctl.SendCmd(buf, reply))
	{
		return Fail(ioerror, "PROT: no reply");
	}
	if (!reply.Positive())
	{
		return Fail(replyerror, reply.Text().c_str());
	}
	m_prot = level;
	return ok;
}

/*
 * NegotiateTLS - secure the control channel and log in over it
 *
 * The handshake succeeding says nothing about the credentials: a failed
 * login afterwards is reported as autherror.
 */
secmode::result secmode::NegotiateTLS(authmode mode, const char *user, const char *pass, const char *acct)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	ftpreply reply;

	if (!m_ctx.Ok())
	{
		return Fail(tlserror, m_ctx.LastError());
	}
	if (m_ctrlsecure)
	{
		return Fail(refused, "control channel already secured");
	}

	if (!m_ctl.SendCmd((mode == ssl) ? "AUTH SSL" : "AUTH TLS", reply))
	{
		return Fail(ioerror, "AUTH: no reply");
	}
	if (!reply.Positive())
	{
		return Fail(replyerror, reply.Text().c_str());
	}

	if (!m_ctl.StartTls(m_ctx))
	{
		return Fail(tlserror, "control channel handshake failed");
	}
	m_ctrlsecure = true;

	X509 *cert = m_ctl.PeerCertificate();
	if ((cert != NULL) && m_ctl.Debug())
	{
		char name[256];
		X509_NAME_oneline(X509_get_subject_name(cert), name, sizeof(name));
		warnx("%s: peer certificate %s", m_ctl.Host(), name);
	}
	if ((m_certcb != NULL) && !m_certcb(m_cbarg, cert))
	{
		if (cert != NULL)
		{
			X509_free(cert);
		}
		return Fail(tlserror, "peer certificate rejected");
	}
	if (cert != NULL)
	{
		X509_free(cert);
	}

	if (!m_ctl.Login(user, pass, acct))
	{
		return Fail(autherror, "login failed");
	}

	result r = Prot('P', reply);
	if (r != ok)
	{
		return r;
	}
	m_error.clear();
	return ok;
}

secmode::result secmode::SetProtectionLevel(char level)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());
	ftpreply reply;

	if (!strchr("PESC", level) || (level == '\0'))
	{
		return Fail(refused, "invalid protection level");
	}
	return Prot(level, reply);
}

/*
 * ClearCommandChannel - issue CCC
 *
 * Servers may refuse this for security reasons, that is no error of the
 * connection: the refusal code is handed back and nothing changes.
 */
secmode::result secmode::ClearCommandChannel(ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());

	reply.Clear();
	if (!m_ctrlsecure)
	{
		return Fail(refused, "control channel is not secured");
	}
	if (!m_ctl.SendCmd("CCC", reply))
	{
		return Fail(ioerror, "CCC: no reply");
	}
	if (!reply.Positive())
	{
		return Fail(replyerror, reply.Text().c_str());
	}

	m_ctrlsecure = false;
	if (!m_ctl.StopTls())
	{
		return Fail(tlserror, "TLS shutdown on control channel failed");
	}
	return ok;
}

/*
 * ToggleSSCN - ON: the server acts as TLS client in data handshakes,
 * OFF: as TLS server (the default)
 */
secmode::result secmode::ToggleSSCN(bool on, ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());

	reply.Clear();
	if (on && !DataProtected())
	{
		return Fail(refused, "SSCN ON requires PROT P");
	}
	if (!m_ctl.SendCmd(on ? "SSCN ON" : "SSCN OFF", reply))
	{
		return Fail(ioerror, "SSCN: no reply");
	}
	if (!reply.Positive())
	{
		return Fail(replyerror, reply.Text().c_str());
	}
	m_sscn = on;
	return ok;
}

/*
 * Cpsv - PASV that tells the server not to start the TLS handshake on the
 * data connection; the side given PORT does that.
 */
secmode::result secmode::Cpsv(ftpreply &reply)
{
	std::lock_guard<std::mutex> lock(m_ctl.Mutex());

	reply.Clear();
	if (m_sscn)
	{
		return Fail(refused, "CPSV not allowed while SSCN is on");
	}
	if (!m_ctl.SendCmd("CPSV", reply))
	{
		return Fail(ioerror, "CPSV: no reply");
	}
	if (!reply.Positive())
	{
		return Fail(replyerror, reply.Text().c_str());
	}
	return ok;
}

tlscontext::role secmode::DataRole(bool passive) const
{
	if (m_sscn)
	{
		return tlscontext::server;  // the server plays client
	}
	return passive ? tlscontext::client : tlscontext::server;
}

int secmode::WrapDataConnection(tlsstream &data, tlscontext::role r)
{
	if (!DataProtected())
	{
		return 1;
	}
	if (!data.Handshake(m_ctx, r, (r == tlscontext::client) ? m_ctl.Host() : NULL))
	{
		Fail(tlserror, data.LastError());
		return 0;
	}
	return 1;
}

void secmode::SetCallbackCertFunction(FxpCallbackCert pointer, void *arg)
{
	m_certcb = pointer;
	m_cbarg = arg;
}
