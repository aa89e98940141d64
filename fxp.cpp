#include "fxp.h"
#include "fxpcmd.h"

#include <err.h>
#include <exception>
#include <system_error>
#include <thread>

/* joins the destination waiter on every way out of the source wait */
class joinguard
{
public:
	explicit joinguard(std::thread &t) : m_thread(t) {}
	~joinguard()
	{
		if (m_thread.joinable())
		{
			m_thread.join();
		}
	}

private:
	joinguard(const joinguard &);
	joinguard& operator=(const joinguard &);

	std::thread &m_thread;
};

void fxp::Fail(fxpresult &res, fxpresult::kind k, const char *side, const ftpreply &reply, const char *what)
{
	res.status = k;
	res.reason = side;
	res.reason += ": ";
	if (!reply.Empty())
	{
		res.reason += reply.Text();
	}
	else
	{
		res.reason += what;
	}
}

/*
 * CheckPaths - both sides need a file name
 *
 * return 1 if successful, 0 otherwise
 */
int fxp::CheckPaths(const fxpendpoint &src, const fxpendpoint &dst, fxpresult &res)
{
	if (src.path.empty())
	{
		res.status = fxpresult::negotiation;
		res.reason = "source: missing path";
		return 0;
	}
	if (dst.path.empty())
	{
		res.status = fxpresult::negotiation;
		res.reason = "destination: missing path";
		return 0;
	}
	return 1;
}

/*
 * Protect - make sure PROT P is in effect on one side
 *
 * return 1 if successful, 0 otherwise
 */
int fxp::Protect(fxpendpoint &ep, const char *side, fxpresult &res)
{
	if (ep.sec->DataProtected())
	{
		return 1;
	}
	if (ep.sec->SetProtectionLevel('P') != secmode::ok)
	{
		res.status = fxpresult::negotiation;
		res.reason = side;
		res.reason += ": PROT P: ";
		res.reason += ep.sec->LastError();
		return 0;
	}
	return 1;
}

/*
 * Run - everything after the listening side has answered PASV/CPSV
 *
 * The destination must be waiting in STOR before the source gets RETR.
 * Both completion replies are then awaited at the same time, a slow side
 * does not hold up reading the other.
 */
void fxp::Run(fxpendpoint &src, fxpendpoint &dst, const ftpreply &pasv, fxpresult &res)
{
	fxpcmd srccmd(*src.ctl);
	fxpcmd dstcmd(*dst.ctl);
	hostport hp;
	ftpreply reply;

	if (!pasv.Positive() || !hp.Parse(pasv.Text().c_str()))
	{
		Fail(res, fxpresult::negotiation, "source", pasv, "no passive reply");
		res.srcresp = pasv;
		return;
	}
	if (!src.ctl->CorrectPasv(hp))
	{
		Fail(res, fxpresult::negotiation, "source", ftpreply(), "cannot determine peer address");
		return;
	}
	if (src.ctl->Debug())
	{
		warnx("fxp: %s -> %s via %s:%d", src.ctl->Host(), dst.ctl->Host(), hp.Host().c_str(), hp.Port());
	}

	if (!dstcmd.Port(hp, reply))
	{
		Fail(res, fxpresult::negotiation, "destination", reply, "PORT failed");
		res.dstresp = reply;
		return;
	}

	if (!dstcmd.Stor(dst.path.c_str(), res.dstresp))
	{
		Fail(res, fxpresult::dstfailed, "destination", res.dstresp, "STOR failed");
		return;
	}

	if (!srccmd.Retr(src.path.c_str(), res.srcresp))
	{
		/* a new PASV drops the listener the destination is connected to,
		 * which ends its pending STOR */
		ftpreply abort;
		srccmd.Pasv(abort);
		dstcmd.Wait(res.dstresp);
		Fail(res, fxpresult::srcfailed, "source", res.srcresp, "RETR failed");
		return;
	}

	std::thread waiter;
	std::exception_ptr dsterror;
	try
	{
		// an error in the waiter is rethrown here after the join
		waiter = std::thread([&dstcmd, &res, &dsterror]()
		{
			try
			{
				dstcmd.Wait(res.dstresp);
			}
			catch (...)
			{
				dsterror = std::current_exception();
			}
		});
	}
	catch (const std::system_error &e)
	{
		warnx("fxp: %s, waiting sequentially", e.what());
	}

	if (waiter.joinable())
	{
		{
			joinguard guard(waiter);
			srccmd.Wait(res.srcresp);
		}
		if (dsterror)
		{
			std::rethrow_exception(dsterror);
		}
	}
	else
	{
		srccmd.Wait(res.srcresp);
		dstcmd.Wait(res.dstresp);
	}

	// only 226 counts, other 2xx codes are no proof of a complete file
	if (!res.srcresp.TransferComplete())
	{
		Fail(res, fxpresult::srcfailed, "source", res.srcresp, "no reply");
	}
	else if (!res.dstresp.TransferComplete())
	{
		Fail(res, fxpresult::dstfailed, "destination", res.dstresp, "no reply");
	}
	else
	{
		res.status = fxpresult::ok;
		res.reason.clear();
	}

	if (src.ctl->Debug())
	{
		warnx("fxp: source %s, destination %s", res.srcresp.Text().c_str(), res.dstresp.Text().c_str());
	}
}

fxpresult fxp::Transfer(fxpendpoint &src, fxpendpoint &dst)
{
	fxpresult res;
	ftpreply pasv;
	fxpcmd srccmd(*src.ctl);

	if (!CheckPaths(src, dst, res))
	{
		return res;
	}
	if (!srccmd.Pasv(pasv))
	{
		Fail(res, fxpresult::negotiation, "source", pasv, "PASV: no reply");
		return res;
	}
	Run(src, dst, pasv, res);
	return res;
}

fxpresult fxp::TransferViaCPSV(fxpendpoint &src, fxpendpoint &dst)
{
	fxpresult res;
	ftpreply pasv;

	if (!CheckPaths(src, dst, res))
	{
		return res;
	}
	if (src.sec == NULL)
	{
		res.reason = "source: no secure mode attached";
		return res;
	}
	if (!Protect(src, "source", res))
	{
		return res;
	}
	if (dst.sec != NULL)
	{
		if (!Protect(dst, "destination", res))
		{
			return res;
		}
		// a destination left in SSCN ON would be a TLS client too
		ftpreply reply;
		if (dst.sec->SSCN() && (dst.sec->ToggleSSCN(false, reply) != secmode::ok))
		{
			Fail(res, fxpresult::negotiation, "destination", reply, dst.sec->LastError());
			res.dstresp = reply;
			return res;
		}
	}

	if (src.sec->Cpsv(pasv) != secmode::ok)
	{
		Fail(res, fxpresult::negotiation, "source", pasv, src.sec->LastError());
		res.srcresp = pasv;
		return res;
	}
	Run(src, dst, pasv, res);
	return res;
}

fxpresult fxp::TransferViaSSCN(fxpendpoint &src, fxpendpoint &dst)
{
	fxpresult res;
	ftpreply reply;

	if (!CheckPaths(src, dst, res))
	{
		return res;
	}
	if ((src.sec == NULL) || (dst.sec == NULL))
	{
		res.reason = "SSCN needs secure mode on both sides";
		return res;
	}
	if (!Protect(src, "source", res) || !Protect(dst, "destination", res))
	{
		return res;
	}

	// we are the TLS server side
	if (src.sec->ToggleSSCN(false, reply) != secmode::ok)
	{
		Fail(res, fxpresult::negotiation, "source", reply, src.sec->LastError());
		return res;
	}
	// they are the TLS client side
	if (dst.sec->ToggleSSCN(true, reply) != secmode::ok)
	{
		Fail(res, fxpresult::negotiation, "destination", reply, dst.sec->LastError());
		return res;
	}

	fxpcmd srccmd(*src.ctl);
	if (!srccmd.Pasv(reply))
	{
		Fail(res, fxpresult::negotiation, "source", reply, "PASV: no reply");
		return res;
	}
	Run(src, dst, reply, res);
	return res;
}
