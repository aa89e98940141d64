#include "ftpsession.h"
#include "secmode.h"
#include "fxpcmd.h"
#include "fxp.h"

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#include <string>


class myclass
{
	time_t started;
	int limit;

public:
	explicit myclass(int seconds) : started(time(NULL)), limit(seconds) {};

	static int callbackIdle(void * arg);
	static void callbackLog(const char *str, void* arg, bool out);
};


void myclass::callbackLog(const char *str, void* , bool in)
{
	if (in)
	{
		fprintf(stderr, "fxplib IN:%s", str);
	}
	else
	{
		fprintf(stderr, "fxplib OUT:%s", str);
	}
}


// give up waiting for a transfer after the configured time
int myclass::callbackIdle(void * arg)
{
	myclass *self = static_cast<myclass*>(arg);
	if ((time(NULL) - self->started) < self->limit)
	{
		return true;    // continue waiting
	}
	fprintf(stderr, "callbackIdle(): giving up\n");
	return false;       // abort
}


static void usage(const char *prog)
{
	fprintf(stderr, "usage: %s [-sscn] [-insecure] [-v] "
	        "srchost srcuser srcpass srcpath dsthost dstuser dstpass dstpath\n", prog);
	exit(EXIT_FAILURE);
}


int main(int argc, char** argv)
{
	bool sscn = false;
	bool insecure = false;
	bool verbose = false;
	int i = 1;

	for (; (i < argc) && (argv[i][0] == '-'); i++)
	{
		if (strcmp(argv[i], "-sscn") == 0)
		{
			sscn = true;
		}
		else if (strcmp(argv[i], "-insecure") == 0)
		{
			insecure = true;
		}
		else if (strcmp(argv[i], "-v") == 0)
		{
			verbose = true;
		}
		else
		{
			usage(argv[0]);
		}
	}
	if (argc - i != 8)
	{
		usage(argv[0]);
	}

	tlsconfig cfg;
	cfg.verify = !insecure;

	myclass helper(3600);
	ftpsession src, dst;
	ftpsession *sessions[2] = { &src, &dst };

	for (int n = 0; n < 2; n++)
	{
		sessions[n]->SetConnmode(ftpsession::pasv);
		sessions[n]->SetDebug(verbose);
		sessions[n]->SetCallbackArg(&helper);
		sessions[n]->SetCallbackIdletime(1000);   // ms; issue a callback after 1 sec idle time
		sessions[n]->SetCallbackIdleFunction(myclass::callbackIdle);
		if (verbose)
		{
			sessions[n]->SetCallbackLogFunction(myclass::callbackLog);
		}
	}

	if (!src.Connect(argv[i]))
	{
		fprintf(stderr, "%s: %s\n", argv[i], src.LastResponse());
		exit(EXIT_FAILURE);
	}
	if (!dst.Connect(argv[i + 4]))
	{
		fprintf(stderr, "%s: %s\n", argv[i + 4], dst.LastResponse());
		exit(EXIT_FAILURE);
	}

	secmode srcsec(src, cfg);
	secmode dstsec(dst, cfg);
	src.SetSecureMode(&srcsec);
	dst.SetSecureMode(&dstsec);

	if (srcsec.NegotiateTLS(secmode::tls, argv[i + 1], argv[i + 2]) != secmode::ok)
	{
		fprintf(stderr, "%s: %s\n", argv[i], srcsec.LastError());
		exit(EXIT_FAILURE);
	}
	if (dstsec.NegotiateTLS(secmode::tls, argv[i + 5], argv[i + 6]) != secmode::ok)
	{
		fprintf(stderr, "%s: %s\n", argv[i + 4], dstsec.LastError());
		exit(EXIT_FAILURE);
	}

	fxpcmd srccmd(src);
	if (!srccmd.FileExists(argv[i + 3]))
	{
		fprintf(stderr, "%s: %s not found\n", argv[i], argv[i + 3]);
		src.Quit();
		dst.Quit();
		exit(EXIT_FAILURE);
	}

	fxpendpoint from(src, argv[i + 3], &srcsec);
	fxpendpoint to(dst, argv[i + 7], &dstsec);
	fxpresult res = sscn ? fxp::TransferViaSSCN(from, to) : fxp::TransferViaCPSV(from, to);

	switch (res.status)
	{
	case fxpresult::ok:
		printf("%s\n%s\n", res.srcresp.Text().c_str(), res.dstresp.Text().c_str());
		break;
	case fxpresult::srcfailed:
		fprintf(stderr, "transfer failed on source: %s\n", res.reason.c_str());
		break;
	case fxpresult::dstfailed:
		fprintf(stderr, "transfer failed on destination: %s\n", res.reason.c_str());
		break;
	case fxpresult::negotiation:
		fprintf(stderr, "negotiation failed: %s\n", res.reason.c_str());
		break;
	}

	src.Quit();
	dst.Quit();

	if (res.Ok())
	{
		exit(EXIT_SUCCESS);
	}
	exit(EXIT_FAILURE);
}
