#include "stubcontrol.h"

#include <chrono>
#include <stdexcept>

stubcontrol::stubcontrol(const char *host)
	: failwait(false), waits(0), tlsstarts(0), tlsstops(0), loginok(true), tlsok(true), secure(false),
	  correctpasv(false), passive(true), m_host(host), m_gateopen(true)
{
}

void stubcontrol::Queue(const char *reply)
{
	m_replies.push_back(reply);
}

void stubcontrol::Close()
{
	std::lock_guard<std::mutex> lock(m_gatemutex);
	m_gateopen = false;
}

void stubcontrol::Open()
{
	{
		std::lock_guard<std::mutex> lock(m_gatemutex);
		m_gateopen = true;
	}
	m_gatecond.notify_all();
}

int stubcontrol::Next(ftpreply &reply)
{
	reply.Clear();
	if (m_replies.empty())
	{
		return 0;
	}

	std::string text = m_replies.front();
	std::string::size_type start = 0, nl;

	m_replies.pop_front();
	while ((nl = text.find('\n', start)) != std::string::npos)
	{
		reply.lines.push_back(text.substr(start, nl - start));
		start = nl + 1;
	}
	reply.lines.push_back(text.substr(start));
	return 1;
}

int stubcontrol::SendCmd(const char *cmd, ftpreply &reply)
{
	sent.push_back(cmd);
	sentsecure.push_back(secure);
	return Next(reply);
}

int stubcontrol::ReadResp(ftpreply &reply)
{
	waits++;
	if (onWait)
	{
		onWait();
	}
	if (failwait)
	{
		throw std::runtime_error("control connection lost");
	}

	std::unique_lock<std::mutex> lock(m_gatemutex);
	if (!m_gatecond.wait_for(lock, std::chrono::seconds(2), [this] { return m_gateopen; }))
	{
		reply.Clear();
		return 0;   // nobody opened the gate, as if the wait was cancelled
	}
	lock.unlock();
	return Next(reply);
}

int stubcontrol::Login(const char *user, const char *, const char *)
{
	sent.push_back(std::string("LOGIN ") + user);
	sentsecure.push_back(secure);
	return loginok ? 1 : 0;
}

int stubcontrol::StartTls(tlscontext &)
{
	tlsstarts++;
	if (tlsok)
	{
		secure = true;
	}
	return tlsok ? 1 : 0;
}

int stubcontrol::StopTls()
{
	tlsstops++;
	secure = false;
	return 1;
}

X509* stubcontrol::PeerCertificate()
{
	return NULL;
}

int stubcontrol::CorrectPasv(hostport &hp)
{
	if (correctpasv)
	{
		const unsigned char peer[4] = { 192, 0, 2, 7 };
		hp.SetHost(peer);
	}
	return 1;
}

std::string stubcontrol::Sent() const
{
	std::string all;

	for (size_t i = 0; i < sent.size(); i++)
	{
		if (i > 0)
		{
			all += '|';
		}
		all += sent[i];
	}
	return all;
}
