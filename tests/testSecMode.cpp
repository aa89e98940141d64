#include "unitTestMain.h"
#include "stubcontrol.h"

#include <sys/socket.h>

#include "secmode.h"

class TestSecMode : public CPPUNIT_NS::TestFixture
{
	CPPUNIT_TEST_SUITE(TestSecMode);
	CPPUNIT_TEST(testNegotiateTls);
	CPPUNIT_TEST(testNegotiateSsl);
	CPPUNIT_TEST(testAuthRefused);
	CPPUNIT_TEST(testLoginFailsAfterHandshake);
	CPPUNIT_TEST(testHandshakeFails);
	CPPUNIT_TEST(testPbszSentOnce);
	CPPUNIT_TEST(testInvalidProtectionLevel);
	CPPUNIT_TEST(testSscnNeedsProtP);
	CPPUNIT_TEST(testSscnOnOff);
	CPPUNIT_TEST(testClearCommandChannel);
	CPPUNIT_TEST(testClearCommandChannelRefused);
	CPPUNIT_TEST(testClearCommandChannelNotSecure);
	CPPUNIT_TEST(testCpsvRefusedWhileSscn);
	CPPUNIT_TEST(testDataRole);
	CPPUNIT_TEST(testWrapWithoutProtection);
	CPPUNIT_TEST(testWrapServerNeedsCertificate);
	CPPUNIT_TEST_SUITE_END();

protected:
	void testNegotiateTls();
	void testNegotiateSsl();
	void testAuthRefused();
	void testLoginFailsAfterHandshake();
	void testHandshakeFails();
	void testPbszSentOnce();
	void testInvalidProtectionLevel();
	void testSscnNeedsProtP();
	void testSscnOnOff();
	void testClearCommandChannel();
	void testClearCommandChannelRefused();
	void testClearCommandChannelNotSecure();
	void testCpsvRefusedWhileSscn();
	void testDataRole();
	void testWrapWithoutProtection();
	void testWrapServerNeedsCertificate();
};

CPPUNIT_TEST_SUITE_REGISTRATION(TestSecMode);

/* script a successful AUTH/login/PBSZ/PROT P exchange */
static void
negotiate(stubcontrol &ctl, secmode &sec)
{
	ctl.Queue("234 AUTH TLS successful");
	ctl.Queue("200 PBSZ=0");
	ctl.Queue("200 Protection set to Private");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.NegotiateTLS(secmode::tls, "anonymous", "guest@"));
	ctl.sent.clear();
	ctl.sentsecure.clear();
}

void
TestSecMode::testNegotiateTls()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());

	ctl.Queue("234 AUTH TLS successful");
	ctl.Queue("200 PBSZ=0");
	ctl.Queue("200 Protection set to Private");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.NegotiateTLS(secmode::tls, "anonymous", "guest@"));
	CPPUNIT_ASSERT_EQUAL(std::string("AUTH TLS|LOGIN anonymous|PBSZ 0|PROT P"), ctl.Sent());
	CPPUNIT_ASSERT_EQUAL(1, ctl.tlsstarts);

	// everything after AUTH went over TLS
	CPPUNIT_ASSERT(!ctl.sentsecure[0]);
	CPPUNIT_ASSERT(ctl.sentsecure[1]);
	CPPUNIT_ASSERT(ctl.sentsecure[3]);

	CPPUNIT_ASSERT(sec.ControlSecure());
	CPPUNIT_ASSERT(sec.DataProtected());
	CPPUNIT_ASSERT_EQUAL('P', sec.ProtectionLevel());
	CPPUNIT_ASSERT(!sec.SSCN());
}

void
TestSecMode::testNegotiateSsl()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());

	ctl.Queue("234 AUTH SSL successful");
	ctl.Queue("200 PBSZ=0");
	ctl.Queue("200 Protection set to Private");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.NegotiateTLS(secmode::ssl, "user", "secret"));
	CPPUNIT_ASSERT_EQUAL(std::string("AUTH SSL"), ctl.sent[0]);
}

void
TestSecMode::testAuthRefused()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());

	ctl.Queue("500 AUTH not understood");
	CPPUNIT_ASSERT_EQUAL(secmode::replyerror, sec.NegotiateTLS(secmode::tls, "user", "secret"));
	CPPUNIT_ASSERT_EQUAL(0, ctl.tlsstarts);
	CPPUNIT_ASSERT(!sec.ControlSecure());
	CPPUNIT_ASSERT_EQUAL(std::string("500 AUTH not understood"), std::string(sec.LastError()));

	// connection gone
	CPPUNIT_ASSERT_EQUAL(secmode::ioerror, sec.NegotiateTLS(secmode::tls, "user", "secret"));
}

void
TestSecMode::testLoginFailsAfterHandshake()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());

	ctl.loginok = false;
	ctl.Queue("234 AUTH TLS successful");
	CPPUNIT_ASSERT_EQUAL(secmode::autherror, sec.NegotiateTLS(secmode::tls, "user", "wrong"));
	CPPUNIT_ASSERT_EQUAL(std::string("AUTH TLS|LOGIN user"), ctl.Sent());

	// the channel itself is encrypted, no protection was set up
	CPPUNIT_ASSERT(sec.ControlSecure());
	CPPUNIT_ASSERT(!sec.DataProtected());
}

void
TestSecMode::testHandshakeFails()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());

	ctl.tlsok = false;
	ctl.Queue("234 AUTH TLS successful");
	CPPUNIT_ASSERT_EQUAL(secmode::tlserror, sec.NegotiateTLS(secmode::tls, "user", "secret"));
	CPPUNIT_ASSERT_EQUAL(std::string("AUTH TLS"), ctl.Sent());
	CPPUNIT_ASSERT(!sec.ControlSecure());
}

void
TestSecMode::testPbszSentOnce()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());

	negotiate(ctl, sec);

	ctl.Queue("200 Protection set to Clear");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.SetProtectionLevel('C'));
	ctl.Queue("200 Protection set to Private");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.SetProtectionLevel('P'));
	CPPUNIT_ASSERT_EQUAL(std::string("PROT C|PROT P"), ctl.Sent());
	CPPUNIT_ASSERT(sec.DataProtected());
}

void
TestSecMode::testInvalidProtectionLevel()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());

	CPPUNIT_ASSERT_EQUAL(secmode::refused, sec.SetProtectionLevel('X'));
	CPPUNIT_ASSERT_EQUAL(secmode::refused, sec.SetProtectionLevel('\0'));
	CPPUNIT_ASSERT(ctl.sent.empty());

	// refused by the server, the level stays as it was
	ctl.Queue("200 PBSZ=0");
	ctl.Queue("536 Requested PROT level not supported");
	CPPUNIT_ASSERT_EQUAL(secmode::replyerror, sec.SetProtectionLevel('E'));
	CPPUNIT_ASSERT_EQUAL('C', sec.ProtectionLevel());
}

void
TestSecMode::testSscnNeedsProtP()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());
	ftpreply reply;

	CPPUNIT_ASSERT_EQUAL(secmode::refused, sec.ToggleSSCN(true, reply));
	CPPUNIT_ASSERT(ctl.sent.empty());
	CPPUNIT_ASSERT(reply.Empty());
	CPPUNIT_ASSERT(!sec.SSCN());
}

void
TestSecMode::testSscnOnOff()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());
	ftpreply reply;

	negotiate(ctl, sec);

	ctl.Queue("200 SSCN:CLIENT METHOD");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.ToggleSSCN(true, reply));
	CPPUNIT_ASSERT(sec.SSCN());
	ctl.Queue("200 SSCN:SERVER METHOD");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.ToggleSSCN(false, reply));
	CPPUNIT_ASSERT(!sec.SSCN());
	CPPUNIT_ASSERT_EQUAL(std::string("SSCN ON|SSCN OFF"), ctl.Sent());

	// a server without SSCN
	ctl.Queue("500 'SSCN ON': command not understood");
	CPPUNIT_ASSERT_EQUAL(secmode::replyerror, sec.ToggleSSCN(true, reply));
	CPPUNIT_ASSERT(!sec.SSCN());
	CPPUNIT_ASSERT_EQUAL(500, reply.Code());
}

void
TestSecMode::testClearCommandChannel()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());
	ftpreply reply;

	negotiate(ctl, sec);

	ctl.Queue("200 CCC command successful");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.ClearCommandChannel(reply));
	CPPUNIT_ASSERT_EQUAL(1, ctl.tlsstops);
	CPPUNIT_ASSERT(!sec.ControlSecure());

	// data protection is a separate matter
	CPPUNIT_ASSERT(sec.DataProtected());

	ctl.Queue("200 SSCN:CLIENT METHOD");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.ToggleSSCN(true, reply));
	CPPUNIT_ASSERT_EQUAL(std::string("CCC|SSCN ON"), ctl.Sent());
	CPPUNIT_ASSERT(ctl.sentsecure[0]);
	CPPUNIT_ASSERT(!ctl.sentsecure[1]);
}

void
TestSecMode::testClearCommandChannelRefused()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());
	ftpreply reply;

	negotiate(ctl, sec);

	ctl.Queue("533 CCC not allowed for security reasons");
	CPPUNIT_ASSERT_EQUAL(secmode::replyerror, sec.ClearCommandChannel(reply));
	CPPUNIT_ASSERT_EQUAL(533, reply.Code());
	CPPUNIT_ASSERT_EQUAL(0, ctl.tlsstops);
	CPPUNIT_ASSERT(sec.ControlSecure());
}

void
TestSecMode::testClearCommandChannelNotSecure()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());
	ftpreply reply;

	CPPUNIT_ASSERT_EQUAL(secmode::refused, sec.ClearCommandChannel(reply));
	CPPUNIT_ASSERT(ctl.sent.empty());
}

void
TestSecMode::testCpsvRefusedWhileSscn()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());
	ftpreply reply;

	negotiate(ctl, sec);

	ctl.Queue("227 Entering Passive Mode (10,0,0,1,195,80)");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.Cpsv(reply));
	CPPUNIT_ASSERT_EQUAL(227, reply.Code());

	ctl.Queue("200 SSCN:CLIENT METHOD");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.ToggleSSCN(true, reply));
	CPPUNIT_ASSERT_EQUAL(secmode::refused, sec.Cpsv(reply));
	CPPUNIT_ASSERT_EQUAL(std::string("CPSV|SSCN ON"), ctl.Sent());
}

void
TestSecMode::testDataRole()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());
	ftpreply reply;

	CPPUNIT_ASSERT_EQUAL(tlscontext::client, sec.DataRole(true));
	CPPUNIT_ASSERT_EQUAL(tlscontext::server, sec.DataRole(false));

	negotiate(ctl, sec);
	ctl.Queue("200 SSCN:CLIENT METHOD");
	CPPUNIT_ASSERT_EQUAL(secmode::ok, sec.ToggleSSCN(true, reply));
	CPPUNIT_ASSERT_EQUAL(tlscontext::server, sec.DataRole(true));
	CPPUNIT_ASSERT_EQUAL(tlscontext::server, sec.DataRole(false));
}

void
TestSecMode::testWrapWithoutProtection()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());
	tlsstream data;

	// no socket at all, still nothing to do without PROT P
	CPPUNIT_ASSERT_EQUAL(1, sec.WrapDataConnection(data, tlscontext::client));
}

void
TestSecMode::testWrapServerNeedsCertificate()
{
	stubcontrol ctl;
	secmode sec(ctl, tlsconfig());
	int fds[2];

	negotiate(ctl, sec);

	CPPUNIT_ASSERT_EQUAL(0, socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
	tlsstream data(fds[0]);
	tlsstream peer(fds[1]);

	CPPUNIT_ASSERT_EQUAL(0, sec.WrapDataConnection(data, tlscontext::server));
	CPPUNIT_ASSERT(std::string(sec.LastError()).find("certificate") != std::string::npos);
}

int
main(int, char *[])
{
	return runTests();
}
