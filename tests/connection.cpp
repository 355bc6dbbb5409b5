#include <gtest/gtest.h>

#include "mock_server.hpp"

#include <lsamp/client.hpp>
#include <lsamp/connection.hpp>

#include <sys/resource.h>
#include <sys/select.h>

using namespace lsamp;

TEST(Connection, LazyConnect)
{
	connection Conn("127.0.0.1", 7777);
	EXPECT_FALSE(Conn.connected());
	EXPECT_EQ(Conn.prefix(), "");
	Conn.connect();
	EXPECT_TRUE(Conn.connected());
	Conn.disconnect();
	EXPECT_FALSE(Conn.connected());
}

TEST(Connection, Prefix)
{
	connection Conn("127.0.0.1", 7777);
	Conn.connect();
	// 7777 is 0x1e61
	const std::string Expected("SAMP\x7f\x00\x00\x01\x61\x1e", 10);
	EXPECT_EQ(Conn.prefix(), Expected);
	EXPECT_EQ(Conn.header('i'), Expected + "i");
}

TEST(Connection, ResolvedAddressReplacesHost)
{
	connection Conn("localhost", 7777);
	EXPECT_EQ(Conn.host(), "localhost");
	Conn.connect();
	EXPECT_EQ(Conn.host(), "127.0.0.1");
	EXPECT_EQ(Conn.prefix().substr(4, 4), std::string("\x7f\x00\x00\x01", 4));

	// stays put across a reconnect
	Conn.disconnect();
	Conn.connect();
	EXPECT_EQ(Conn.host(), "127.0.0.1");
}

TEST(Connection, ClientAddress)
{
	client Client("localhost", 7777);
	EXPECT_EQ(Client.address(), "127.0.0.1:7777");
	EXPECT_TRUE(Client.conn().connected());
	EXPECT_EQ(Client.host(), "127.0.0.1");

	client Unresolvable("no-such-host.invalid", 7777);
	EXPECT_THROW(Unresolvable.address(), common::connection_error);
}

TEST(Connection, UnresolvableHost)
{
	connection Conn("no-such-host.invalid", 7777);
	EXPECT_THROW(Conn.connect(), common::connection_error);
	EXPECT_FALSE(Conn.connected());
}

TEST(Connection, SendsPrefixOpcodeAndPayload)
{
	std::string Received;
	CMockServer Server([&Received](CMockServer &Mock, const std::string &Request) {
		Received = Request;
		Mock.Reply(Request, "");
	});

	connection Conn("127.0.0.1", Server.Port());
	Conn.send('r', "abc");
	EXPECT_EQ(Conn.receive(Conn.header('r')), "");
	EXPECT_EQ(Received, Conn.prefix() + "rabc");
}

TEST(Connection, DiscardsOtherHeaders)
{
	CMockServer Server([](CMockServer &Mock, const std::string &Request) {
		Mock.SendRaw("garbage");
		Mock.SendRaw("SAMP");
		std::string Other = Request;
		Other[10] = 'c';
		Mock.SendRaw(Other + "players");
		Mock.Reply(Request, "rules");
	});

	connection Conn("127.0.0.1", Server.Port());
	Conn.send('r');
	EXPECT_EQ(Conn.receive(Conn.header('r')), "rules");
}

TEST(Connection, ReceiveDeadline)
{
	CMockServer Server([](CMockServer &Mock, const std::string &Request) {
		Mock.SendRaw("garbage");
		SleepMs(200);
		Mock.Reply(Request, "late");
	});

	connection Conn("127.0.0.1", Server.Port());
	Conn.send('i');
	std::string Body;
	common::usecs_t Start = common::now();
	EXPECT_FALSE(Conn.receive(Conn.header('i'), Start + 50000, Body));
	EXPECT_GE(common::now() - Start, 50000);

	EXPECT_TRUE(Conn.receive(Conn.header('i'), common::now() + 2000000, Body));
	EXPECT_EQ(Body, "late");
}

TEST(Connection, DeadlineInThePast)
{
	connection Conn("127.0.0.1", 7777);
	std::string Body;
	EXPECT_FALSE(Conn.receive("SAMP", common::now() - 1, Body));
}

TEST(Connection, RefusedIsConnectionError)
{
	// find a port nothing listens on
	uint16_t Port;
	{
		CMockServer Server([](CMockServer &, const std::string &) {});
		Port = Server.Port();
	}

	client Client("127.0.0.1", Port);
	Client.timeout(1000000);
	EXPECT_THROW(Client.ping(), common::connection_error);
}

TEST(Connection, WaitReadableAboveFdSetSize)
{
	const int HighFd = FD_SETSIZE + 16;

	rlimit Old;
	ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &Old), 0);
	if(Old.rlim_max != RLIM_INFINITY && Old.rlim_max <= static_cast<rlim_t>(HighFd))
		GTEST_SKIP() << "descriptor limit is too low";
	rlimit Raised = Old;
	if(Raised.rlim_cur != RLIM_INFINITY && Raised.rlim_cur <= static_cast<rlim_t>(HighFd))
		Raised.rlim_cur = HighFd + 1;
	ASSERT_EQ(setrlimit(RLIMIT_NOFILE, &Raised), 0);

	int Sock = socket(AF_INET, SOCK_DGRAM, 0);
	ASSERT_NE(Sock, -1);
	sockaddr_in Addr = {};
	Addr.sin_family = AF_INET;
	Addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	ASSERT_EQ(bind(Sock, reinterpret_cast<sockaddr *>(&Addr), sizeof(Addr)), 0);
	socklen_t Len = sizeof(Addr);
	ASSERT_EQ(getsockname(Sock, reinterpret_cast<sockaddr *>(&Addr), &Len), 0);
	ASSERT_EQ(dup2(Sock, HighFd), HighFd);
	close(Sock);

	EXPECT_FALSE(common::wait_readable(HighFd, 20000));
	ASSERT_EQ(sendto(HighFd, "x", 1, 0, reinterpret_cast<sockaddr *>(&Addr), sizeof(Addr)), 1);
	EXPECT_TRUE(common::wait_readable(HighFd, 1000000));

	close(HighFd);
	setrlimit(RLIMIT_NOFILE, &Old);
}
