#include <gtest/gtest.h>

#include "mock_server.hpp"

#include <lsamp/client.hpp>
#include <lsamp/query.hpp>

using namespace lsamp;

static query::server_info ExampleInfo()
{
	query::server_info Info;
	Info.password = true;
	Info.players = 12;
	Info.max_players = 500;
	Info.name = "Grand Larceny";
	Info.gamemode = "Freeroam";
	Info.language = "English";
	Info.name_encoding = Info.gamemode_encoding = Info.language_encoding = "windows-1252";
	return Info;
}

static query::player_list ExamplePlayers()
{
	query::player_list List(3);
	List[0].name = "Cheaterman";
	List[0].score = 1337;
	List[1].name = "[NB]Kalcor";
	List[1].score = -5;
	List[2].name = "";
	List[2].score = 0;
	return List;
}

static query::rule_list ExampleRules()
{
	query::rule_list List(3);
	List[0].name = "lagcomp";
	List[0].value = "On";
	List[1].name = "mapname";
	List[1].value = "San Andreas";
	List[2].name = "weburl";
	List[2].value = "";
	for(size_t i = 0; i < List.size(); ++i)
		List[i].encoding = "windows-1252";
	return List;
}

TEST(QueryParse, InfoRoundTrip)
{
	CFixedDetector Detector("windows-1252");
	const std::string Body = PackInfo(ExampleInfo());
	EXPECT_EQ(query::info::parse(Body, Detector), ExampleInfo());
}

TEST(QueryParse, InfoDecodesPerField)
{
	query::server_info Info = ExampleInfo();
	Info.name = "Caf\xe9";
	CFixedDetector Detector("windows-1252");
	query::server_info Parsed = query::info::parse(PackInfo(Info), Detector);
	EXPECT_EQ(Parsed.name, "Caf\xc3\xa9");
	EXPECT_EQ(Parsed.name_encoding, "windows-1252");
}

TEST(QueryParse, InfoTrailingBytes)
{
	CFixedDetector Detector("windows-1252");
	EXPECT_THROW(query::info::parse(PackInfo(ExampleInfo()) + "x", Detector), common::proto_error);
}

TEST(QueryParse, InfoTruncated)
{
	CFixedDetector Detector("windows-1252");
	const std::string Body = PackInfo(ExampleInfo());
	EXPECT_THROW(query::info::parse(Body.substr(0, Body.size() - 1), Detector), common::proto_error);
	EXPECT_THROW(query::info::parse("", Detector), common::proto_error);
}

TEST(QueryParse, PlayersRoundTrip)
{
	EXPECT_EQ(query::players::parse(PackPlayers(ExamplePlayers())), ExamplePlayers());
	EXPECT_EQ(query::players::parse(PackPlayers(query::player_list())), query::player_list());
}

TEST(QueryParse, PlayersCountMismatch)
{
	std::string Body = PackPlayers(ExamplePlayers());
	// claims one more player than there is
	Body[0] = 4;
	EXPECT_THROW(query::players::parse(Body), common::proto_error);
	// claims one fewer
	Body[0] = 2;
	EXPECT_THROW(query::players::parse(Body), common::proto_error);
}

TEST(QueryParse, RulesRoundTrip)
{
	CFixedDetector Detector("windows-1252");
	EXPECT_EQ(query::rules::parse(PackRules(ExampleRules()), Detector), ExampleRules());
}

TEST(QueryParse, RulesTrailingBytes)
{
	CFixedDetector Detector("windows-1252");
	EXPECT_THROW(query::rules::parse(PackRules(ExampleRules()) + std::string(1, '\0'), Detector), common::proto_error);
}

TEST(Query, Ping)
{
	CServerScript Script;
	Script.m_PingDelayMs = 30;
	CMockServer Server(Scripted(Script));

	client Client("127.0.0.1", Server.Port());
	common::usecs_t Latency = Client.ping();
	EXPECT_GE(Latency, 30000);
	EXPECT_LT(Latency, 2000000);
}

TEST(Query, PingIgnoresWrongNonce)
{
	CMockServer Server([](CMockServer &Mock, const std::string &Request) {
		std::string Wrong = Request;
		Wrong[Wrong.size() - 1] ^= 0x55;
		Mock.SendRaw(Wrong);
		// right nonce but something after it
		Mock.SendRaw(Request + "x");
		SleepMs(40);
		Mock.SendRaw(Request);
	});

	connection Conn("127.0.0.1", Server.Port());
	query::ping Ping(Conn);
	EXPECT_GE(Ping.latency(), 40000);
}

TEST(Query, PingTimeout)
{
	CMockServer Server([](CMockServer &, const std::string &) {});

	client Client("127.0.0.1", Server.Port());
	Client.timeout(50000);
	common::usecs_t Start = common::now();
	EXPECT_THROW(Client.ping(), common::timeout_error);
	EXPECT_GE(common::now() - Start, 50000);
}

TEST(Query, Info)
{
	CServerScript Script;
	Script.m_Info = PackInfo(ExampleInfo());
	CMockServer Server(Scripted(Script));

	CFixedDetector Detector("windows-1252");
	client Client("127.0.0.1", Server.Port());
	Client.detector(Detector);
	EXPECT_EQ(Client.info(), ExampleInfo());
}

TEST(Query, InfoDefaultDetector)
{
	CServerScript Script;
	Script.m_Info = PackInfo(ExampleInfo());
	CMockServer Server(Scripted(Script));

	client Client("127.0.0.1", Server.Port());
	query::server_info Info = Client.info();
	EXPECT_TRUE(Info.password);
	EXPECT_EQ(Info.players, 12);
	EXPECT_EQ(Info.max_players, 500);
	EXPECT_EQ(Info.name, "Grand Larceny");
	EXPECT_EQ(Info.gamemode, "Freeroam");
	EXPECT_EQ(Info.language, "English");
}

TEST(Query, Players)
{
	CServerScript Script;
	Script.m_Players = PackPlayers(ExamplePlayers());
	CMockServer Server(Scripted(Script));

	client Client("127.0.0.1", Server.Port());
	EXPECT_EQ(Client.players(), ExamplePlayers());
}

TEST(Query, Rules)
{
	CServerScript Script;
	Script.m_Rules = PackRules(ExampleRules());
	CMockServer Server(Scripted(Script));

	CFixedDetector Detector("windows-1252");
	client Client("127.0.0.1", Server.Port());
	Client.detector(Detector);
	EXPECT_EQ(Client.rules(), ExampleRules());
}

TEST(Query, MalformedReplyIsProtoError)
{
	CServerScript Script;
	Script.m_Players = PackPlayers(ExamplePlayers()) + "junk";
	CMockServer Server(Scripted(Script));

	client Client("127.0.0.1", Server.Port());
	EXPECT_THROW(Client.players(), common::proto_error);
}

TEST(Query, IsOmp)
{
	CServerScript Script;
	Script.m_PingDelayMs = 20;
	Script.m_AnswersOmp = true;
	CMockServer Server(Scripted(Script));

	client Client("127.0.0.1", Server.Port());
	EXPECT_TRUE(Client.is_omp());
}

TEST(Query, IsNotOmp)
{
	CServerScript Script;
	Script.m_PingDelayMs = 20;
	Script.m_AnswersOmp = false;
	CMockServer Server(Scripted(Script));

	client Client("127.0.0.1", Server.Port());
	common::usecs_t Start = common::now();
	EXPECT_FALSE(Client.is_omp());
	// one ping plus a window of five
	EXPECT_GE(common::now() - Start, 20000 * (1 + common::variance));
}

TEST(Query, OmpProbeIgnoresWrongNonce)
{
	CMockServer Server([](CMockServer &Mock, const std::string &Request) {
		if(CMockServer::Opcode(Request) == 'p')
		{
			SleepMs(20);
			Mock.SendRaw(Request);
		}
		else
		{
			std::string Wrong = Request;
			Wrong[Wrong.size() - 1] ^= 0x55;
			Mock.SendRaw(Wrong);
		}
	});

	client Client("127.0.0.1", Server.Port());
	EXPECT_FALSE(Client.is_omp());
}

TEST(Client, Settings)
{
	CServerScript Script;
	CMockServer Server(Scripted(Script));

	client Client("localhost", Server.Port());
	EXPECT_EQ(Client.host(), "localhost");
	EXPECT_EQ(Client.port(), Server.Port());
	EXPECT_EQ(Client.timeout(), 0);
	EXPECT_THROW(Client.timeout(-1), std::invalid_argument);

	Client.ping();
	EXPECT_EQ(Client.host(), "127.0.0.1");
	EXPECT_TRUE(Client.conn().connected());
	Client.disconnect();
	EXPECT_FALSE(Client.conn().connected());

	// reconnects on the next request
	Client.ping();
	EXPECT_TRUE(Client.conn().connected());
}

TEST(Client, ConcurrentClients)
{
	CServerScript Script;
	Script.m_PingDelayMs = 5;
	CMockServer Server(Scripted(Script));

	std::atomic<int> Answered(0);
	std::vector<std::thread> vThreads;
	for(int i = 0; i < 8; ++i)
	{
		vThreads.emplace_back([&Server, &Answered]() {
			client Client("127.0.0.1", Server.Port());
			Client.timeout(2000000);
			try
			{
				for(int j = 0; j < 10; ++j)
				{
					Client.ping();
					++Answered;
				}
			}
			catch(const common::error &e)
			{
				ADD_FAILURE() << e.what();
			}
		});
	}
	for(auto &Thread : vThreads)
		Thread.join();
	EXPECT_EQ(Answered.load(), 80);
}
