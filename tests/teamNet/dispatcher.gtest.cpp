#include "protocol/error.hpp"
#include "teamNet/dispatcher.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>

namespace tc::gtest {

using namespace protocol;
using teamNet::Dispatcher;

class DispatcherTest : public ::testing::Test {
protected:
	DispatcherTest() : m_dispatcher(directory::Directory({"Red", "Blue"}, {"Busy", "Free"})) {
	}

	ServerMessage request(const ClientMessage& message, const network::Endpoint& sender) {
		return m_dispatcher.handle(sender, message.encode());
	}
	ServerMessage request(const ClientMessage& message) {
		return request(message, m_alice);
	}

	std::uint32_t registerUser(const std::string& name, const network::Endpoint& sender) {
		const auto reply = request(ClientMessage(ClientMessageType::NetIdRequest, Bytes(name.begin(), name.end())), sender);
		EXPECT_EQ(reply.type(), ServerMessageType::AckNewUser) << reply.bodyText();
		return reply.networkId();
	}

	static ClientMessage statusUpdate(std::uint32_t networkId, unsigned teamId, unsigned status) {
		return ClientMessage(ClientMessageType::StatusUpdate, networkId, teamId, status, emptyBody());
	}
	static ClientMessage teamStatusRequest(std::uint32_t networkId, unsigned teamId) {
		return ClientMessage(ClientMessageType::TeamStatusRequest, networkId, teamId, INACTIVE_STATUS, emptyBody());
	}

	Dispatcher m_dispatcher;
	const network::Endpoint m_alice{asio::ip::make_address_v4("127.0.0.1"), 40001};
	const network::Endpoint m_bob{asio::ip::make_address_v4("127.0.0.1"), 40002};
};

TEST_F(DispatcherTest, RegisterUsers) {
	const auto aliceReply = request(ClientMessage(ClientMessageType::NetIdRequest, Bytes{'A', 'l', 'i', 'c', 'e'}), m_alice);
	ASSERT_EQ(aliceReply.type(), ServerMessageType::AckNewUser);
	EXPECT_EQ(aliceReply.bodyText(), "0");

	const auto bobReply = request(ClientMessage(ClientMessageType::NetIdRequest, Bytes{'B', 'o', 'b'}), m_bob);
	ASSERT_EQ(bobReply.type(), ServerMessageType::AckNewUser);
	EXPECT_EQ(bobReply.bodyText(), "1");

	EXPECT_EQ(m_dispatcher.directory().userCount(), 2u);
}

TEST_F(DispatcherTest, StatusUpdateAndTeamStatus) {
	const auto alice = registerUser("Alice", m_alice);

	const auto ack = request(statusUpdate(alice, 0u, 1u));
	EXPECT_EQ(ack.type(), ServerMessageType::AckStatusUpdate);
	EXPECT_EQ(ack.body(), emptyBody());

	const auto report = request(teamStatusRequest(alice, 0u));
	ASSERT_EQ(report.type(), ServerMessageType::TeamStatus);

	const auto names    = report.userNames();
	const auto statuses = report.statusVector();
	ASSERT_EQ(names.size(), directory::MAX_TEAM_SIZE);
	ASSERT_EQ(statuses.size(), directory::MAX_TEAM_SIZE);

	const auto it = std::find(names.begin(), names.end(), "Alice");
	ASSERT_NE(it, names.end());
	EXPECT_EQ(statuses[static_cast<std::size_t>(it - names.begin())], 1u);
}

TEST_F(DispatcherTest, TeamStatusInvalidTeam) {
	const auto reply = request(teamStatusRequest(NETWORK_ID_LIMIT, 99u));
	ASSERT_EQ(reply.type(), ServerMessageType::Error);
	EXPECT_NE(reply.bodyText().find("Invalid Team ID: 99"), std::string::npos);
}

TEST_F(DispatcherTest, TeamStatusWithoutTeam) {
	const auto reply = request(teamStatusRequest(NETWORK_ID_LIMIT, TEAM_WILDCARD));
	ASSERT_EQ(reply.type(), ServerMessageType::Error);
	EXPECT_EQ(reply.bodyText(), "Invalid Team ID: 255");
}

TEST_F(DispatcherTest, MalformedDatagram) {
	const auto reply = m_dispatcher.handle(m_alice, Bytes{1, 0, 0});
	ASSERT_EQ(reply.type(), ServerMessageType::Error);
	EXPECT_EQ(reply.bodyText(), "Failed to parse malformed message");

	// Keeps serving afterwards
	EXPECT_EQ(registerUser("Alice", m_alice), 0u);
}

TEST_F(DispatcherTest, OversizedDatagram) {
	const auto reply = m_dispatcher.handle(m_alice, Bytes(MAX_SEGMENT_SIZE + 1, 1u));
	ASSERT_EQ(reply.type(), ServerMessageType::Error);
	EXPECT_EQ(reply.bodyText(), "Failed to parse malformed message");
	EXPECT_EQ(m_dispatcher.directory().userCount(), 0u);
}

TEST_F(DispatcherTest, UnknownMessageType) {
	const auto reply = m_dispatcher.handle(m_alice, Bytes{9, 0, 0, 0, 0, 0, EMPTY_BODY_BYTE});
	ASSERT_EQ(reply.type(), ServerMessageType::Error);
	EXPECT_NE(reply.bodyText().find("Invalid client message type"), std::string::npos);
}

TEST_F(DispatcherTest, InvalidUserName) {
	const auto reply = request(ClientMessage(ClientMessageType::NetIdRequest, Bytes{'A', '#', 'b'}));
	ASSERT_EQ(reply.type(), ServerMessageType::Error);
	EXPECT_NE(reply.bodyText().find("\"A#b\" is not a valid username"), std::string::npos);
	EXPECT_EQ(m_dispatcher.directory().userCount(), 0u);
}

TEST_F(DispatcherTest, StatusUpdateErrors) {
	const auto alice = registerUser("Alice", m_alice);

	EXPECT_EQ(request(statusUpdate(alice + 1, 0u, 0u)).type(), ServerMessageType::Error);
	EXPECT_EQ(request(statusUpdate(NETWORK_ID_LIMIT, 0u, 0u)).type(), ServerMessageType::Error);
	EXPECT_EQ(request(statusUpdate(alice, 2u, 0u)).type(), ServerMessageType::Error);
	EXPECT_EQ(request(statusUpdate(alice, 0u, directory::MAX_STATUS_COUNT)).type(), ServerMessageType::Error);

	// Nothing changed
	const auto* user = m_dispatcher.directory().lookupUser(alice);
	ASSERT_NE(user, nullptr);
	EXPECT_FALSE(user->hasTeam());
	EXPECT_EQ(user->status(), INACTIVE_STATUS);
}

TEST_F(DispatcherTest, RepeatedStatusUpdate) {
	const auto alice = registerUser("Alice", m_alice);

	for (int i = 0; i < 3; ++i) {
		EXPECT_EQ(request(statusUpdate(alice, 1u, 0u)).type(), ServerMessageType::AckStatusUpdate);
	}
	EXPECT_EQ(m_dispatcher.directory().team(1u).size(), 1u);
}

TEST_F(DispatcherTest, RepeatedNetIdRequestGetsSameId) {
	const auto first  = registerUser("Alice", m_alice);
	const auto second = registerUser("Alice", m_alice);
	EXPECT_EQ(first, second);
	EXPECT_EQ(m_dispatcher.directory().userCount(), 1u);

	// Same name from another endpoint is another user
	EXPECT_EQ(registerUser("Alice", m_bob), 1u);
	// Another name from the same endpoint too
	EXPECT_EQ(registerUser("Alicia", m_alice), 2u);
	EXPECT_EQ(m_dispatcher.directory().userCount(), 3u);
}

TEST_F(DispatcherTest, ServerDescription) {
	const auto reply = request(ClientMessage(ClientMessageType::ServerDescriptionRequest, emptyBody()));
	ASSERT_EQ(reply.type(), ServerMessageType::ServerDescription);
	EXPECT_EQ(reply, m_dispatcher.serverDescription());
	EXPECT_EQ(reply.teamNames(), (std::vector<std::string>{"Red", "Blue"}));
	EXPECT_EQ(reply.statusNames(), (std::vector<std::string>{"Busy", "Free"}));
}

TEST_F(DispatcherTest, LeaveTeam) {
	const auto alice = registerUser("Alice", m_alice);
	request(statusUpdate(alice, 0u, 1u));
	EXPECT_TRUE(m_dispatcher.directory().team(0u).contains(alice));

	EXPECT_EQ(request(statusUpdate(alice, TEAM_WILDCARD, INACTIVE_STATUS)).type(), ServerMessageType::AckStatusUpdate);
	EXPECT_FALSE(m_dispatcher.directory().team(0u).contains(alice));

	const auto names = request(teamStatusRequest(alice, 0u)).userNames();
	EXPECT_TRUE(std::all_of(names.begin(), names.end(), [](const auto& name) { return name.empty(); }));
}

TEST_F(DispatcherTest, JoinFullTeamIsAcknowledged) {
	for (unsigned i = 0; i < directory::MAX_TEAM_SIZE; ++i) {
		const network::Endpoint sender(asio::ip::make_address_v4("127.0.0.1"), static_cast<std::uint16_t>(41000 + i));
		const auto id = registerUser("User " + std::to_string(i), sender);
		ASSERT_EQ(request(statusUpdate(id, 0u, 0u), sender).type(), ServerMessageType::AckStatusUpdate);
	}

	const auto latecomer = registerUser("Latecomer", m_bob);
	for (int i = 0; i < 3; ++i) {
		EXPECT_EQ(request(statusUpdate(latecomer, 0u, 1u), m_bob).type(), ServerMessageType::AckStatusUpdate);
	}

	// Recorded, but not listed in the full roster
	const auto* user = m_dispatcher.directory().lookupUser(latecomer);
	ASSERT_NE(user, nullptr);
	EXPECT_EQ(user->teamId(), 0u);
	EXPECT_EQ(user->status(), 1u);

	const auto names = request(teamStatusRequest(latecomer, 0u), m_bob).userNames();
	EXPECT_EQ(std::count(names.begin(), names.end(), "Latecomer"), 0);
	EXPECT_EQ(std::count(names.begin(), names.end(), ""), 0);
}

TEST_F(DispatcherTest, RandomDatagramsAlwaysGetOneReply) {
	registerUser("Alice", m_alice);

	std::mt19937 rng(99u);
	for (int i = 0; i < 2000; ++i) {
		Bytes datagram(rng() % 40u);
		for (auto& byte: datagram) {
			byte = static_cast<std::uint8_t>(rng());
		}
		// Mostly known types and small IDs so the requests get past decoding.
		if (!datagram.empty() && rng() % 2u == 0u) {
			datagram[0] = static_cast<std::uint8_t>(1u + rng() % 4u);
		}
		if (datagram.size() > 3u && rng() % 2u == 0u) {
			datagram[1] = datagram[2] = 0u;
			datagram[3] = static_cast<std::uint8_t>(rng() % 3u);
		}

		ServerMessage reply(ServerMessageType::Error, emptyBody());
		ASSERT_NO_THROW(reply = m_dispatcher.handle(m_bob, datagram));
		EXPECT_FALSE(reply.body().empty());
		EXPECT_LE(reply.encode().size(), MAX_SEGMENT_SIZE);
	}
}

} // namespace tc::gtest
