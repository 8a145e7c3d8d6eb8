#include "network/channels.hpp"
#include "network/client.hpp"
#include "network/core/tcpClient.hpp"
#include "network/server.hpp"
#include "recordingClient.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <thread>

namespace wordgrid::gtest {

//! Answers every request with an empty ok reply.
class EchoServerHandler final : public network::IServerHandler {
public:
	explicit EchoServerHandler(network::Server& server) : m_server(server) {
	}

	void onClientIdentified(network::SessionId, const network::ClientIdentity& identity) override {
		std::lock_guard<std::mutex> lock(m_mutex);
		identified.push_back(identity.userId);
	}
	void onClientDisconnected(network::SessionId, const std::optional<network::ClientIdentity>&) override {
	}
	void onClientRequest(network::SessionId sessionId, const network::ClientIdentity&, const network::ClientRequest& request) override {
		m_server.send(sessionId, network::ServerReply{.requestId = network::requestIdOf(request)});
	}

	std::size_t identifiedCount() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return identified.size();
	}

	std::vector<UserId> identified;

private:
	mutable std::mutex m_mutex;
	network::Server& m_server;
};

class PubSubTest : public ::testing::Test {
protected:
	static constexpr std::uint16_t PORT = 40211;

	void startServer() {
		m_server  = std::make_unique<network::Server>(PORT);
		m_handler = std::make_unique<EchoServerHandler>(*m_server);
		ASSERT_TRUE(m_server->registerHandler(m_handler.get()));
		ASSERT_TRUE(m_server->start());
	}
	void stopServer() {
		m_server->stop();
		m_server.reset();
		m_handler.reset();
	}

	void TearDown() override {
		if (m_server) {
			stopServer();
		}
	}

	static network::ClientOptions fastReconnect() {
		return network::ClientOptions{.reconnectDelay = std::chrono::milliseconds(100)};
	}

	std::unique_ptr<network::Server> m_server;
	std::unique_ptr<EchoServerHandler> m_handler;
};

TEST_F(PubSubTest, PublishReachesSubscribersOnly) {
	startServer();

	RecordingClient aliceEvents;
	RecordingClient bobEvents;
	network::Client alice;
	network::Client bob;
	ASSERT_TRUE(alice.registerHandler(&aliceEvents));
	ASSERT_TRUE(bob.registerHandler(&bobEvents));
	ASSERT_TRUE(alice.connect("127.0.0.1", PORT, {.userId = "alice", .username = "Alice"}));
	ASSERT_TRUE(bob.connect("127.0.0.1", PORT, {.userId = "bob", .username = "Bob"}));

	const auto channel = network::lobbyChannel("lobby-1");
	alice.subscribe(channel);
	ASSERT_TRUE(eventually([&] { return m_server->subscriberCount(channel) == 1u; }));

	EXPECT_EQ(m_server->publish(channel, network::ServerLobbyDeleted{.channel = channel, .lobbyId = "lobby-1"}), 1u);

	const auto received = aliceEvents.waitFor<network::ServerLobbyDeleted>();
	ASSERT_TRUE(received.has_value());
	EXPECT_EQ(received->channel, channel);
	EXPECT_EQ(received->lobbyId, "lobby-1");
	EXPECT_TRUE(bobEvents.events().empty());

	alice.unsubscribe(channel);
	ASSERT_TRUE(eventually([&] { return m_server->subscriberCount(channel) == 0u; }));
}

TEST_F(PubSubTest, ResubscribesAfterServerRestart) {
	startServer();

	RecordingClient events;
	network::Client client(fastReconnect());
	ASSERT_TRUE(client.registerHandler(&events));
	ASSERT_TRUE(client.connect("127.0.0.1", PORT, {.userId = "alice", .username = "Alice"}));

	const auto lobby = network::lobbyChannel("lobby-1");
	const auto match = network::matchChannel("match-1");
	client.subscribe(lobby);
	client.subscribe(match);
	ASSERT_TRUE(eventually([&] { return m_server->subscriberCount(lobby) == 1u && m_server->subscriberCount(match) == 1u; }));

	// The new server knows nothing about the old connection.
	stopServer();
	ASSERT_TRUE(events.waitForDisconnects(1u));
	startServer();

	ASSERT_TRUE(events.waitForConnects(2u));
	ASSERT_TRUE(eventually([&] { return m_server->subscriberCount(lobby) == 1u && m_server->subscriberCount(match) == 1u; }));
	EXPECT_EQ(m_handler->identifiedCount(), 1u);

	m_server->publish(lobby, network::ServerLobbyDeleted{.channel = lobby, .lobbyId = "lobby-1"});
	m_server->publish(match, network::ServerLobbyDeleted{.channel = match, .lobbyId = "lobby-1"});

	EXPECT_TRUE(events.waitFor<network::ServerLobbyDeleted>([&](const auto& e) { return e.channel == lobby; }).has_value());
	EXPECT_TRUE(events.waitFor<network::ServerLobbyDeleted>([&](const auto& e) { return e.channel == match; }).has_value());
}

TEST_F(PubSubTest, SendsAreDroppedWhileDisconnected) {
	startServer();

	RecordingClient events;
	network::Client client(network::ClientOptions{.reconnectDelay = std::chrono::milliseconds(200)});
	ASSERT_TRUE(client.registerHandler(&events));
	ASSERT_TRUE(client.connect("127.0.0.1", PORT, {.userId = "alice", .username = "Alice"}));

	stopServer();
	ASSERT_TRUE(events.waitForDisconnects(1u));

	EXPECT_FALSE(client.isConnected());
	EXPECT_FALSE(client.send(network::LeaveQueueRequest{}).has_value());

	// Subscriptions made while offline are sent after the reconnect.
	client.subscribe("lobby:late");
	EXPECT_EQ(client.subscriptions(), std::vector<network::Channel>{"lobby:late"});

	startServer();
	ASSERT_TRUE(events.waitForConnects(2u));
	ASSERT_TRUE(eventually([&] { return m_server->subscriberCount("lobby:late") == 1u; }));
}

TEST_F(PubSubTest, DisconnectStopsReconnectAttempts) {
	startServer();

	RecordingClient events;
	network::Client client(network::ClientOptions{.reconnectDelay = std::chrono::milliseconds(1)});
	ASSERT_TRUE(client.registerHandler(&events));
	ASSERT_TRUE(client.connect("127.0.0.1", PORT, {.userId = "alice", .username = "Alice"}));

	stopServer();
	ASSERT_TRUE(events.waitForDisconnects(1u));

	// Attempts run back to back against the closed port while disconnecting.
	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	client.disconnect();
	EXPECT_FALSE(client.isConnected());

	startServer();
	std::this_thread::sleep_for(std::chrono::milliseconds(200));
	EXPECT_EQ(events.connects(), 1u);
	EXPECT_EQ(m_handler->identifiedCount(), 0u);

	// The client can be connected again afterwards.
	ASSERT_TRUE(client.connect("127.0.0.1", PORT, {.userId = "alice", .username = "Alice"}));
	ASSERT_TRUE(events.waitForConnects(2u));
	EXPECT_TRUE(eventually([&] { return m_handler->identifiedCount() == 1u; }));
}

TEST_F(PubSubTest, RequestIsAnsweredWithItsId) {
	startServer();

	RecordingClient events;
	network::Client client;
	ASSERT_TRUE(client.registerHandler(&events));
	ASSERT_TRUE(client.connect("127.0.0.1", PORT, {.userId = "alice", .username = "Alice"}));

	const auto first  = client.send(network::ListLobbiesRequest{.serverId = DEFAULT_SERVER_ID});
	const auto second = client.send(network::ListLobbiesRequest{.serverId = DEFAULT_SERVER_ID});
	ASSERT_TRUE(first.has_value());
	ASSERT_TRUE(second.has_value());
	EXPECT_NE(*first, *second);

	const auto reply = events.waitFor<network::ServerReply>([&](const auto& r) { return r.requestId == *second; });
	ASSERT_TRUE(reply.has_value());
	EXPECT_FALSE(reply->error.has_value());
}

TEST_F(PubSubTest, RequestsNeedIdentify) {
	startServer();

	network::core::TcpClient raw;
	ASSERT_TRUE(raw.connect("127.0.0.1", PORT));

	const network::ClientRequest request = network::ListLobbiesRequest{.requestId = 42u, .serverId = DEFAULT_SERVER_ID};
	ASSERT_TRUE(raw.send(network::toMessage(request)));

	const auto message = raw.read();
	ASSERT_TRUE(message.has_value());
	const auto event = network::fromServerMessage(*message);
	ASSERT_TRUE(event.has_value());

	const auto& reply = std::get<network::ServerReply>(*event);
	EXPECT_EQ(reply.requestId, 42u);
	EXPECT_EQ(reply.error, std::string{network::ERROR_NOT_IDENTIFIED});

	raw.disconnect();
}

TEST_F(PubSubTest, PlayerActionIsRelayedOnMatchChannel) {
	startServer();

	RecordingClient aliceEvents;
	RecordingClient bobEvents;
	network::Client alice;
	network::Client bob;
	ASSERT_TRUE(alice.registerHandler(&aliceEvents));
	ASSERT_TRUE(bob.registerHandler(&bobEvents));
	ASSERT_TRUE(alice.connect("127.0.0.1", PORT, {.userId = "alice", .username = "Alice"}));
	ASSERT_TRUE(bob.connect("127.0.0.1", PORT, {.userId = "bob", .username = "Bob"}));

	const auto channel = network::matchChannel("match-1");
	bob.subscribe(channel);
	ASSERT_TRUE(eventually([&] { return m_server->subscriberCount(channel) == 1u; }));

	const network::PlayerAction action{.kind = "select", .selection = {Coord{0u, 0u}, Coord{0u, 1u}}};
	ASSERT_TRUE(alice.sendPlayerAction("match-1", action));

	const auto relayed = bobEvents.waitFor<network::ServerPlayerAction>();
	ASSERT_TRUE(relayed.has_value());
	EXPECT_EQ(relayed->channel, channel);
	EXPECT_EQ(relayed->playerId, "alice");
	EXPECT_EQ(relayed->username, "Alice");
	EXPECT_EQ(relayed->action, action);
}

} // namespace wordgrid::gtest
