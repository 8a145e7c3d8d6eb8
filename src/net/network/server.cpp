#include "network/server.hpp"

#include "Logging.hpp"
#include "SafeQueue.hpp"
#include "channelRegistry.hpp"
#include "network/channels.hpp"
#include "network/core/tcpServer.hpp"
#include "serverEvents.hpp"
#include "sessionManager.hpp"

#include <atomic>
#include <format>
#include <thread>

namespace wordgrid::network {

class Server::Implementation {
public:
	explicit Implementation(std::uint16_t port);

	bool start();
	void stop();
	bool registerHandler(IServerHandler* handler);

	std::size_t publish(const Channel& channel, const ServerEvent& event);
	bool send(SessionId sessionId, const ServerEvent& event);

	std::size_t subscriberCount(const Channel& channel) const;

private:
	void serverLoop();                                //!< Server thread: drain queue and act.
	void processEvent(const ServerQueueEvent& event); //!< Server loop calls this. Reads event type and distributes.

private:
	// Network callbacks (run on the IO thread) just enqueue events.
	void onClientConnected(core::ConnectionId connectionId);
	void onClientMessage(core::ConnectionId connectionId, const core::Message& payload);
	void onClientDisconnected(core::ConnectionId connectionId);

private:
	// Processing of server events.
	void processClientMessage(const ServerQueueEvent& event);    //!< Translate payload to network event and handle.
	void processClientConnect(const ServerQueueEvent& event);    //!< Creates session.
	void processClientDisconnect(const ServerQueueEvent& event); //!< Destroys session and its subscriptions.

	void handleClientEvent(SessionId sessionId, const ClientIdentify& event);
	void handleClientEvent(SessionId sessionId, const ClientSubscribe& event);
	void handleClientEvent(SessionId sessionId, const ClientUnsubscribe& event);
	void handleClientEvent(SessionId sessionId, const ClientPlayerAction& event);
	void handleClientEvent(SessionId sessionId, const ClientRequest& event);

private:
	std::atomic<bool> m_isRunning{false};
	std::thread m_serverThread;

	SessionManager m_sessionManager;
	ChannelRegistry m_channels;
	core::TcpServer m_network;

	IServerHandler* m_handler{nullptr};       //!< The class that will handle server events.
	SafeQueue<ServerQueueEvent> m_eventQueue; //!< Event queue between network threads and server thread.
};

Server::Implementation::Implementation(std::uint16_t port) : m_network{port} {
	// Wire up network callbacks but keep them thin: they only enqueue events.
	core::TcpServer::Callbacks callbacks;
	callbacks.onConnect    = [this](core::ConnectionId connectionId) { onClientConnected(connectionId); };
	callbacks.onMessage    = [this](core::ConnectionId connectionId, const core::Message& payload) { onClientMessage(connectionId, payload); };
	callbacks.onDisconnect = [this](core::ConnectionId connectionId) { onClientDisconnected(connectionId); };
	m_network.connect(std::move(callbacks));
}

bool Server::Implementation::start() {
	if (m_isRunning.exchange(true)) {
		return true;
	}

	// Network runs on its own IO thread; serverLoop drains the queue on its own thread.
	if (!m_network.start()) {
		m_isRunning = false;
		return false;
	}
	m_serverThread = std::thread([this] { serverLoop(); });
	return true;
}

void Server::Implementation::stop() {
	// Wake serverLoop and stop network.
	if (m_isRunning.exchange(false)) {
		m_eventQueue.Push(ServerQueueEvent{.type = ServerQueueEventType::Shutdown});
	}
	m_network.stop();
	m_eventQueue.Release();

	if (m_serverThread.joinable()) {
		m_serverThread.join();
	}
}

bool Server::Implementation::registerHandler(IServerHandler* handler) {
	if (m_handler) {
		return false;
	}
	m_handler = handler;
	return true;
}

std::size_t Server::Implementation::publish(const Channel& channel, const ServerEvent& event) {
	const auto message = toMessage(event);

	std::size_t receivers = 0u;
	m_channels.forEachSubscriber(channel, [&](SessionId sessionId) {
		const auto connectionId = m_sessionManager.connectionId(sessionId);
		if (connectionId && m_network.send(*connectionId, message)) {
			++receivers;
		}
	});

	Logger().Log(Logging::LogLevel::Debug, std::format("[Server] Published on '{}' to {} session(s).", channel, receivers));
	return receivers;
}

bool Server::Implementation::send(SessionId sessionId, const ServerEvent& event) {
	const auto connectionId = m_sessionManager.connectionId(sessionId);
	if (!connectionId) {
		return false;
	}
	return m_network.send(*connectionId, toMessage(event));
}

std::size_t Server::Implementation::subscriberCount(const Channel& channel) const {
	return m_channels.subscriberCount(channel);
}

void Server::Implementation::onClientConnected(core::ConnectionId connectionId) {
	m_eventQueue.Push(ServerQueueEvent{.type = ServerQueueEventType::ClientConnected, .connectionId = connectionId});
}

void Server::Implementation::onClientMessage(core::ConnectionId connectionId, const core::Message& payload) {
	m_eventQueue.Push(ServerQueueEvent{
	        .type         = ServerQueueEventType::ClientMessage,
	        .connectionId = connectionId,
	        .payload      = payload,
	});
}

void Server::Implementation::onClientDisconnected(core::ConnectionId connectionId) {
	m_eventQueue.Push(ServerQueueEvent{.type = ServerQueueEventType::ClientDisconnected, .connectionId = connectionId});
}

void Server::Implementation::serverLoop() {
	while (m_isRunning) {
		try {
			const auto event = m_eventQueue.Pop();
			processEvent(event);
		} catch (const QueueReleased&) {
			break;
		}
	}
}

void Server::Implementation::processEvent(const ServerQueueEvent& event) {
	switch (event.type) {
	case ServerQueueEventType::ClientConnected:
		processClientConnect(event);
		break;
	case ServerQueueEventType::ClientDisconnected:
		processClientDisconnect(event);
		break;
	case ServerQueueEventType::ClientMessage:
		processClientMessage(event);
		break;
	case ServerQueueEventType::Shutdown:
		m_isRunning = false;
		break;
	}
}

void Server::Implementation::processClientConnect(const ServerQueueEvent& event) {
	const auto sessionId = m_sessionManager.add(event.connectionId);
	Logger().Log(Logging::LogLevel::Info, std::format("[Server] Connection {} opened session {}.", event.connectionId, sessionId));
}

void Server::Implementation::processClientMessage(const ServerQueueEvent& event) {
	const auto sessionId = m_sessionManager.sessionId(event.connectionId);
	if (!sessionId) {
		return;
	}

	// Server event message contains a network event. Parse and handle.
	const auto networkEvent = fromClientMessage(event.payload);
	if (!networkEvent) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Server] Dropped unparsable message of session {}.", *sessionId));
		return;
	}

	std::visit([&](const auto& e) { handleClientEvent(*sessionId, e); }, *networkEvent);
}

void Server::Implementation::processClientDisconnect(const ServerQueueEvent& event) {
	const auto sessionId = m_sessionManager.sessionId(event.connectionId);
	if (!sessionId) {
		return;
	}

	const auto identity = m_sessionManager.identity(*sessionId);
	m_channels.removeSession(*sessionId);
	m_sessionManager.remove(*sessionId);
	Logger().Log(Logging::LogLevel::Info, std::format("[Server] Session {} closed.", *sessionId));

	if (m_handler) {
		m_handler->onClientDisconnected(*sessionId, identity);
	}
}

void Server::Implementation::handleClientEvent(SessionId sessionId, const ClientIdentify& event) {
	if (event.userId.empty()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Server] Session {} sent identify without user id.", sessionId));
		return;
	}

	const ClientIdentity identity{.userId = event.userId, .username = event.username};
	m_sessionManager.identify(sessionId, identity);
	Logger().Log(Logging::LogLevel::Info, std::format("[Server] Session {} identified as '{}'.", sessionId, identity.userId));

	if (m_handler) {
		m_handler->onClientIdentified(sessionId, identity);
	}
}

void Server::Implementation::handleClientEvent(SessionId sessionId, const ClientSubscribe& event) {
	if (!m_sessionManager.identity(sessionId)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Server] Session {} subscribed to '{}' before identifying.", sessionId, event.channel));
		return;
	}

	m_channels.subscribe(sessionId, event.channel);
}

void Server::Implementation::handleClientEvent(SessionId sessionId, const ClientUnsubscribe& event) {
	m_channels.unsubscribe(sessionId, event.channel);
}

void Server::Implementation::handleClientEvent(SessionId sessionId, const ClientPlayerAction& event) {
	const auto identity = m_sessionManager.identity(sessionId);
	if (!identity) {
		return;
	}

	// Ephemeral: relayed as is, never touches game state.
	const auto channel = matchChannel(event.matchId);
	publish(channel, ServerPlayerAction{
	                         .channel  = channel,
	                         .playerId = identity->userId,
	                         .username = identity->username,
	                         .action   = event.action,
	                 });
}

void Server::Implementation::handleClientEvent(SessionId sessionId, const ClientRequest& event) {
	const auto identity = m_sessionManager.identity(sessionId);
	if (!identity) {
		send(sessionId, ServerReply{.requestId = requestIdOf(event), .error = std::string{ERROR_NOT_IDENTIFIED}});
		return;
	}

	if (m_handler) {
		m_handler->onClientRequest(sessionId, *identity, event);
	}
}


Server::Server() : m_pimpl(std::make_unique<Implementation>(core::DEFAULT_PORT)) {
}

Server::Server(std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(port)) {
}

Server::~Server() {
	stop();
}

bool Server::start() {
	return m_pimpl->start();
}

void Server::stop() {
	m_pimpl->stop();
}

bool Server::registerHandler(IServerHandler* handler) {
	return m_pimpl->registerHandler(handler);
}

std::size_t Server::publish(const Channel& channel, const ServerEvent& event) {
	return m_pimpl->publish(channel, event);
}

bool Server::send(SessionId sessionId, const ServerEvent& event) {
	return m_pimpl->send(sessionId, event);
}

std::size_t Server::subscriberCount(const Channel& channel) const {
	return m_pimpl->subscriberCount(channel);
}

} // namespace wordgrid::network
