#include "network/client.hpp"

#include "Logging.hpp"
#include "network/core/tcpClient.hpp"

#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <set>
#include <thread>

namespace wordgrid::network {

class Client::Implementation {
public:
	explicit Implementation(ClientOptions options);
	~Implementation();

	bool registerHandler(IClientHandler* handler);

	bool connect(const std::string& host, std::uint16_t port, const ClientIdentity& identity);
	void disconnect();
	bool isConnected() const;

	void subscribe(const Channel& channel);
	void unsubscribe(const Channel& channel);
	std::vector<Channel> subscriptions() const;

	std::optional<std::uint64_t> send(ClientRequest request);
	bool sendPlayerAction(const MatchId& matchId, const PlayerAction& action);

private:
	void connectionLoop();   //!< Background thread: read until the connection drops, then reconnect.
	void readLoop();         //!< Blocking reads until disconnect.
	bool waitAndReconnect(); //!< Returns false once the client was stopped.
	bool rehydrate();        //!< Send identify and every subscription. Marks the connection ready.

	bool sendEvent(const ClientEvent& event); //!< Caller holds m_mutex.

private:
	ClientOptions m_options;
	core::TcpClient m_client;

	std::string m_host;
	std::uint16_t m_port{core::DEFAULT_PORT};
	ClientIdentity m_identity;

	bool m_running{false};   //!< Connection loop active. Guarded by m_mutex.
	bool m_ready{false};     //!< Identified on the current connection. Guarded by m_mutex.
	std::set<Channel> m_channels;
	mutable std::mutex m_mutex;        //!< Orders outgoing messages and guards the state above.
	std::condition_variable m_wakeup;  //!< Cuts the reconnect wait short on disconnect.
	std::thread m_connectionThread;

	std::atomic<std::uint64_t> m_nextRequestId{1u};
	IClientHandler* m_handler{nullptr};
};

Client::Implementation::Implementation(ClientOptions options) : m_options(options) {
}

Client::Implementation::~Implementation() {
	disconnect();
}

bool Client::Implementation::registerHandler(IClientHandler* handler) {
	if (m_handler) {
		return false;
	}
	m_handler = handler;
	return true;
}

bool Client::Implementation::connect(const std::string& host, std::uint16_t port, const ClientIdentity& identity) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_running) {
			return false;
		}
		m_host     = host;
		m_port     = port;
		m_identity = identity;
	}
	if (m_connectionThread.joinable()) {
		m_connectionThread.join();
	}

	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (!m_client.connect(host, port)) {
			return false;
		}
		m_running = true;
	}
	if (!rehydrate()) {
		disconnect();
		return false;
	}
	if (m_handler) {
		m_handler->onConnected();
	}

	m_connectionThread = std::thread([this] { connectionLoop(); });
	return true;
}

void Client::Implementation::disconnect() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_running = false;
		m_ready   = false;

		// Unblocks a pending read on the connection thread.
		m_client.disconnect();
	}
	m_wakeup.notify_all();

	if (m_connectionThread.joinable() && m_connectionThread.get_id() != std::this_thread::get_id()) {
		m_connectionThread.join();
	}
}

bool Client::Implementation::isConnected() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_ready && m_client.isConnected();
}

void Client::Implementation::subscribe(const Channel& channel) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_channels.insert(channel).second && m_ready) {
		sendEvent(ClientSubscribe{.channel = channel});
	}
}

void Client::Implementation::unsubscribe(const Channel& channel) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_channels.erase(channel) != 0u && m_ready) {
		sendEvent(ClientUnsubscribe{.channel = channel});
	}
}

std::vector<Channel> Client::Implementation::subscriptions() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return {m_channels.begin(), m_channels.end()};
}

std::optional<std::uint64_t> Client::Implementation::send(ClientRequest request) {
	const auto requestId = m_nextRequestId++;
	std::visit([&](auto& r) { r.requestId = requestId; }, request);

	std::lock_guard<std::mutex> lock(m_mutex);
	if (!m_ready || !sendEvent(ClientEvent{std::move(request)})) {
		return {};
	}
	return requestId;
}

bool Client::Implementation::sendPlayerAction(const MatchId& matchId, const PlayerAction& action) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_ready && sendEvent(ClientPlayerAction{.matchId = matchId, .action = action});
}

void Client::Implementation::connectionLoop() {
	do {
		readLoop();

		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_ready = false;
			m_client.disconnect();
		}
		if (m_handler) {
			m_handler->onDisconnected();
		}
	} while (waitAndReconnect());
}

void Client::Implementation::readLoop() {
	while (true) {
		// TcpClient::read is blocking; this loop lives on its own thread.
		const auto message = m_client.read();
		if (!message) {
			return;
		}

		const auto event = fromServerMessage(*message);
		if (!event) {
			Logger().Log(Logging::LogLevel::Warning, "[Client] Dropped unparsable server message.");
			continue;
		}
		if (m_handler) {
			m_handler->onServerEvent(*event);
		}
	}
}

bool Client::Implementation::waitAndReconnect() {
	while (true) {
		{
			std::unique_lock<std::mutex> lock(m_mutex);
			if (m_wakeup.wait_for(lock, m_options.reconnectDelay, [this] { return !m_running; })) {
				return false;
			}

			// The socket only opens and closes under the lock, so disconnect() cannot interleave with it.
			Logger().Log(Logging::LogLevel::Info, std::format("[Client] Reconnecting to {}:{}.", m_host, m_port));
			if (!m_client.connect(m_host, m_port)) {
				continue;
			}
		}

		// Fails if disconnect() ran since the socket opened.
		if (rehydrate()) {
			if (m_handler) {
				m_handler->onConnected();
			}
			return true;
		}
		std::lock_guard<std::mutex> lock(m_mutex);
		m_client.disconnect();
	}
}

bool Client::Implementation::rehydrate() {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (!m_running) {
		return false;
	}

	// Server keeps no memory of a previous connection: announce who we are and every channel again.
	if (!sendEvent(ClientIdentify{.userId = m_identity.userId, .username = m_identity.username})) {
		return false;
	}
	for (const auto& channel : m_channels) {
		if (!sendEvent(ClientSubscribe{.channel = channel})) {
			return false;
		}
	}

	m_ready = true;
	Logger().Log(Logging::LogLevel::Info, std::format("[Client] Connected as '{}' with {} subscription(s).", m_identity.userId, m_channels.size()));
	return true;
}

bool Client::Implementation::sendEvent(const ClientEvent& event) {
	return m_client.send(toMessage(event));
}


Client::Client() : m_pimpl(std::make_unique<Implementation>(ClientOptions{})) {
}

Client::Client(ClientOptions options) : m_pimpl(std::make_unique<Implementation>(options)) {
}

Client::~Client() {
	disconnect();
}

bool Client::registerHandler(IClientHandler* handler) {
	return m_pimpl->registerHandler(handler);
}

bool Client::connect(const std::string& host, std::uint16_t port, const ClientIdentity& identity) {
	return m_pimpl->connect(host, port, identity);
}

void Client::disconnect() {
	m_pimpl->disconnect();
}

bool Client::isConnected() const {
	return m_pimpl->isConnected();
}

void Client::subscribe(const Channel& channel) {
	m_pimpl->subscribe(channel);
}

void Client::unsubscribe(const Channel& channel) {
	m_pimpl->unsubscribe(channel);
}

std::vector<Channel> Client::subscriptions() const {
	return m_pimpl->subscriptions();
}

std::optional<std::uint64_t> Client::send(ClientRequest request) {
	return m_pimpl->send(std::move(request));
}

bool Client::sendPlayerAction(const MatchId& matchId, const PlayerAction& action) {
	return m_pimpl->sendPlayerAction(matchId, action);
}

} // namespace wordgrid::network
