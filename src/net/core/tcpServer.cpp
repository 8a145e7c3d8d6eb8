#include "network/core/tcpServer.hpp"

#include "connection.hpp"

#include <asio.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

namespace wordgrid::network::core {

class TcpServer::Implementation {
public:
	explicit Implementation(std::uint16_t port);

	void connect(Callbacks callbacks);
	bool start();
	void stop();

	bool send(ConnectionId connectionId, const Message& message);

private:
	bool openAcceptor(); //!< Open, bind and listen without throwing.
	void doAccept();
	void addConnection(asio::ip::tcp::socket socket);

private:
	const std::uint16_t m_port;

	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;

	std::thread m_ioThread;
	std::atomic<bool> m_running{false};

	Callbacks m_callbacks;

	std::mutex m_connectionsMutex;
	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections;
	ConnectionId m_nextConnectionId{1u};
};

TcpServer::Implementation::Implementation(std::uint16_t port) : m_port(port), m_acceptor(m_ioContext) {
}

void TcpServer::Implementation::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

bool TcpServer::Implementation::start() {
	if (m_running.exchange(true)) {
		return true;
	}
	if (!openAcceptor()) {
		m_running = false;
		return false;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });
	return true;
}

void TcpServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}

	// Close everything on the IO thread, then let run() drain the cancelled operations.
	asio::post(m_ioContext, [this, connections = std::move(connections)]() {
		asio::error_code ec;
		m_acceptor.cancel(ec);
		m_acceptor.close(ec);
		for (const auto& [id, connection]: connections) {
			connection->stop();
		}
	});

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
}

bool TcpServer::Implementation::send(ConnectionId connectionId, const Message& message) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it == m_connections.end()) {
		return false;
	}
	it->second->send(message);
	return true;
}

bool TcpServer::Implementation::openAcceptor() {
	// Stay in error_code land: a taken port is an expected failure.
	asio::error_code ec;
	m_acceptor.open(asio::ip::tcp::v4(), ec);
	if (!ec) {
		m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	}
	if (!ec) {
		m_acceptor.bind(asio::ip::tcp::endpoint(asio::ip::tcp::v4(), m_port), ec);
	}
	if (!ec) {
		m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
	}
	if (ec) {
		asio::error_code ignored;
		m_acceptor.close(ignored);
		return false;
	}
	return true;
}

void TcpServer::Implementation::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (!ec) {
			addConnection(std::move(socket));
		}
		doAccept();
	});
}

void TcpServer::Implementation::addConnection(asio::ip::tcp::socket socket) {
	Connection::Callbacks callbacks;
	callbacks.onMessage = [this](Connection& connection, const Message& message) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(connection.connectionId(), message);
		}
	};
	callbacks.onDisconnect = [this](Connection& connection) {
		const auto connectionId = connection.connectionId();
		{
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(connectionId);
		}
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(connectionId);
		}
	};

	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		const auto connectionId = m_nextConnectionId++;
		connection              = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
		m_connections.emplace(connectionId, connection);
	}

	// Signal before the first read so the connect event is always queued ahead of any message.
	if (m_callbacks.onConnect) {
		m_callbacks.onConnect(connection->connectionId());
	}
	connection->start();
}


TcpServer::TcpServer(std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(port)) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::connect(Callbacks callbacks) {
	m_pimpl->connect(std::move(callbacks));
}

bool TcpServer::start() {
	return m_pimpl->start();
}

void TcpServer::stop() {
	m_pimpl->stop();
}

bool TcpServer::send(ConnectionId connectionId, const Message& message) {
	return m_pimpl->send(connectionId, message);
}

} // namespace wordgrid::network::core
