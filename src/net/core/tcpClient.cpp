#include "network/core/tcpClient.hpp"

#include <asio.hpp>
#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <atomic>
#include <mutex>
#include <utility>

namespace wordgrid::network::core {

class TcpClient::Implementation {
public:
	Implementation();

	bool connect(const std::string& host, std::uint16_t port);
	void disconnect();
	bool isConnected() const;

	bool send(const Message& message);
	std::optional<Message> read();

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_socket;

	std::mutex m_writeMutex; //!< Frames from different threads must not interleave.
	std::atomic<bool> m_isConnected{false};
};

TcpClient::Implementation::Implementation() : m_resolver(m_ioContext), m_socket(m_ioContext) {
}

bool TcpClient::Implementation::connect(const std::string& host, std::uint16_t port) {
	if (m_isConnected) {
		return false;
	}

	asio::error_code ec;
	const auto endpoints = m_resolver.resolve(host, std::to_string(port), ec);
	if (ec) {
		return false;
	}
	asio::connect(m_socket, endpoints, ec);
	if (ec) {
		asio::error_code ignored;
		m_socket.close(ignored);
		return false;
	}
	m_socket.set_option(asio::ip::tcp::no_delay(true), ec);

	m_isConnected = true;
	return true;
}

void TcpClient::Implementation::disconnect() {
	m_isConnected = false;

	// Shutdown wakes a reader blocked in read().
	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
}

bool TcpClient::Implementation::isConnected() const {
	return m_isConnected;
}

bool TcpClient::Implementation::send(const Message& message) {
	if (!m_isConnected || message.size() > MAX_PAYLOAD_BYTES) {
		return false;
	}

	const FrameHeader header{toNetworkOrder(static_cast<std::uint32_t>(message.size()))};
	const std::array<asio::const_buffer, 2> buffers = {asio::buffer(&header, sizeof(header)), asio::buffer(message.data(), message.size())};

	std::lock_guard<std::mutex> lock(m_writeMutex);
	asio::error_code ec;
	asio::write(m_socket, buffers, ec);
	if (ec) {
		m_isConnected = false;
		return false;
	}
	return true;
}

std::optional<Message> TcpClient::Implementation::read() {
	if (!m_isConnected) {
		return {};
	}

	FrameHeader header{};
	asio::error_code ec;
	asio::read(m_socket, asio::buffer(&header, sizeof(header)), ec);
	if (ec) {
		m_isConnected = false;
		return {};
	}

	const auto payloadSize = fromNetworkOrder(header.payloadSize);
	if (payloadSize > MAX_PAYLOAD_BYTES) {
		m_isConnected = false;
		return {};
	}

	Message payload(payloadSize, '\0');
	if (payloadSize > 0u) {
		asio::read(m_socket, asio::buffer(payload.data(), payload.size()), ec);
		if (ec) {
			m_isConnected = false;
			return {};
		}
	}
	return payload;
}


TcpClient::TcpClient() : m_pimpl(std::make_unique<Implementation>()) {
}

TcpClient::~TcpClient() {
	disconnect();
}

bool TcpClient::connect(const std::string& host, std::uint16_t port) {
	return m_pimpl->connect(host, port);
}

bool TcpClient::isConnected() const {
	return m_pimpl->isConnected();
}

void TcpClient::disconnect() {
	m_pimpl->disconnect();
}

bool TcpClient::send(const Message& message) {
	return m_pimpl->send(message);
}

std::optional<Message> TcpClient::read() {
	return m_pimpl->read();
}

} // namespace wordgrid::network::core
