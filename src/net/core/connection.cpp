#include "connection.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <utility>

namespace wordgrid::network::core {

Connection::Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks)
    : m_socket(std::move(socket)), m_strand(asio::make_strand(m_socket.get_executor())), m_connectionId(connectionId), m_callbacks(std::move(callbacks)) {
}

void Connection::start() {
	if (m_open.exchange(true)) {
		return;
	}
	asio::post(m_strand, [self = shared_from_this()] { self->readHeader(); });
}

void Connection::stop() {
	if (!m_open.exchange(false)) {
		return;
	}
	asio::post(m_strand, [self = shared_from_this()] {
		asio::error_code ec;
		self->m_socket.shutdown(asio::socket_base::shutdown_both, ec);
		self->m_socket.close(ec);
	});
}

void Connection::send(const Message& message) {
	if (!m_open || message.size() > MAX_PAYLOAD_BYTES) {
		return;
	}

	asio::post(m_strand, [self = shared_from_this(), message] {
		const bool idle = self->m_writeQueue.empty();
		self->m_writeQueue.emplace_back(FrameHeader{toNetworkOrder(static_cast<std::uint32_t>(message.size()))}, message);
		if (idle) {
			self->writeNext();
		}
	});
}

ConnectionId Connection::connectionId() const {
	return m_connectionId;
}

void Connection::readHeader() {
	asio::async_read(m_socket, asio::buffer(&m_readHeader, sizeof(FrameHeader)),
	                 asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                 if (ec || !self->m_open) {
			                 self->fail();
			                 return;
		                 }

		                 const auto payloadSize = fromNetworkOrder(self->m_readHeader.payloadSize);
		                 if (payloadSize > MAX_PAYLOAD_BYTES) {
			                 self->fail();
			                 return;
		                 }
		                 self->readPayload(payloadSize);
	                 }));
}

void Connection::readPayload(std::uint32_t payloadSize) {
	m_readBuffer.assign(payloadSize, '\0');
	if (payloadSize == 0u) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(*this, m_readBuffer);
		}
		readHeader();
		return;
	}

	asio::async_read(m_socket, asio::buffer(m_readBuffer.data(), m_readBuffer.size()),
	                 asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                 if (ec || !self->m_open) {
			                 self->fail();
			                 return;
		                 }

		                 if (self->m_callbacks.onMessage) {
			                 self->m_callbacks.onMessage(*self, self->m_readBuffer);
		                 }
		                 self->readHeader();
	                 }));
}

void Connection::writeNext() {
	if (m_writeQueue.empty() || !m_open) {
		return;
	}

	auto& [header, payload]                   = m_writeQueue.front();
	std::array<asio::const_buffer, 2> buffers = {asio::buffer(&header, sizeof(FrameHeader)), asio::buffer(payload.data(), payload.size())};

	asio::async_write(m_socket, buffers, asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                  if (ec) {
			                  self->fail();
			                  return;
		                  }
		                  self->m_writeQueue.pop_front();
		                  self->writeNext();
	                  }));
}

void Connection::fail() {
	if (!m_open.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);

	if (m_callbacks.onDisconnect) {
		m_callbacks.onDisconnect(*this);
	}
}

} // namespace wordgrid::network::core
