#pragma once

#include "network/core/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <deque>
#include <functional>
#include <memory>

namespace wordgrid::network::core {

//! One accepted client socket. Reads frames in a loop and queues outgoing frames.
//! \note Internals are async and run on the server IO thread.
//!       Handlers capture shared_from_this() so in-flight operations keep the Connection alive.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect;
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);

	void start();                      //!< Begin the read loop.
	void stop();                       //!< Close the socket. Does not signal onDisconnect.
	void send(const Message& message); //!< Queue a frame. Safe to call from any thread; frames leave in call order.

	ConnectionId connectionId() const;

private:
	void readHeader();
	void readPayload(std::uint32_t payloadSize);
	void writeNext();
	void fail(); //!< Close once and signal onDisconnect.

private:
	asio::ip::tcp::socket m_socket;
	asio::strand<asio::any_io_executor> m_strand; //!< Serializes handlers and the write queue.
	std::atomic<bool> m_open{false};

	const ConnectionId m_connectionId;
	Callbacks m_callbacks;

	FrameHeader m_readHeader{};
	Message m_readBuffer;

	std::deque<std::pair<FrameHeader, Message>> m_writeQueue; //!< Front entry is the frame being written.
};

} // namespace wordgrid::network::core
