#pragma once

#include "network/core/protocol.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace wordgrid::network::core {

//! Blocking TCP client speaking the framed protocol.
//! \note    On any network failure send/read fail and the client counts as disconnected.
//!          One thread may block in read() while another one sends.
//! \example Usage: connect(), then read() on a dedicated thread. disconnect() unblocks a pending read.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	TcpClient(const TcpClient&)            = delete;
	TcpClient& operator=(const TcpClient&) = delete;
	TcpClient(TcpClient&&)                 = delete;
	TcpClient& operator=(TcpClient&&)      = delete;

	//! Connect to host:port. Returns false on failure or if already connected.
	bool connect(const std::string& host, std::uint16_t port = DEFAULT_PORT);
	bool isConnected() const;
	void disconnect();

	bool send(const Message& message); //!< Send one frame. Returns false on failure.
	std::optional<Message> read();     //!< Block for one frame. Empty on disconnect or error.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace wordgrid::network::core
