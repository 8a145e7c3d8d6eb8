#pragma once

#include "network/core/protocol.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace wordgrid::network::core {

//! Accepts clients on a dedicated IO thread and routes framed messages to the callbacks.
//! \note    Callbacks run on the IO thread. Keep them thin.
//! \example Usage: set callbacks via connect(), then start() once. Call stop() to shut down.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(ConnectionId)> onConnect;
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect;
	};

	explicit TcpServer(std::uint16_t port = DEFAULT_PORT);
	~TcpServer();

	TcpServer(const TcpServer&)            = delete;
	TcpServer& operator=(const TcpServer&) = delete;
	TcpServer(TcpServer&&)                 = delete;
	TcpServer& operator=(TcpServer&&)      = delete;

	void connect(Callbacks callbacks); //!< Set callbacks. Call before start.
	bool start();                      //!< Bind and start accepting. Returns false if the port could not be bound.
	void stop();                       //!< Close all connections and join the IO thread. Safe to call multiple times.

	bool send(ConnectionId connectionId, const Message& message); //!< Returns false if the connection is unknown.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace wordgrid::network::core
