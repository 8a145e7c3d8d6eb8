#pragma once

#include "network/core/protocol.hpp"

namespace wordgrid::network {

// Events flowing from network threads into the server thread.
// Keep these small so network callbacks remain cheap.
enum class ServerQueueEventType { ClientConnected, ClientDisconnected, ClientMessage, Shutdown };

struct ServerQueueEvent {
	ServerQueueEventType type{};
	core::ConnectionId connectionId{}; //!< Network connection id.
	core::Message payload{};           //!< Network message. Example: {"type":"subscribe","channel":"lobby:lobby-1"}.
};

} // namespace wordgrid::network
