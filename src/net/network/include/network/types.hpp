#pragma once

#include "model/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace wordgrid::network {

using SessionId = std::uint32_t; //!< Identifies a connection on application layer.
using Channel   = std::string;   //!< Named broadcast topic, e.g. "lobby:<id>".

inline constexpr std::chrono::milliseconds DEFAULT_RECONNECT_DELAY{2000};

//! Who is behind a connection. Announced by the client with identify.
struct ClientIdentity {
	UserId userId;
	std::string username;

	bool operator==(const ClientIdentity&) const = default;
};

} // namespace wordgrid::network
