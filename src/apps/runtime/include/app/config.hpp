#pragma once

#include "core/gridGenerator.hpp"
#include "core/lobbyManager.hpp"
#include "model/lobby.hpp"
#include "model/matchState.hpp"
#include "network/core/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wordgrid::app {

inline constexpr std::chrono::seconds DEFAULT_DISCONNECT_GRACE{120};

//! Runtime settings of the game server.
struct ServerConfig {
	std::uint16_t port{network::core::DEFAULT_PORT};
	std::filesystem::path dictionary{"words.txt"}; //!< Newline separated word list.
	std::filesystem::path archive;                 //!< JSON lines file for completed matches. Empty disables archiving.

	unsigned rounds{MAX_ROUNDS_PER_PLAYER};
	unsigned gridRows{GridOptions{}.rows};
	unsigned gridCols{GridOptions{}.cols};
	std::size_t maxPlayers{MAX_LOBBY_PLAYERS};
	std::size_t maxLobbies{MAX_LIVE_LOBBIES}; //!< Live lobbies at once. Capped by the join code range.
	std::optional<std::uint64_t> seed; //!< Fixed seed for reproducible grids. Random if empty.

	std::chrono::seconds grace{DEFAULT_DISCONNECT_GRACE}; //!< Time a disconnected user keeps their lobby seats.
};

//! Parse command line arguments (without the program name).
//! \note A --config file is applied first, flags given on the command line win.
//! \returns Empty if an argument is unknown or a value is invalid.
std::optional<ServerConfig> parseConfig(const std::vector<std::string>& args);
std::optional<ServerConfig> parseConfig(int argc, char** argv);

std::string usage();

} // namespace wordgrid::app
