#pragma once

#include <string>

namespace wordgrid {

using UserId   = std::string; //!< Stable user id handed out by the identity provider.
using LobbyId  = std::string;
using MatchId  = std::string;
using ServerId = std::string; //!< Lobby discovery scope. Lobbies are listed per server.

inline const ServerId DEFAULT_SERVER_ID = "global";

//! Cell position on the grid. Origin is the top left cell.
struct Coord {
	unsigned row;
	unsigned col;

	bool operator==(const Coord&) const = default;
};

} // namespace wordgrid
