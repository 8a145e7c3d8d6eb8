#pragma once

#include "network/types.hpp"

namespace wordgrid::network {

inline Channel lobbyChannel(const LobbyId& lobbyId) {
	return "lobby:" + lobbyId;
}

inline Channel matchChannel(const MatchId& matchId) {
	return "match:" + matchId;
}

//! Public lobby listing of one server.
inline Channel serverLobbiesChannel(const ServerId& serverId) {
	return "server:" + serverId + ":lobbies";
}

inline Channel matchmakingChannel(const ServerId& serverId) {
	return "matchmaking:" + serverId;
}

} // namespace wordgrid::network
