#pragma once

#include "model/types.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wordgrid {

inline constexpr std::size_t MAX_LOBBY_PLAYERS = 8u;

enum class Visibility : std::uint8_t {
	Public,
	Private,
	Count //!< Used in serialisation to check when enum changes.
};

enum class LobbyStatus : std::uint8_t {
	Waiting,
	Playing,
	Finished,
	Count //!< Used in serialisation to check when enum changes.
};

struct LobbyPlayer {
	UserId userId;
	std::string username;
	bool ready{false};
	bool isHost{false};
	std::uint64_t joinedAt{0u}; //!< Join sequence number. Strictly increasing per lobby manager.

	bool operator==(const LobbyPlayer&) const = default;
};

//! Pre-match gathering of players. Players are kept in join order.
struct Lobby {
	LobbyId id;
	std::string code; //!< Short numeric join code, unique among live lobbies.
	ServerId serverId;
	UserId hostId;
	Visibility visibility{Visibility::Public};
	LobbyStatus status{LobbyStatus::Waiting};
	std::size_t maxPlayers{MAX_LOBBY_PLAYERS};
	std::vector<LobbyPlayer> players;
	std::optional<MatchId> matchId; //!< Set once the lobby started a match.

	bool operator==(const Lobby&) const = default;

	const LobbyPlayer* findPlayer(const UserId& userId) const {
		const auto it = std::ranges::find(players, userId, &LobbyPlayer::userId);
		return it == players.end() ? nullptr : &*it;
	}
	LobbyPlayer* findPlayer(const UserId& userId) {
		const auto it = std::ranges::find(players, userId, &LobbyPlayer::userId);
		return it == players.end() ? nullptr : &*it;
	}
	bool isFull() const {
		return players.size() >= maxPlayers;
	}
};

} // namespace wordgrid
