#pragma once

#include "model/grid.hpp"
#include "model/types.hpp"
#include "model/wordResult.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wordgrid {

inline constexpr unsigned MAX_ROUNDS_PER_PLAYER = 4u;

enum class MatchStatus : std::uint8_t {
	InProgress,
	Completed,
	Count //!< Used in serialisation to check when enum changes.
};

struct MatchPlayer {
	UserId userId;
	std::string username;
	unsigned score{0u};
	unsigned roundsPlayed{0u};
	std::vector<std::string> wordsFound;

	bool operator==(const MatchPlayer&) const = default;
};

//! Entry of the match word log.
struct FoundWord {
	UserId userId;
	WordResult result;
	unsigned gemCount; //!< Gems collected with this word.
	unsigned points;   //!< Final score plus gem bonus. Added to the player score.

	bool operator==(const FoundWord&) const = default;
};

//! Full match snapshot. Broadcast as a whole after every accepted action.
struct MatchState {
	MatchId id;
	LobbyId lobbyId;
	MatchStatus status{MatchStatus::InProgress};
	std::vector<MatchPlayer> players; //!< Turn order.
	std::optional<UserId> currentPlayerId;
	Grid grid;
	std::vector<FoundWord> wordsFound;
	unsigned roundNumber{1u};
	unsigned maxRoundsPerPlayer{MAX_ROUNDS_PER_PLAYER};

	bool operator==(const MatchState&) const = default;

	const MatchPlayer* findPlayer(const UserId& userId) const {
		const auto it = std::ranges::find(players, userId, &MatchPlayer::userId);
		return it == players.end() ? nullptr : &*it;
	}
};

} // namespace wordgrid
