#pragma once

#include "core/IDictionary.hpp"
#include "core/IMatchArchive.hpp"
#include "core/eventHub.hpp"
#include "core/gridGenerator.hpp"
#include "core/outcome.hpp"
#include "model/matchState.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace wordgrid {

struct MatchOptions {
	unsigned maxRoundsPerPlayer{MAX_ROUNDS_PER_PLAYER};
	GridOptions grid{};
	std::uint64_t seed{0u}; //!< Seed of the letter draws used for refills and shuffles.
};

//! Turn based match of one lobby. Owns the authoritative MatchState.
//! \note  All operations are serialized on an internal mutex; each accepted action
//!        broadcasts the full state before returning. Rejections never mutate or broadcast.
class Match {
public:
	//! Throws InvariantViolation if players is empty.
	Match(MatchId id, LobbyId lobbyId, std::vector<MatchPlayer> players, Grid grid, const IDictionary& dictionary, EventHub& eventHub,
	      MatchOptions options = {}, IMatchArchive* archive = nullptr);

	Match(const Match&)            = delete;
	Match& operator=(const Match&) = delete;
	Match(Match&&)                 = delete;
	Match& operator=(Match&&)      = delete;

	//! Play the word spelled by the cells of path. Letters, bonuses and gems are read from the grid.
	Outcome<MatchState> submitWord(const UserId& playerId, const std::vector<Coord>& path);

	//! Redraw every letter once per turn. Bonuses and gems stay in place.
	Outcome<MatchState> shuffleGrid(const UserId& playerId);

	//! Drop a player. Passes the turn if they held it and completes the match when at most one player is left.
	//! No-op if the player is unknown or the match is already completed.
	MatchState removePlayer(const UserId& userId);

	MatchState state() const;
	bool isCompleted() const;

	const MatchId& id() const;
	const LobbyId& lobbyId() const;

private:
	std::optional<std::size_t> currentIndex() const;
	std::optional<std::size_t> nextEligible(std::size_t start) const; //!< First player from start on (wrapping) below the round cap.

	void passTurn(std::optional<std::size_t> next); //!< Hands the turn over or completes the match if nobody is eligible.
	void complete();
	void updateRoundNumber();
	void publish();
	void verify() const;

private:
	const MatchId m_id;
	const LobbyId m_lobbyId;

	mutable std::mutex m_mutex;
	MatchState m_state;
	bool m_shuffledThisTurn{false};

	GridGenerator m_generator;
	const IDictionary& m_dictionary;
	EventHub& m_eventHub;
	IMatchArchive* m_archive{nullptr};
};

} // namespace wordgrid
