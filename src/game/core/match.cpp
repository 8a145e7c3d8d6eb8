#include "core/match.hpp"

#include "Logging.hpp"
#include "core/invariant.hpp"
#include "core/scoring.hpp"
#include "model/json.hpp"

#include <algorithm>
#include <format>

namespace wordgrid {

Match::Match(MatchId id, LobbyId lobbyId, std::vector<MatchPlayer> players, Grid grid, const IDictionary& dictionary, EventHub& eventHub,
             MatchOptions options, IMatchArchive* archive)
    : m_id(id), m_lobbyId(lobbyId), m_generator(options.seed, options.grid), m_dictionary(dictionary), m_eventHub(eventHub), m_archive(archive) {
	m_state = MatchState{
	        .id                 = std::move(id),
	        .lobbyId            = std::move(lobbyId),
	        .status             = MatchStatus::InProgress,
	        .players            = std::move(players),
	        .currentPlayerId    = std::nullopt,
	        .grid               = std::move(grid),
	        .wordsFound         = {},
	        .roundNumber        = 1u,
	        .maxRoundsPerPlayer = options.maxRoundsPerPlayer,
	};

	if (m_state.players.empty()) {
		raiseInvariantViolation("Match", "match created without players", m_state);
	}
	passTurn(nextEligible(0u));
	verify();
}

Outcome<MatchState> Match::submitWord(const UserId& playerId, const std::vector<Coord>& path) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (m_state.status == MatchStatus::Completed) {
		return Rejection{RejectReason::MatchCompleted};
	}
	const auto current = currentIndex();
	if (!current || m_state.players[*current].userId != playerId) {
		return Rejection{RejectReason::NotYourTurn};
	}
	if (path.size() < MIN_WORD_LENGTH) {
		return Rejection{RejectReason::TooFewTiles};
	}
	if (!isContiguousPath(m_state.grid, path)) {
		return Rejection{RejectReason::InvalidPath};
	}

	std::vector<Tile> tiles;
	tiles.reserve(path.size());
	for (const auto& cell: path) {
		tiles.push_back(m_state.grid.at(cell));
	}

	auto result = score(tiles, m_dictionary);
	if (!result) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Match] {}: '{}' rejected a word.", m_id, playerId));
		return Rejection{RejectReason::InvalidWord};
	}

	const auto gemCount = static_cast<unsigned>(std::ranges::count_if(tiles, &Tile::isGem));
	const auto points   = result->finalScore + gemCount * GEM_BONUS;

	auto& player = m_state.players[*current];
	player.score += points;
	player.roundsPlayed += 1u;
	player.wordsFound.push_back(result->word);

	for (const auto& cell: path) {
		auto& tile  = m_state.grid.at(cell);
		tile.letter = m_generator.drawLetter();
		tile.bonus  = Bonus::None;
		tile.isGem  = false;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Match] {}: '{}' played '{}' for {} points.", m_id, playerId, result->word, points));
	m_state.wordsFound.push_back(FoundWord{.userId = playerId, .result = std::move(*result), .gemCount = gemCount, .points = points});

	passTurn(nextEligible((*current + 1u) % m_state.players.size()));
	publish();
	return m_state;
}

Outcome<MatchState> Match::shuffleGrid(const UserId& playerId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (m_state.status == MatchStatus::Completed) {
		return Rejection{RejectReason::MatchCompleted};
	}
	const auto current = currentIndex();
	if (!current || m_state.players[*current].userId != playerId) {
		return Rejection{RejectReason::NotYourTurn};
	}
	if (m_shuffledThisTurn) {
		return Rejection{RejectReason::AlreadyShuffled};
	}

	for (unsigned row = 0; row < m_state.grid.rows(); ++row) {
		for (unsigned col = 0; col < m_state.grid.cols(); ++col) {
			m_state.grid.at({row, col}).letter = m_generator.drawLetter();
		}
	}
	m_shuffledThisTurn = true;

	Logger().Log(Logging::LogLevel::Debug, std::format("[Match] {}: '{}' shuffled the grid.", m_id, playerId));
	publish();
	return m_state;
}

MatchState Match::removePlayer(const UserId& userId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (m_state.status == MatchStatus::Completed) {
		return m_state;
	}
	const auto it = std::ranges::find(m_state.players, userId, &MatchPlayer::userId);
	if (it == m_state.players.end()) {
		return m_state;
	}

	const auto removedIndex = static_cast<std::size_t>(std::distance(m_state.players.begin(), it));
	const bool heldTurn     = m_state.currentPlayerId == userId;
	m_state.players.erase(it);

	Logger().Log(Logging::LogLevel::Info, std::format("[Match] {}: '{}' left the match.", m_id, userId));

	if (m_state.players.size() <= 1u) {
		complete();
	} else if (heldTurn) {
		passTurn(nextEligible(removedIndex % m_state.players.size()));
	} else {
		updateRoundNumber();
	}

	publish();
	return m_state;
}

MatchState Match::state() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state;
}

bool Match::isCompleted() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_state.status == MatchStatus::Completed;
}

const MatchId& Match::id() const {
	return m_id;
}

const LobbyId& Match::lobbyId() const {
	return m_lobbyId;
}

std::optional<std::size_t> Match::currentIndex() const {
	if (!m_state.currentPlayerId) {
		return {};
	}
	const auto it = std::ranges::find(m_state.players, *m_state.currentPlayerId, &MatchPlayer::userId);
	if (it == m_state.players.end()) {
		return {};
	}
	return static_cast<std::size_t>(std::distance(m_state.players.begin(), it));
}

std::optional<std::size_t> Match::nextEligible(std::size_t start) const {
	const auto count = m_state.players.size();
	for (std::size_t offset = 0; offset < count; ++offset) {
		const auto index = (start + offset) % count;
		if (m_state.players[index].roundsPlayed < m_state.maxRoundsPerPlayer) {
			return index;
		}
	}
	return {};
}

void Match::passTurn(std::optional<std::size_t> next) {
	if (!next) {
		complete();
		return;
	}
	m_state.currentPlayerId = m_state.players[*next].userId;
	m_shuffledThisTurn      = false;
	updateRoundNumber();
}

void Match::complete() {
	m_state.status          = MatchStatus::Completed;
	m_state.currentPlayerId = std::nullopt;
	m_shuffledThisTurn      = false;
	updateRoundNumber();

	Logger().Log(Logging::LogLevel::Info, std::format("[Match] {} completed after {} words.", m_id, m_state.wordsFound.size()));

	if (!m_archive) {
		return;
	}
	try {
		m_archive->archive(m_state);
	} catch (const std::exception& e) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Match] {}: archiving failed: {}", m_id, e.what()));
	}
}

void Match::updateRoundNumber() {
	if (m_state.players.empty()) {
		return;
	}
	const auto fewest   = std::ranges::min(m_state.players, {}, &MatchPlayer::roundsPlayed).roundsPlayed;
	m_state.roundNumber = std::min(fewest + 1u, m_state.maxRoundsPerPlayer);
}

void Match::publish() {
	verify();
	m_eventHub.signalMatchUpdated(m_state);
	if (m_state.status == MatchStatus::Completed) {
		m_eventHub.signalMatchCompleted(m_state);
	}
}

void Match::verify() const {
	if (m_state.status == MatchStatus::Completed) {
		if (m_state.currentPlayerId) {
			raiseInvariantViolation("Match", "completed match still names a current player", m_state);
		}
		return;
	}

	if (m_state.players.empty()) {
		raiseInvariantViolation("Match", "match in progress without players", m_state);
	}
	const auto current = currentIndex();
	if (!current) {
		raiseInvariantViolation("Match", "current player is not part of the match", m_state);
	}
	if (m_state.players[*current].roundsPlayed >= m_state.maxRoundsPerPlayer) {
		raiseInvariantViolation("Match", "current player already reached the round cap", m_state);
	}
}

} // namespace wordgrid
