#include "model/json.hpp"

#include <stdexcept>
#include <string>

namespace wordgrid {

using nlohmann::json;

static std::string toString(Visibility visibility) {
	static_assert(static_cast<int>(Visibility::Count) == 2, "Update wire mapping.");
	return visibility == Visibility::Private ? "private" : "public";
}

static Visibility visibilityFromString(const std::string& value) {
	if (value == "public")
		return Visibility::Public;
	if (value == "private")
		return Visibility::Private;
	throw std::invalid_argument("Unknown visibility: " + value);
}

void to_json(json& j, const Visibility& visibility) {
	j = toString(visibility);
}

void from_json(const json& j, Visibility& visibility) {
	visibility = visibilityFromString(j.get<std::string>());
}

static std::string toString(LobbyStatus status) {
	static_assert(static_cast<int>(LobbyStatus::Count) == 3, "Update wire mapping.");
	switch (status) {
	case LobbyStatus::Waiting:
		return "waiting";
	case LobbyStatus::Playing:
		return "playing";
	default:
		return "finished";
	}
}

static LobbyStatus lobbyStatusFromString(const std::string& value) {
	if (value == "waiting")
		return LobbyStatus::Waiting;
	if (value == "playing")
		return LobbyStatus::Playing;
	if (value == "finished")
		return LobbyStatus::Finished;
	throw std::invalid_argument("Unknown lobby status: " + value);
}

static std::string toString(MatchStatus status) {
	static_assert(static_cast<int>(MatchStatus::Count) == 2, "Update wire mapping.");
	return status == MatchStatus::Completed ? "completed" : "in_progress";
}

static MatchStatus matchStatusFromString(const std::string& value) {
	if (value == "in_progress")
		return MatchStatus::InProgress;
	if (value == "completed")
		return MatchStatus::Completed;
	throw std::invalid_argument("Unknown match status: " + value);
}

static json bonusToJson(Bonus bonus) {
	if (bonus == Bonus::None) {
		return nullptr;
	}
	return std::string{toString(bonus)};
}

static Bonus bonusFromJson(const json& j) {
	if (j.is_null()) {
		return Bonus::None;
	}
	const auto bonus = bonusFromString(j.get<std::string>());
	if (!bonus) {
		throw std::invalid_argument("Unknown multiplier: " + j.dump());
	}
	return *bonus;
}


void to_json(json& j, const Coord& c) {
	j = json{{"row", c.row}, {"col", c.col}};
}

void from_json(const json& j, Coord& c) {
	c.row = j.at("row").get<unsigned>();
	c.col = j.at("col").get<unsigned>();
}

void to_json(json& j, const Tile& tile) {
	j = json{
	        {"letter", std::string(1u, tile.letter)},
	        {"multiplier", bonusToJson(tile.bonus)},
	        {"row", tile.row},
	        {"col", tile.col},
	        {"isGem", tile.isGem},
	};
}

void from_json(const json& j, Tile& tile) {
	const auto letter = j.at("letter").get<std::string>();
	if (letter.size() != 1u) {
		throw std::invalid_argument("Tile letter must be a single character.");
	}
	tile.letter = letter.front();
	tile.bonus  = bonusFromJson(j.at("multiplier"));
	tile.row    = j.at("row").get<unsigned>();
	tile.col    = j.at("col").get<unsigned>();
	tile.isGem  = j.at("isGem").get<bool>();
}

void to_json(json& j, const Grid& grid) {
	j = json::array();
	for (unsigned row = 0; row < grid.rows(); ++row) {
		auto cells = json::array();
		for (unsigned col = 0; col < grid.cols(); ++col) {
			cells.push_back(json(grid.at({row, col})));
		}
		j.push_back(std::move(cells));
	}
}

void from_json(const json& j, Grid& grid) {
	if (!j.is_array()) {
		throw std::invalid_argument("Grid must be an array of rows.");
	}
	const auto rows = static_cast<unsigned>(j.size());
	const auto cols = rows == 0u ? 0u : static_cast<unsigned>(j.front().size());

	std::vector<Tile> tiles;
	tiles.reserve(static_cast<std::size_t>(rows) * cols);
	for (const auto& row: j) {
		if (!row.is_array() || row.size() != cols) {
			throw std::invalid_argument("Grid rows must have equal length.");
		}
		for (const auto& cell: row) {
			tiles.push_back(cell.get<Tile>());
		}
	}
	grid = Grid(rows, cols, std::move(tiles));
}

void to_json(json& j, const WordResult& result) {
	auto multipliers = json::array();
	for (const auto bonus: result.multipliers) {
		multipliers.push_back(std::string{toString(bonus)});
	}
	j = json{
	        {"word", result.word},
	        {"baseScore", result.baseScore},
	        {"multipliers", std::move(multipliers)},
	        {"finalScore", result.finalScore},
	};
}

void from_json(const json& j, WordResult& result) {
	result.word      = j.at("word").get<std::string>();
	result.baseScore = j.at("baseScore").get<unsigned>();
	result.multipliers.clear();
	for (const auto& tag: j.at("multipliers")) {
		result.multipliers.push_back(bonusFromJson(tag));
	}
	result.finalScore = j.at("finalScore").get<unsigned>();
}

void to_json(json& j, const LobbyPlayer& player) {
	j = json{
	        {"userId", player.userId},
	        {"username", player.username},
	        {"ready", player.ready},
	        {"isHost", player.isHost},
	        {"joinedAt", player.joinedAt},
	};
}

void from_json(const json& j, LobbyPlayer& player) {
	player.userId   = j.at("userId").get<UserId>();
	player.username = j.at("username").get<std::string>();
	player.ready    = j.at("ready").get<bool>();
	player.isHost   = j.at("isHost").get<bool>();
	player.joinedAt = j.at("joinedAt").get<std::uint64_t>();
}

void to_json(json& j, const Lobby& lobby) {
	j = json{
	        {"id", lobby.id},
	        {"code", lobby.code},
	        {"serverId", lobby.serverId},
	        {"hostId", lobby.hostId},
	        {"visibility", toString(lobby.visibility)},
	        {"status", toString(lobby.status)},
	        {"maxPlayers", lobby.maxPlayers},
	        {"players", lobby.players},
	        {"matchId", lobby.matchId ? json(*lobby.matchId) : json(nullptr)},
	};
}

void from_json(const json& j, Lobby& lobby) {
	lobby.id         = j.at("id").get<LobbyId>();
	lobby.code       = j.at("code").get<std::string>();
	lobby.serverId   = j.at("serverId").get<ServerId>();
	lobby.hostId     = j.at("hostId").get<UserId>();
	lobby.visibility = visibilityFromString(j.at("visibility").get<std::string>());
	lobby.status     = lobbyStatusFromString(j.at("status").get<std::string>());
	lobby.maxPlayers = j.at("maxPlayers").get<std::size_t>();
	lobby.players    = j.at("players").get<std::vector<LobbyPlayer>>();

	const auto& matchId = j.at("matchId");
	lobby.matchId       = matchId.is_null() ? std::nullopt : std::optional<MatchId>(matchId.get<MatchId>());
}

void to_json(json& j, const MatchPlayer& player) {
	j = json{
	        {"userId", player.userId},
	        {"username", player.username},
	        {"score", player.score},
	        {"roundsPlayed", player.roundsPlayed},
	        {"wordsFound", player.wordsFound},
	};
}

void from_json(const json& j, MatchPlayer& player) {
	player.userId       = j.at("userId").get<UserId>();
	player.username     = j.at("username").get<std::string>();
	player.score        = j.at("score").get<unsigned>();
	player.roundsPlayed = j.at("roundsPlayed").get<unsigned>();
	player.wordsFound   = j.at("wordsFound").get<std::vector<std::string>>();
}

void to_json(json& j, const FoundWord& entry) {
	j = json{
	        {"userId", entry.userId},
	        {"result", entry.result},
	        {"gemCount", entry.gemCount},
	        {"points", entry.points},
	};
}

void from_json(const json& j, FoundWord& entry) {
	entry.userId   = j.at("userId").get<UserId>();
	entry.result   = j.at("result").get<WordResult>();
	entry.gemCount = j.at("gemCount").get<unsigned>();
	entry.points   = j.at("points").get<unsigned>();
}

void to_json(json& j, const MatchState& match) {
	j = json{
	        {"id", match.id},
	        {"lobbyId", match.lobbyId},
	        {"status", toString(match.status)},
	        {"players", match.players},
	        {"currentPlayerId", match.currentPlayerId ? json(*match.currentPlayerId) : json(nullptr)},
	        {"grid", match.grid},
	        {"wordsFound", match.wordsFound},
	        {"roundNumber", match.roundNumber},
	        {"maxRoundsPerPlayer", match.maxRoundsPerPlayer},
	};
}

void from_json(const json& j, MatchState& match) {
	match.id         = j.at("id").get<MatchId>();
	match.lobbyId    = j.at("lobbyId").get<LobbyId>();
	match.status     = matchStatusFromString(j.at("status").get<std::string>());
	match.players    = j.at("players").get<std::vector<MatchPlayer>>();
	match.grid       = j.at("grid").get<Grid>();
	match.wordsFound = j.at("wordsFound").get<std::vector<FoundWord>>();

	const auto& current   = j.at("currentPlayerId");
	match.currentPlayerId = current.is_null() ? std::nullopt : std::optional<UserId>(current.get<UserId>());

	match.roundNumber        = j.at("roundNumber").get<unsigned>();
	match.maxRoundsPerPlayer = j.at("maxRoundsPerPlayer").get<unsigned>();
}

} // namespace wordgrid
