#pragma once

#include "model/grid.hpp"
#include "model/lobby.hpp"
#include "model/matchState.hpp"
#include "model/tile.hpp"
#include "model/wordResult.hpp"

#include <nlohmann/json.hpp>

// JSON mapping of the model types. Found through ADL by nlohmann::json.
// from_json throws on malformed input; callers on the wire boundary catch it.
namespace wordgrid {

void to_json(nlohmann::json& j, const Visibility& visibility);
void from_json(const nlohmann::json& j, Visibility& visibility);

void to_json(nlohmann::json& j, const Coord& c);
void from_json(const nlohmann::json& j, Coord& c);

void to_json(nlohmann::json& j, const Tile& tile);
void from_json(const nlohmann::json& j, Tile& tile);

void to_json(nlohmann::json& j, const Grid& grid);
void from_json(const nlohmann::json& j, Grid& grid);

void to_json(nlohmann::json& j, const WordResult& result);
void from_json(const nlohmann::json& j, WordResult& result);

void to_json(nlohmann::json& j, const LobbyPlayer& player);
void from_json(const nlohmann::json& j, LobbyPlayer& player);

void to_json(nlohmann::json& j, const Lobby& lobby);
void from_json(const nlohmann::json& j, Lobby& lobby);

void to_json(nlohmann::json& j, const MatchPlayer& player);
void from_json(const nlohmann::json& j, MatchPlayer& player);

void to_json(nlohmann::json& j, const FoundWord& entry);
void from_json(const nlohmann::json& j, FoundWord& entry);

void to_json(nlohmann::json& j, const MatchState& match);
void from_json(const nlohmann::json& j, MatchState& match);

} // namespace wordgrid
