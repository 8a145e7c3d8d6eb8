#include "app/jsonLinesArchive.hpp"

#include "model/json.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace wordgrid::gtest {

TEST(JsonLinesArchive, AppendsOneLinePerMatch) {
	const auto path = std::filesystem::temp_directory_path() / "wordgrid_archive_test.jsonl";
	std::filesystem::remove(path);

	MatchState match;
	match.id      = "match-1";
	match.lobbyId = "lobby-1";
	match.status  = MatchStatus::Completed;
	match.players = {MatchPlayer{.userId = "alice", .username = "Alice", .score = 12u, .roundsPlayed = 4u, .wordsFound = {"planet"}}};
	match.grid    = Grid(1u, 1u, {Tile{.letter = 'E', .bonus = Bonus::TripleWord, .row = 0u, .col = 0u, .isGem = true}});

	app::JsonLinesArchive archive(path);
	archive.archive(match);
	match.id = "match-2";
	archive.archive(match);

	std::ifstream file(path);
	std::vector<std::string> lines;
	for (std::string line; std::getline(file, line);) {
		lines.push_back(line);
	}
	file.close();
	std::filesystem::remove(path);

	ASSERT_EQ(lines.size(), 2u);
	const auto first = nlohmann::json::parse(lines[0]).get<MatchState>();
	EXPECT_EQ(first.id, "match-1");
	EXPECT_EQ(first.players, match.players);
	EXPECT_EQ(nlohmann::json::parse(lines[1]).at("id"), "match-2");
}

TEST(JsonLinesArchive, ThrowsWhenFileCannotBeOpened) {
	app::JsonLinesArchive archive(std::filesystem::temp_directory_path() / "no-such-dir" / "archive.jsonl");
	EXPECT_THROW(archive.archive(MatchState{}), std::runtime_error);
}

} // namespace wordgrid::gtest
