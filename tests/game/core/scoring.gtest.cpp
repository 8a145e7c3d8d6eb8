#include "core/scoring.hpp"
#include "testHelpers.hpp"

#include <gtest/gtest.h>

#include <string_view>

namespace wordgrid::gtest {

static std::vector<Tile> tiles(std::string_view letters, std::vector<Bonus> bonuses = {}) {
	std::vector<Tile> result;
	for (unsigned i = 0; i < letters.size(); ++i) {
		const auto bonus = i < bonuses.size() ? bonuses[i] : Bonus::None;
		result.push_back(Tile{.letter = letters[i], .bonus = bonus, .row = 0u, .col = i, .isGem = false});
	}
	return result;
}

TEST(Scoring, PlainWord) {
	const FixedDictionary dictionary{"cat"};

	const auto result = score(tiles("CAT"), dictionary);
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->word, "CAT");
	EXPECT_EQ(result->baseScore, 5u);
	EXPECT_EQ(result->finalScore, 5u);
	EXPECT_TRUE(result->multipliers.empty());
}

TEST(Scoring, Rejections) {
	const FixedDictionary dictionary{"at", "cat"};

	EXPECT_FALSE(score(tiles("AT"), dictionary).has_value()); // Too short even if known
	EXPECT_FALSE(score(tiles("TAC"), dictionary).has_value()); // Unknown word
	EXPECT_FALSE(score({}, dictionary).has_value());
}

TEST(Scoring, DictionaryLookupIsCaseInsensitive) {
	const FixedDictionary dictionary{"cat"};

	const auto upper = score(tiles("CAT"), dictionary);
	const auto mixed = score(tiles("cAt"), dictionary);
	ASSERT_TRUE(upper.has_value());
	ASSERT_TRUE(mixed.has_value());
	EXPECT_EQ(*upper, *mixed);
	for (const auto& lookup: dictionary.lookups()) {
		EXPECT_EQ(lookup, "cat");
	}
}

TEST(Scoring, LetterMultipliers) {
	const FixedDictionary dictionary{"cat"};

	const auto doubled = score(tiles("CAT", {Bonus::DoubleLetter}), dictionary);
	ASSERT_TRUE(doubled.has_value());
	EXPECT_EQ(doubled->baseScore, 8u); // C 3*2 + A 1 + T 1
	EXPECT_EQ(doubled->finalScore, 8u);

	const auto tripled = score(tiles("CAT", {Bonus::None, Bonus::None, Bonus::TripleLetter}), dictionary);
	ASSERT_TRUE(tripled.has_value());
	EXPECT_EQ(tripled->finalScore, 7u);
	EXPECT_EQ(tripled->multipliers, std::vector<Bonus>{Bonus::TripleLetter});
}

TEST(Scoring, WordMultipliersCompound) {
	const FixedDictionary dictionary{"key"};

	// K 5 + E 1 + Y 4 = 10, doubled and then tripled.
	const auto result = score(tiles("KEY", {Bonus::DoubleWord, Bonus::None, Bonus::TripleWord}), dictionary);
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->baseScore, 10u);
	EXPECT_EQ(result->finalScore, 60u);
	EXPECT_EQ(result->multipliers, (std::vector<Bonus>{Bonus::DoubleWord, Bonus::TripleWord}));
}

TEST(Scoring, LengthBonus) {
	const FixedDictionary dictionary{"plane", "planet"};

	const auto fiveLetters = score(tiles("PLANE"), dictionary);
	ASSERT_TRUE(fiveLetters.has_value());
	EXPECT_EQ(fiveLetters->finalScore, 7u);

	const auto sixLetters = score(tiles("PLANET"), dictionary);
	ASSERT_TRUE(sixLetters.has_value());
	EXPECT_EQ(sixLetters->baseScore, 8u);
	EXPECT_EQ(sixLetters->finalScore, 8u + LENGTH_BONUS);
}

TEST(Scoring, GemsAreNotScored) {
	const FixedDictionary dictionary{"cat"};

	auto gems = tiles("CAT");
	for (auto& tile: gems) {
		tile.isGem = true;
	}
	const auto result = score(gems, dictionary);
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->finalScore, 5u);
}

TEST(Scoring, Deterministic) {
	const FixedDictionary dictionary{"quartz"};
	const auto input = tiles("QUARTZ", {Bonus::TripleLetter, Bonus::None, Bonus::DoubleWord});

	EXPECT_EQ(score(input, dictionary), score(input, dictionary));
}

} // namespace wordgrid::gtest
