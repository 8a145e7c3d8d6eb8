#include "core/scoring.hpp"

#include "core/letterTable.hpp"

#include <cctype>
#include <string>

namespace wordgrid {

std::optional<WordResult> score(const std::vector<Tile>& tiles, const IDictionary& dictionary) {
	if (tiles.size() < MIN_WORD_LENGTH) {
		return {};
	}

	std::string word;
	std::string lookup;
	word.reserve(tiles.size());
	lookup.reserve(tiles.size());
	for (const auto& tile: tiles) {
		const auto letter = static_cast<unsigned char>(tile.letter);
		word.push_back(static_cast<char>(std::toupper(letter)));
		lookup.push_back(static_cast<char>(std::tolower(letter)));
	}

	if (!dictionary.isValidWord(lookup)) {
		return {};
	}

	WordResult result{.word = std::move(word), .baseScore = 0u, .multipliers = {}, .finalScore = 0u};

	unsigned wordMultiplier = 1u;
	for (const auto& tile: tiles) {
		auto value = letterValue(tile.letter);
		switch (tile.bonus) {
		case Bonus::DoubleLetter:
			value *= 2u;
			break;
		case Bonus::TripleLetter:
			value *= 3u;
			break;
		case Bonus::DoubleWord:
			wordMultiplier *= 2u;
			break;
		case Bonus::TripleWord:
			wordMultiplier *= 3u;
			break;
		default:
			break;
		}
		if (tile.bonus != Bonus::None) {
			result.multipliers.push_back(tile.bonus);
		}
		result.baseScore += value;
	}

	result.finalScore = result.baseScore * wordMultiplier;
	if (tiles.size() >= LENGTH_BONUS_THRESHOLD) {
		result.finalScore += LENGTH_BONUS;
	}
	return result;
}

} // namespace wordgrid
