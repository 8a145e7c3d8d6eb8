#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace wordgrid {

//! Score multiplier printed on a tile.
enum class Bonus : std::uint8_t {
	None,
	DoubleLetter,
	TripleLetter,
	DoubleWord,
	TripleWord,
	Count //!< Used in serialisation to check when enum changes.
};

struct Tile {
	char letter;             //!< Upper case glyph A-Z.
	Bonus bonus{Bonus::None};
	unsigned row{0u};
	unsigned col{0u};
	bool isGem{false};       //!< Collecting a gem grants a flat bonus to the player.

	bool operator==(const Tile&) const = default;
};

//! Short tag used on the wire and in word results. Empty for Bonus::None.
inline constexpr std::string_view toString(Bonus bonus) {
	switch (bonus) {
	case Bonus::DoubleLetter:
		return "DL";
	case Bonus::TripleLetter:
		return "TL";
	case Bonus::DoubleWord:
		return "DW";
	case Bonus::TripleWord:
		return "TW";
	default:
		return "";
	}
}

inline constexpr std::optional<Bonus> bonusFromString(std::string_view tag) {
	if (tag == "DL")
		return Bonus::DoubleLetter;
	if (tag == "TL")
		return Bonus::TripleLetter;
	if (tag == "DW")
		return Bonus::DoubleWord;
	if (tag == "TW")
		return Bonus::TripleWord;
	return {};
}

inline constexpr bool isWordBonus(Bonus bonus) {
	return bonus == Bonus::DoubleWord || bonus == Bonus::TripleWord;
}

} // namespace wordgrid
