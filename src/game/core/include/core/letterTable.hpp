#pragma once

#include <array>

namespace wordgrid {

//! Points per letter A-Z. Rare letters are worth more.
inline constexpr std::array<unsigned, 26> LETTER_VALUES{
        1u, 3u, 3u, 2u, 1u, 4u, 2u, 4u, 1u, 8u, 5u, 1u, 3u, // A-M
        1u, 1u, 3u, 10u, 1u, 1u, 1u, 1u, 4u, 4u, 8u, 4u, 10u // N-Z
};

//! Relative draw weight per letter A-Z when filling the grid.
inline constexpr std::array<unsigned, 26> LETTER_WEIGHTS{
        9u, 2u, 4u, 5u, 12u, 3u, 3u, 6u, 8u, 1u, 2u, 5u, 4u, // A-M
        7u, 8u, 3u, 1u, 6u, 7u, 9u, 4u, 2u, 3u, 1u, 3u, 1u   // N-Z
};

//! Point value of a letter. Case insensitive, 0 for anything outside A-Z.
inline constexpr unsigned letterValue(char letter) {
	if (letter >= 'a' && letter <= 'z') {
		letter = static_cast<char>(letter - 'a' + 'A');
	}
	if (letter < 'A' || letter > 'Z') {
		return 0u;
	}
	return LETTER_VALUES[static_cast<std::size_t>(letter - 'A')];
}

} // namespace wordgrid
