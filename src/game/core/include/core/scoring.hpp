#pragma once

#include "core/IDictionary.hpp"
#include "model/tile.hpp"
#include "model/wordResult.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace wordgrid {

inline constexpr std::size_t MIN_WORD_LENGTH        = 3u;
inline constexpr std::size_t LENGTH_BONUS_THRESHOLD = 6u;  //!< Words at least this long earn LENGTH_BONUS.
inline constexpr unsigned LENGTH_BONUS              = 10u;
inline constexpr unsigned GEM_BONUS                 = 10u; //!< Flat points per gem. Added by the match, not by score().

//! Score the tiles in selection order.
//! Returns empty if the word is shorter than MIN_WORD_LENGTH or unknown to the dictionary.
//! \note Pure: same tiles and dictionary always give the same result.
std::optional<WordResult> score(const std::vector<Tile>& tiles, const IDictionary& dictionary);

} // namespace wordgrid
