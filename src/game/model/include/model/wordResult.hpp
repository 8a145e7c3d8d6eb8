#pragma once

#include "model/tile.hpp"

#include <string>
#include <vector>

namespace wordgrid {

//! Outcome of scoring an accepted word. Immutable once produced.
struct WordResult {
	std::string word;               //!< Upper case letters in selection order.
	unsigned baseScore;             //!< Sum of letter values after letter multipliers.
	std::vector<Bonus> multipliers; //!< Bonuses applied, in tile order.
	unsigned finalScore;            //!< Base times word multipliers plus length bonus.

	bool operator==(const WordResult&) const = default;
};

} // namespace wordgrid
