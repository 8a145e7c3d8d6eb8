#pragma once

#include "model/grid.hpp"

#include <cstdint>
#include <random>

namespace wordgrid {

struct GridOptions {
	unsigned rows{5u};
	unsigned cols{5u};
	double bonusChance{0.15}; //!< Probability that a cell carries a multiplier.
	double gemChance{0.08};   //!< Probability that a cell is a gem.
};

//! Seeded source of letters and cells. Same seed, same sequence.
class GridGenerator {
public:
	explicit GridGenerator(std::uint64_t seed, GridOptions options = {});

	Grid generate();   //!< Fresh grid with letters, bonuses and gems.
	char drawLetter(); //!< Weighted letter draw, upper case.

	const GridOptions& options() const;

private:
	Bonus drawBonus();
	bool drawGem();

private:
	GridOptions m_options;
	std::mt19937_64 m_rng;
	std::discrete_distribution<unsigned> m_letters;
	std::bernoulli_distribution m_bonusRoll;
	std::bernoulli_distribution m_gemRoll;
	std::uniform_int_distribution<unsigned> m_bonusKind{1u, 4u}; //!< DoubleLetter..TripleWord.
};

} // namespace wordgrid
