#include "core/gridGenerator.hpp"

#include "core/letterTable.hpp"

#include <vector>

namespace wordgrid {

GridGenerator::GridGenerator(std::uint64_t seed, GridOptions options)
    : m_options(options), m_rng(seed), m_letters(LETTER_WEIGHTS.begin(), LETTER_WEIGHTS.end()), m_bonusRoll(options.bonusChance),
      m_gemRoll(options.gemChance) {
}

Grid GridGenerator::generate() {
	std::vector<Tile> tiles;
	tiles.reserve(static_cast<std::size_t>(m_options.rows) * m_options.cols);

	for (unsigned row = 0; row < m_options.rows; ++row) {
		for (unsigned col = 0; col < m_options.cols; ++col) {
			const auto letter = drawLetter();
			const auto bonus  = drawBonus();
			tiles.push_back(Tile{.letter = letter, .bonus = bonus, .row = row, .col = col, .isGem = drawGem()});
		}
	}
	return Grid(m_options.rows, m_options.cols, std::move(tiles));
}

char GridGenerator::drawLetter() {
	return static_cast<char>('A' + m_letters(m_rng));
}

const GridOptions& GridGenerator::options() const {
	return m_options;
}

Bonus GridGenerator::drawBonus() {
	if (!m_bonusRoll(m_rng)) {
		return Bonus::None;
	}
	return static_cast<Bonus>(m_bonusKind(m_rng));
}

bool GridGenerator::drawGem() {
	return m_gemRoll(m_rng);
}

} // namespace wordgrid
