#include "model/grid.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace wordgrid::gtest {

static Grid emptyGrid(unsigned rows, unsigned cols) {
	std::vector<Tile> tiles;
	for (unsigned row = 0; row < rows; ++row) {
		for (unsigned col = 0; col < cols; ++col) {
			tiles.push_back(Tile{.letter = 'A', .bonus = Bonus::None, .row = row, .col = col, .isGem = false});
		}
	}
	return Grid(rows, cols, std::move(tiles));
}

TEST(Grid, Adjacency) {
	const Coord center{2u, 2u};
	for (unsigned row = 1u; row <= 3u; ++row) {
		for (unsigned col = 1u; col <= 3u; ++col) {
			EXPECT_EQ(areAdjacent(center, {row, col}), !(row == 2u && col == 2u));
		}
	}
	EXPECT_FALSE(areAdjacent(center, {0u, 2u}));
	EXPECT_FALSE(areAdjacent(center, {2u, 4u}));
	EXPECT_FALSE(areAdjacent({0u, 0u}, {4u, 4u}));
}

TEST(Grid, ContiguousPath) {
	const auto grid = emptyGrid(5u, 5u);

	EXPECT_TRUE(isContiguousPath(grid, {{0u, 0u}, {1u, 1u}, {2u, 2u}, {2u, 3u}}));
	EXPECT_TRUE(isContiguousPath(grid, {{4u, 4u}, {3u, 3u}, {3u, 4u}}));
	EXPECT_TRUE(isContiguousPath(grid, {}));

	EXPECT_FALSE(isContiguousPath(grid, {{0u, 0u}, {0u, 1u}, {0u, 0u}})); // Repeats a cell
	EXPECT_FALSE(isContiguousPath(grid, {{0u, 0u}, {0u, 2u}, {0u, 3u}})); // Gap
	EXPECT_FALSE(isContiguousPath(grid, {{3u, 4u}, {4u, 4u}, {5u, 4u}})); // Leaves the grid
}

TEST(Grid, Access) {
	auto grid = emptyGrid(2u, 3u);
	EXPECT_EQ(grid.rows(), 2u);
	EXPECT_EQ(grid.cols(), 3u);
	EXPECT_TRUE(grid.contains({1u, 2u}));
	EXPECT_FALSE(grid.contains({2u, 0u}));

	grid.at({1u, 2u}).letter = 'Z';
	EXPECT_EQ(grid.at({1u, 2u}).letter, 'Z');
	EXPECT_EQ(grid.tiles().back().letter, 'Z');

	EXPECT_THROW(grid.at({0u, 3u}), std::out_of_range);
	EXPECT_THROW(Grid(2u, 2u, std::vector<Tile>(3u, Tile{.letter = 'A'})), std::invalid_argument);
}

} // namespace wordgrid::gtest
