#pragma once

#include "model/tile.hpp"
#include "model/types.hpp"

#include <vector>

namespace wordgrid {

//! Rectangular tile grid stored row major.
class Grid {
public:
	Grid() = default;
	//! Throws std::invalid_argument if the tile count does not match rows * cols.
	Grid(unsigned rows, unsigned cols, std::vector<Tile> tiles);

	unsigned rows() const;
	unsigned cols() const;

	bool contains(Coord c) const; //!< True if the coordinate lies inside the grid.

	const Tile& at(Coord c) const;
	Tile& at(Coord c);

	const std::vector<Tile>& tiles() const;

	bool operator==(const Grid&) const = default;

private:
	unsigned m_rows{0u};
	unsigned m_cols{0u};
	std::vector<Tile> m_tiles;
};

//! True for distinct cells that touch horizontally, vertically or diagonally.
bool areAdjacent(Coord a, Coord b);

//! A path is valid when every cell is inside the grid, no cell repeats and consecutive cells are adjacent.
bool isContiguousPath(const Grid& grid, const std::vector<Coord>& path);

} // namespace wordgrid
