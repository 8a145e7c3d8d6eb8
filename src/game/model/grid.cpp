#include "model/grid.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace wordgrid {

Grid::Grid(unsigned rows, unsigned cols, std::vector<Tile> tiles) : m_rows(rows), m_cols(cols), m_tiles(std::move(tiles)) {
	if (m_tiles.size() != static_cast<std::size_t>(rows) * cols) {
		throw std::invalid_argument(std::format("Grid {}x{} cannot hold {} tiles.", rows, cols, m_tiles.size()));
	}
}

unsigned Grid::rows() const {
	return m_rows;
}

unsigned Grid::cols() const {
	return m_cols;
}

bool Grid::contains(Coord c) const {
	return c.row < m_rows && c.col < m_cols;
}

const Tile& Grid::at(Coord c) const {
	if (!contains(c)) {
		throw std::out_of_range(std::format("Cell ({}, {}) outside of {}x{} grid.", c.row, c.col, m_rows, m_cols));
	}
	return m_tiles[c.row * m_cols + c.col];
}

Tile& Grid::at(Coord c) {
	if (!contains(c)) {
		throw std::out_of_range(std::format("Cell ({}, {}) outside of {}x{} grid.", c.row, c.col, m_rows, m_cols));
	}
	return m_tiles[c.row * m_cols + c.col];
}

const std::vector<Tile>& Grid::tiles() const {
	return m_tiles;
}

bool areAdjacent(Coord a, Coord b) {
	const auto rowDistance = a.row > b.row ? a.row - b.row : b.row - a.row;
	const auto colDistance = a.col > b.col ? a.col - b.col : b.col - a.col;
	return rowDistance <= 1u && colDistance <= 1u && !(a == b);
}

bool isContiguousPath(const Grid& grid, const std::vector<Coord>& path) {
	for (std::size_t i = 0; i < path.size(); ++i) {
		if (!grid.contains(path[i])) {
			return false;
		}
		if (std::find(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(i), path[i]) != path.begin() + static_cast<std::ptrdiff_t>(i)) {
			return false;
		}
		if (i > 0 && !areAdjacent(path[i - 1], path[i])) {
			return false;
		}
	}
	return true;
}

} // namespace wordgrid
