#include "core/board.hpp"

#include <cassert>

namespace ttt {

Board::Board() {
	clear();
}

bool Board::isValid(const Coord c) {
	return c.x < SIZE && c.y < SIZE;
}

bool Board::place(const Coord c, Piece value) {
	assert(isValid(c));            // Table should verify the coordinate.
	assert(value != Piece::Empty); // Use clear

	if (isEmpty(c)) {
		m_board[c.y * SIZE + c.x] = value;
		return true;
	}
	return false;
}

void Board::clear() {
	m_board.fill(Piece::Empty);
}

Board::Piece Board::get(const Coord c) const {
	assert(isValid(c));
	return m_board[c.y * SIZE + c.x];
}

bool Board::isEmpty(const Coord c) const {
	return get(c) == Piece::Empty;
}

std::optional<Coord> Board::firstEmpty() const {
	for (Id y = 0u; y != SIZE; ++y) {
		for (Id x = 0u; x != SIZE; ++x) {
			if (isEmpty({x, y})) {
				return Coord{x, y};
			}
		}
	}
	return {};
}

} // namespace ttt
