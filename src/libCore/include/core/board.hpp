#pragma once

#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <optional>

namespace ttt {

//! Fixed 3x3 tic-tac-toe board.
//! \note Pieces carry signed weights so that a line of three sums to +-3.
class Board {
public:
	//! Possible values of fields on the board.
	enum class Piece { Empty = 0, A = -1, B = 1 };

	static constexpr std::size_t SIZE = 3u;

public:
	Board();

	bool place(Coord c, Piece value); //!< Place a piece at the given coordinate. False if not free.
	void clear();                     //!< Reset all fields to empty.

	Piece get(Coord c) const;    //!< Get the piece at the given coordinate.
	bool isEmpty(Coord c) const; //!< True if the given coordinate is empty.

	std::optional<Coord> firstEmpty() const; //!< First empty field scanning rows top to bottom, each left to right.

	static bool isValid(Coord c); //!< True if the coordinate lies on the board.

	bool operator==(const Board& other) const = default;

private:
	std::array<Piece, SIZE * SIZE> m_board{}; //!< Row major board data.
};

//! Signed weight of a piece.
inline constexpr int weight(Board::Piece piece) {
	return static_cast<int>(piece);
}

//! Maps a seat to the piece it plays.
inline constexpr Board::Piece toPiece(Seat seat) {
	return seat == Seat::A ? Board::Piece::A : (seat == Seat::B ? Board::Piece::B : Board::Piece::Empty);
}

} // namespace ttt
