#pragma once

#include <optional>
#include <string>

namespace ttt {

using Id       = unsigned;    //!< Board index used by the core library.
using PlayerId = std::string; //!< Opaque player identity supplied by the boundary layer.

//! Coordinate pair for the board. x is the column, y the row.
struct Coord {
	Id x, y;
};

//! The two seats at the table. None is used for the turn indicator when nobody may move.
enum class Seat { None = 0, A = 1, B = 2 };

//! Returns the other seat of input seat.
inline constexpr Seat opponent(Seat seat) {
	return seat == Seat::A ? Seat::B : (seat == Seat::B ? Seat::A : Seat::None);
}

//! A user either seated at the table or waiting in the queue.
struct Player {
	PlayerId id;                     //!< Identity of the player.
	std::optional<std::string> name; //!< Display name. Metadata only.
};

//! Move input from a player.
struct Move {
	PlayerId playerId;
	Coord c;
};

const char* toString(Seat seat);

} // namespace ttt
