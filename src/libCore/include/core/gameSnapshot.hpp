#pragma once

#include "core/board.hpp"
#include "core/gameStatus.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace ttt {

//! Full copy of the game state. Handed to listeners and used for rendering.
struct GameSnapshot {
	Board board;                //!< Current board.
	std::vector<Player> queue;  //!< Waiting players, front first.
	std::optional<Player> seatA;
	std::optional<Player> seatB;
	Seat turn{Seat::None};      //!< Seat allowed to move next.
	GameStatus status{GameStatus::InsufficientPlayers};
	std::uint64_t round{0u};    //!< Number of round transitions since construction.
};

} // namespace ttt
