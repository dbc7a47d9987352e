#pragma once

#include "core/board.hpp"
#include "core/gameStatus.hpp"

namespace ttt {

//! Compute the table status from the seats and the board without side effects.
//! \param board Current board. nullptr if there is no board.
//! \note Empty seats take precedence over the board contents.
GameStatus evaluateStatus(bool seatAFilled, bool seatBFilled, const Board* board);

} // namespace ttt
