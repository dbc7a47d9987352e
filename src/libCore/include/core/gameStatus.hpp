#pragma once

namespace ttt {

//! Status of the table. Always derived from the seats and the board.
enum class GameStatus {
	InsufficientPlayers, //!< At least one seat is empty.
	NoBoard,             //!< Both seats taken but there is no board to play on.
	AWins,               //!< Three A pieces in a line.
	BWins,               //!< Three B pieces in a line.
	Draw,                //!< Board full without a line of three.
	InProgress           //!< Round being played.
};

const char* toString(GameStatus status);

//! True for statuses that end a round and trigger the advancement to the next one.
inline constexpr bool isTerminal(GameStatus status) {
	return status == GameStatus::AWins || status == GameStatus::BWins || status == GameStatus::Draw;
}

} // namespace ttt
