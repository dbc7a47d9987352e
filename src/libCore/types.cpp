#include "core/gameStatus.hpp"
#include "core/types.hpp"

namespace ttt {

const char* toString(const Seat seat) {
	switch (seat) {
	case Seat::A:
		return "A";
	case Seat::B:
		return "B";
	case Seat::None:
		break;
	}
	return "None";
}

const char* toString(const GameStatus status) {
	switch (status) {
	case GameStatus::InsufficientPlayers:
		return "InsufficientPlayers";
	case GameStatus::NoBoard:
		return "NoBoard";
	case GameStatus::AWins:
		return "AWins";
	case GameStatus::BWins:
		return "BWins";
	case GameStatus::Draw:
		return "Draw";
	case GameStatus::InProgress:
		return "InProgress";
	}
	return "Unknown";
}

} // namespace ttt
