#include "core/statusEvaluator.hpp"

#include <array>
#include <optional>

namespace ttt {

static constexpr int A_WINS = 3 * weight(Board::Piece::A);
static constexpr int B_WINS = 3 * weight(Board::Piece::B);

static std::optional<GameStatus> checkScore(const int sum) {
	switch (sum) {
	case A_WINS:
		return GameStatus::AWins;
	case B_WINS:
		return GameStatus::BWins;
	default:
		return {};
	}
}

GameStatus evaluateStatus(const bool seatAFilled, const bool seatBFilled, const Board* board) {
	if (!seatAFilled || !seatBFilled) {
		return GameStatus::InsufficientPlayers;
	}
	if (!board) {
		return GameStatus::NoBoard;
	}

	unsigned moves = 0u; // Occupied fields. All occupied without a line is a draw.
	std::array<int, Board::SIZE> colSums{};

	for (Id y = 0u; y != Board::SIZE; ++y) {
		int rowSum = 0;
		for (Id x = 0u; x != Board::SIZE; ++x) {
			const auto value = weight(board->get({x, y}));
			if (value != 0) {
				++moves;
			}
			rowSum += value;
			colSums[x] += value;
		}
		if (const auto status = checkScore(rowSum)) {
			return *status;
		}
	}

	for (const auto sum: colSums) {
		if (const auto status = checkScore(sum)) {
			return *status;
		}
	}

	const auto diagonal = weight(board->get({0u, 0u})) + weight(board->get({1u, 1u})) + weight(board->get({2u, 2u}));
	if (const auto status = checkScore(diagonal)) {
		return *status;
	}

	const auto antiDiagonal = weight(board->get({2u, 0u})) + weight(board->get({1u, 1u})) + weight(board->get({0u, 2u}));
	if (const auto status = checkScore(antiDiagonal)) {
		return *status;
	}

	if (moves == Board::SIZE * Board::SIZE) {
		return GameStatus::Draw;
	}
	return GameStatus::InProgress;
}

} // namespace ttt
