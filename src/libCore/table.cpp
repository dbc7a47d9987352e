#include "core/table.hpp"
#include "core/gameError.hpp"
#include "core/statusEvaluator.hpp"

#include "Logging.hpp"

#include <cassert>
#include <string>

namespace ttt {

static std::string describe(const Move& move) {
	return "player '" + move.playerId + "' at (" + std::to_string(move.c.x) + ", " + std::to_string(move.c.y) + ")";
}

Table::Table(const std::uint64_t seed) : m_rng{seed} {
}

Table::Table(const GameSnapshot& snapshot, const std::uint64_t seed)
    : m_board{snapshot.board}, m_seatA{snapshot.seatA}, m_seatB{snapshot.seatB}, m_turn{snapshot.turn}, m_round{snapshot.round}, m_rng{seed} {
	for (const auto& player: snapshot.queue) {
		m_queue.push(player);
	}
	updateStatus();
}

std::error_code Table::addPlayer(const Player& player) {
	auto logger = Logger();

	if (m_queue.contains(player.id)) {
		logger.Log(Logging::LogLevel::Warning, "[Table] Player '" + player.id + "' already queued.");
		return GameErrc::AlreadyRegistered;
	}
	if ((m_seatA && m_seatA->id == player.id) || (m_seatB && m_seatB->id == player.id)) {
		logger.Log(Logging::LogLevel::Warning, "[Table] Player '" + player.id + "' already playing.");
		return GameErrc::AlreadyRegistered;
	}

	// The seat that was taken first moves first.
	if (!m_seatA) {
		m_seatA = player;
		m_turn  = m_seatB ? Seat::B : Seat::A;
		logger.Log(Logging::LogLevel::Info, "[Table] Player '" + player.id + "' placed at seat A.");
	} else if (!m_seatB) {
		m_seatB = player;
		m_turn  = Seat::A;
		logger.Log(Logging::LogLevel::Info, "[Table] Player '" + player.id + "' placed at seat B.");
	} else {
		m_queue.push(player);
		logger.Log(Logging::LogLevel::Info, "[Table] Player '" + player.id + "' placed in queue at position " + std::to_string(m_queue.size()) + ".");
	}

	const auto previous = m_status;
	updateStatus();
	if (previous == GameStatus::InsufficientPlayers && m_status == GameStatus::InProgress) {
		logger.Log(Logging::LogLevel::Info, std::string("[Table] Round starting. Seat ") + toString(m_turn) + " moves first.");
	}
	return {};
}

std::error_code Table::updatePlayer(const Player& player) {
	auto logger = Logger();

	if (m_seatA && m_seatA->id == player.id) {
		m_seatA = player;
		logger.Log(Logging::LogLevel::Info, "[Table] Updated player '" + player.id + "' at seat A.");
		return {};
	}
	if (m_seatB && m_seatB->id == player.id) {
		m_seatB = player;
		logger.Log(Logging::LogLevel::Info, "[Table] Updated player '" + player.id + "' at seat B.");
		return {};
	}
	if (auto* queued = m_queue.find(player.id)) {
		*queued = player;
		logger.Log(Logging::LogLevel::Info, "[Table] Updated queued player '" + player.id + "'.");
		return {};
	}

	logger.Log(Logging::LogLevel::Warning, "[Table] Could not find player '" + player.id + "' to update.");
	return GameErrc::PlayerNotFound;
}

std::error_code Table::removePlayer(const PlayerId& id) {
	auto logger = Logger();

	for (const auto seat: {Seat::A, Seat::B}) {
		auto& occupant = seatRef(seat);
		if (occupant && occupant->id == id) {
			occupant.reset();
			logger.Log(Logging::LogLevel::Info, "[Table] Player '" + id + "' removed from seat " + toString(seat) + ".");

			m_board.clear();
			backfillSeats();
			if (!occupant) {
				// Nobody to refill. The remaining player is first in line for the next round.
				const auto other = opponent(seat);
				m_turn           = seatRef(other) ? other : Seat::None;
			}
			++m_round;
			updateStatus();
			return {};
		}
	}

	if (!m_queue.remove(id)) {
		logger.Log(Logging::LogLevel::Warning, "[Table] Player '" + id + "' not playing or queued.");
		return GameErrc::PlayerNotFound;
	}

	logger.Log(Logging::LogLevel::Info, "[Table] Player '" + id + "' removed from queue.");
	return {};
}

std::error_code Table::placeMove(const Move& move) {
	auto logger = Logger();

	if (m_status != GameStatus::InProgress) {
		logger.Log(Logging::LogLevel::Warning, "[Table] Rejecting move of " + describe(move) + ": status is " + toString(m_status) + ".");
		return GameErrc::InvalidMove;
	}
	if (!Board::isValid(move.c)) {
		logger.Log(Logging::LogLevel::Warning, "[Table] Rejecting move of " + describe(move) + ": outside of board.");
		return GameErrc::InvalidMove;
	}

	const auto mover = turnPlayerId();
	if (!mover || *mover != move.playerId) {
		logger.Log(Logging::LogLevel::Warning, "[Table] Rejecting move of " + describe(move) + ": not the players turn.");
		return GameErrc::InvalidMove;
	}
	if (!m_board.place(move.c, toPiece(m_turn))) {
		logger.Log(Logging::LogLevel::Warning, "[Table] Rejecting move of " + describe(move) + ": field already used.");
		return GameErrc::InvalidMove;
	}

	logger.Log(Logging::LogLevel::Info, "[Table] Move placed by " + describe(move) + " for seat " + toString(m_turn) + ".");
	m_turn = opponent(m_turn);
	updateStatus();
	return {};
}

std::error_code Table::advance() {
	auto logger = Logger();

	switch (m_status) {
	case GameStatus::AWins:
		// Winner keeps the seat, loser lines up at the back.
		m_turn  = Seat::B;
		m_seatB = advanceQueue(m_seatB);
		m_board.clear();
		break;
	case GameStatus::BWins:
		m_turn  = Seat::A;
		m_seatA = advanceQueue(m_seatA);
		m_board.clear();
		break;
	case GameStatus::Draw: {
		// Coin flip decides who leaves. The replacement moves first.
		const bool aKeepsSeat = m_coin(m_rng);
		m_turn                = aKeepsSeat ? Seat::B : Seat::A;
		auto& loser           = seatRef(m_turn);
		loser                 = advanceQueue(loser);
		m_board.clear();
		break;
	}
	case GameStatus::InProgress:
		// Only reachable with both seats taken. Nothing to rotate.
		backfillSeats();
		return {};
	case GameStatus::InsufficientPlayers:
		return {};
	default:
		logger.Log(Logging::LogLevel::Error, std::string("[Table] Advancement requested in status ") + toString(m_status) + ".");
		return GameErrc::InvalidStateTransition;
	}

	++m_round;
	updateStatus();
	logger.Log(Logging::LogLevel::Info, "[Table] Advanced to round " + std::to_string(m_round) + ". Seat " + toString(m_turn) + " moves first.");
	return {};
}

void Table::reset() {
	m_board.clear();
	m_queue.clear();
	m_seatA.reset();
	m_seatB.reset();
	m_turn = Seat::None;
	++m_round;
	updateStatus();
}

std::optional<Player> Table::advanceQueue(const std::optional<Player>& outgoing) {
	return m_queue.rotate(outgoing);
}

const Board& Table::board() const {
	return m_board;
}

const PlayerQueue& Table::queue() const {
	return m_queue;
}

const std::optional<Player>& Table::seat(const Seat seat) const {
	assert(seat == Seat::A || seat == Seat::B);
	return seat == Seat::A ? m_seatA : m_seatB;
}

Seat Table::turn() const {
	return m_turn;
}

GameStatus Table::status() const {
	return m_status;
}

std::uint64_t Table::round() const {
	return m_round;
}

bool Table::seatsFilled() const {
	return m_seatA.has_value() && m_seatB.has_value();
}

std::optional<PlayerId> Table::turnPlayerId() const {
	if (m_status != GameStatus::InProgress || m_turn == Seat::None) {
		return {};
	}
	const auto& occupant = seat(m_turn);
	if (!occupant) {
		return {};
	}
	return occupant->id;
}

GameSnapshot Table::snapshot() const {
	return GameSnapshot{
	        .board  = m_board,
	        .queue  = m_queue.players(),
	        .seatA  = m_seatA,
	        .seatB  = m_seatB,
	        .turn   = m_turn,
	        .status = m_status,
	        .round  = m_round,
	};
}

void Table::updateStatus() {
	m_status = evaluateStatus(m_seatA.has_value(), m_seatB.has_value(), &m_board);
}

void Table::backfillSeats() {
	if (!m_seatA) {
		m_seatA = advanceQueue(std::nullopt);
	}
	if (!m_seatB) {
		m_seatB = advanceQueue(std::nullopt);
	}
}

std::optional<Player>& Table::seatRef(const Seat seat) {
	assert(seat == Seat::A || seat == Seat::B);
	return seat == Seat::A ? m_seatA : m_seatB;
}

} // namespace ttt
