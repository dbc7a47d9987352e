#pragma once

#include "core/board.hpp"
#include "core/gameSnapshot.hpp"
#include "core/gameStatus.hpp"
#include "core/playerQueue.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <system_error>

namespace ttt {

//! State machine of the shared table: board, seats, turn and queue rotation.
//! Not thread safe. The Game serializes access and drives timers around it.
class Table {
public:
	//! Empty table: empty board, empty queue, both seats free.
	explicit Table(std::uint64_t seed = std::random_device{}());

	//! Restore a table from a snapshot. The status is recomputed, not copied.
	Table(const GameSnapshot& snapshot, std::uint64_t seed);

	std::error_code addPlayer(const Player& player);  //!< Seat A, then seat B, then the back of the queue.
	std::error_code updatePlayer(const Player& player); //!< Replace the stored record of a known id.
	std::error_code removePlayer(const PlayerId& id);   //!< Vacate a seat (and backfill) or splice out of the queue.
	std::error_code placeMove(const Move& move);        //!< Place the piece of the player on turn.
	std::error_code advance();                          //!< Transition to the next round after a terminal status.
	void reset();                                       //!< Back to the just constructed shape.

	//! Append the outgoing player to the queue, then pop and return the front.
	std::optional<Player> advanceQueue(const std::optional<Player>& outgoing);

	const Board& board() const;
	const PlayerQueue& queue() const;
	const std::optional<Player>& seat(Seat seat) const;
	Seat turn() const;
	GameStatus status() const;
	std::uint64_t round() const; //!< Incremented on every round transition and reset.

	bool seatsFilled() const;                     //!< True if both seats are occupied.
	std::optional<PlayerId> turnPlayerId() const; //!< Id of the player that has to move. Empty unless in progress.

	GameSnapshot snapshot() const;

private:
	void updateStatus(); //!< Recompute the status from seats and board.
	void backfillSeats(); //!< Fill each empty seat from the queue front.
	std::optional<Player>& seatRef(Seat seat);

private:
	Board m_board;
	PlayerQueue m_queue;
	std::optional<Player> m_seatA;
	std::optional<Player> m_seatB;
	Seat m_turn{Seat::None};
	GameStatus m_status{GameStatus::InsufficientPlayers};
	std::uint64_t m_round{0u};

	std::mt19937_64 m_rng;                     //!< Source of the draw coin flip.
	std::bernoulli_distribution m_coin{0.5};   //!< Unweighted: each seat loses a draw with equal probability.
};

} // namespace ttt
