#pragma once

#include "core/IGameStateListener.hpp"
#include "core/gameConfig.hpp"
#include "core/gameSnapshot.hpp"
#include "core/notificationHub.hpp"
#include "core/table.hpp"
#include "core/turnWatchdog.hpp"
#include "core/types.hpp"

#include <asio.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace ttt {

//! The shared table engine.
//! All operations are serialized by one lock, which the turn watchdog and the deferred round advancement
//! acquire as well before touching the table. Every successful mutation publishes a snapshot to the subscribed listeners.
class Game {
public:
	explicit Game(GameConfig config = {});
	~Game();

	Game(const Game&)            = delete;
	Game& operator=(const Game&) = delete;

	std::error_code addPlayer(const Player& player);    //!< Seat or queue a new player. Starts the round once both seats are taken.
	std::error_code updatePlayer(const Player& player); //!< Replace the stored record of a known player.
	std::error_code removePlayer(const PlayerId& id);   //!< Remove a player. A vacated seat is backfilled immediately.
	std::error_code placeMove(const Move& move);        //!< Place a piece for the player on turn.
	std::error_code advance();                          //!< Move on to the next round. No-op if there is nothing to advance.
	void reset();                                       //!< Clear board, seats and queue.

	GameSnapshot snapshot() const; //!< Copy of the full state for serialization.
	bool isWatchdogRunning() const;

public:
	void subscribeState(IGameStateListener* listener);
	void unsubscribeState(IGameStateListener* listener);

private:
	std::error_code placeMoveLocked(const Move& move);
	std::error_code advanceLocked();
	void restartWatchdogLocked(); //!< Stop the watchdog and start a fresh one if both seats are taken.
	void publishLocked();

	void scheduleAdvance(std::uint64_t round); //!< Advance the finished round after the grace delay.

	// Run on the IO thread.
	void onWatchdogExpired(std::uint64_t generation);
	void onAdvanceDue(std::uint64_t round);

private:
	GameConfig m_config;

	mutable std::mutex m_mutex; //!< Guards the table and the watchdog state.
	Table m_table;
	NotificationHub m_hub; //!< Hub to signal state changes to external components.

	asio::io_context m_ioContext; //!< Runs the watchdog and the deferred advancements.
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	TurnWatchdog m_watchdog;
	std::thread m_ioThread; //!< IO context thread.
};

} // namespace ttt
