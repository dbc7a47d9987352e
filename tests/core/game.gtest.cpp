#include "core/IGameStateListener.hpp"
#include "core/game.hpp"
#include "core/gameError.hpp"

#include "testHelpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace ttt::gtest {

using namespace std::chrono_literals;

//! Records every delivered snapshot.
class RecordingListener : public IGameStateListener {
public:
	void onGameState(const GameSnapshot& snapshot) override {
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_snapshots.push_back(snapshot);
		}
		m_condition.notify_all();
	}

	//! Wait until a delivered snapshot matches. Returns the first match.
	std::optional<GameSnapshot> waitFor(const std::function<bool(const GameSnapshot&)>& match, std::chrono::milliseconds timeout = 3s) {
		std::unique_lock<std::mutex> lock(m_mutex);
		std::optional<GameSnapshot> found;
		m_condition.wait_for(lock, timeout, [&] {
			for (const auto& s: m_snapshots) {
				if (match(s)) {
					found = s;
					return true;
				}
			}
			return false;
		});
		return found;
	}

	std::size_t count() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_snapshots.size();
	}

private:
	mutable std::mutex m_mutex;
	std::condition_variable m_condition;
	std::vector<GameSnapshot> m_snapshots;
};

//! Blocks inside the callback until released.
class BlockingListener : public IGameStateListener {
public:
	void onGameState(const GameSnapshot&) override {
		std::unique_lock<std::mutex> lock(m_mutex);
		++m_calls;
		m_condition.notify_all();
		m_condition.wait(lock, [this] { return m_released; });
	}

	bool waitForCall(std::chrono::milliseconds timeout = 3s) {
		std::unique_lock<std::mutex> lock(m_mutex);
		return m_condition.wait_for(lock, timeout, [this] { return m_calls > 0u; });
	}

	void release() {
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			m_released = true;
		}
		m_condition.notify_all();
	}

private:
	std::mutex m_mutex;
	std::condition_variable m_condition;
	unsigned m_calls{0u};
	bool m_released{false};
};

static GameConfig testConfig(std::chrono::milliseconds moveTimeout, std::chrono::milliseconds advanceDelay) {
	GameConfig config;
	config.moveTimeout  = moveTimeout;
	config.advanceDelay = advanceDelay;
	config.seed         = 7u;
	return config;
}

TEST(Game, RoundStartsWithTwoPlayers) {
	Game game(testConfig(10s, 10s));
	EXPECT_EQ(game.snapshot().status, GameStatus::InsufficientPlayers);
	EXPECT_FALSE(game.isWatchdogRunning());

	ASSERT_FALSE(game.addPlayer(player("p1")));
	EXPECT_FALSE(game.isWatchdogRunning());

	ASSERT_FALSE(game.addPlayer(player("p2")));
	const auto snapshot = game.snapshot();
	EXPECT_EQ(snapshot.status, GameStatus::InProgress);
	EXPECT_EQ(snapshot.turn, Seat::A);
	EXPECT_TRUE(game.isWatchdogRunning());

	EXPECT_EQ(game.addPlayer(player("p1")), GameErrc::AlreadyRegistered);
}

TEST(Game, RejectedMoveLeavesBoardUnchanged) {
	Game game(testConfig(10s, 10s));
	ASSERT_FALSE(game.addPlayer(player("p1")));
	ASSERT_FALSE(game.addPlayer(player("p2")));

	ASSERT_FALSE(game.placeMove(Move{"p1", {0u, 0u}}));
	EXPECT_EQ(game.placeMove(Move{"p2", {0u, 0u}}), GameErrc::InvalidMove);
	EXPECT_EQ(game.placeMove(Move{"p1", {1u, 1u}}), GameErrc::InvalidMove);

	const auto snapshot = game.snapshot();
	EXPECT_EQ(snapshot.board, makeBoard({-1, 0, 0, 0, 0, 0, 0, 0, 0}));
	EXPECT_EQ(snapshot.turn, Seat::B);
}

TEST(Game, WatchdogMovesOnFirstEmptyField) {
	RecordingListener listener;
	Game game(testConfig(200ms, 10s));
	game.subscribeState(&listener);

	ASSERT_FALSE(game.addPlayer(player("p1")));
	ASSERT_FALSE(game.addPlayer(player("p2")));
	ASSERT_FALSE(game.placeMove(Move{"p1", {1u, 1u}}));

	// p2 stays idle. The watchdog places B on the first free field.
	const auto automatic = listener.waitFor([](const GameSnapshot& s) { return s.board.get({0u, 0u}) == Board::Piece::B; });
	ASSERT_TRUE(automatic.has_value());
	EXPECT_EQ(automatic->board, makeBoard({1, 0, 0, 0, -1, 0, 0, 0, 0}));
	EXPECT_EQ(automatic->turn, Seat::A);
	EXPECT_EQ(automatic->status, GameStatus::InProgress);

	game.unsubscribeState(&listener);
}

TEST(Game, WatchdogFillsLastFieldAndEndsRound) {
	RecordingListener listener;
	Game game(testConfig(300ms, 10s));
	game.subscribeState(&listener);

	// Seat B is taken first, so it opens the round.
	ASSERT_FALSE(game.addPlayer(player("p1")));
	ASSERT_FALSE(game.addPlayer(player("p2")));
	ASSERT_FALSE(game.removePlayer("p1"));
	ASSERT_FALSE(game.addPlayer(player("p3")));
	ASSERT_EQ(game.snapshot().turn, Seat::B);

	ASSERT_FALSE(game.placeMove(Move{"p2", {1u, 1u}}));
	ASSERT_FALSE(game.placeMove(Move{"p3", {1u, 0u}}));
	ASSERT_FALSE(game.placeMove(Move{"p2", {0u, 1u}}));
	ASSERT_FALSE(game.placeMove(Move{"p3", {2u, 0u}}));
	ASSERT_FALSE(game.placeMove(Move{"p2", {1u, 2u}}));
	ASSERT_FALSE(game.placeMove(Move{"p3", {2u, 1u}}));
	ASSERT_FALSE(game.placeMove(Move{"p2", {2u, 2u}}));
	ASSERT_FALSE(game.placeMove(Move{"p3", {0u, 2u}}));

	// Only (0, 0) is left and B has to move.
	const auto waiting = game.snapshot();
	ASSERT_EQ(waiting.board, makeBoard({0, -1, -1, 1, 1, -1, -1, 1, 1}));
	ASSERT_EQ(waiting.turn, Seat::B);
	ASSERT_EQ(waiting.status, GameStatus::InProgress);

	const auto finished = listener.waitFor([](const GameSnapshot& s) { return s.status == GameStatus::BWins; });
	ASSERT_TRUE(finished.has_value());
	EXPECT_EQ(finished->board, makeBoard({1, -1, -1, 1, 1, -1, -1, 1, 1}));
	EXPECT_EQ(finished->turn, Seat::A);
	EXPECT_FALSE(game.isWatchdogRunning());

	game.unsubscribeState(&listener);
}

TEST(Game, WatchdogResetByMoves) {
	RecordingListener listener;
	Game game(testConfig(300ms, 10s));
	game.subscribeState(&listener);

	ASSERT_FALSE(game.addPlayer(player("p1")));
	ASSERT_FALSE(game.addPlayer(player("p2")));

	// Moves well within the timeout keep the watchdog quiet.
	ASSERT_FALSE(game.placeMove(Move{"p1", {2u, 2u}}));
	std::this_thread::sleep_for(100ms);
	ASSERT_FALSE(game.placeMove(Move{"p2", {2u, 1u}}));
	std::this_thread::sleep_for(100ms);
	ASSERT_FALSE(game.placeMove(Move{"p1", {1u, 2u}}));

	const auto snapshot = game.snapshot();
	EXPECT_EQ(snapshot.board, makeBoard({0, 0, 0, 0, 0, 1, 0, -1, -1}));
	EXPECT_EQ(snapshot.turn, Seat::B);

	game.unsubscribeState(&listener);
}

TEST(Game, FinishedRoundAdvancesAfterDelay) {
	RecordingListener listener;
	Game game(testConfig(10s, 100ms));
	game.subscribeState(&listener);

	ASSERT_FALSE(game.addPlayer(player("p1")));
	ASSERT_FALSE(game.addPlayer(player("p2")));
	ASSERT_FALSE(game.addPlayer(player("q1")));

	ASSERT_FALSE(game.placeMove(Move{"p1", {0u, 0u}}));
	ASSERT_FALSE(game.placeMove(Move{"p2", {0u, 1u}}));
	ASSERT_FALSE(game.placeMove(Move{"p1", {1u, 0u}}));
	ASSERT_FALSE(game.placeMove(Move{"p2", {1u, 1u}}));
	ASSERT_FALSE(game.placeMove(Move{"p1", {2u, 0u}}));

	// Terminal board stays visible and blocks moves until the advancement.
	const auto finished = game.snapshot();
	EXPECT_EQ(finished.status, GameStatus::AWins);
	EXPECT_FALSE(game.isWatchdogRunning());
	EXPECT_EQ(game.placeMove(Move{"p2", {2u, 2u}}), GameErrc::InvalidMove);

	const auto next = listener.waitFor([&](const GameSnapshot& s) { return s.round == finished.round + 1u; });
	ASSERT_TRUE(next.has_value());
	EXPECT_EQ(next->status, GameStatus::InProgress);
	EXPECT_EQ(next->board, Board{});
	EXPECT_EQ(next->seatA->id, "p1");
	EXPECT_EQ(next->seatB->id, "q1");
	EXPECT_EQ(queueIds(next->queue), (std::vector<std::string>{"p2"}));
	EXPECT_EQ(next->turn, Seat::B);
	EXPECT_TRUE(game.isWatchdogRunning());

	game.unsubscribeState(&listener);
}

TEST(Game, RemovalDuringGraceDelayWins) {
	Game game(testConfig(10s, 150ms));

	ASSERT_FALSE(game.addPlayer(player("p1")));
	ASSERT_FALSE(game.addPlayer(player("p2")));
	ASSERT_FALSE(game.addPlayer(player("q1")));

	ASSERT_FALSE(game.placeMove(Move{"p1", {0u, 0u}}));
	ASSERT_FALSE(game.placeMove(Move{"p2", {0u, 1u}}));
	ASSERT_FALSE(game.placeMove(Move{"p1", {1u, 0u}}));
	ASSERT_FALSE(game.placeMove(Move{"p2", {1u, 1u}}));
	ASSERT_FALSE(game.placeMove(Move{"p1", {2u, 0u}}));
	ASSERT_EQ(game.snapshot().status, GameStatus::AWins);

	// Loser leaves before the board clears: seat refilled at once.
	ASSERT_FALSE(game.removePlayer("p2"));
	const auto removed = game.snapshot();
	EXPECT_EQ(removed.status, GameStatus::InProgress);
	EXPECT_EQ(removed.seatA->id, "p1");
	EXPECT_EQ(removed.seatB->id, "q1");
	EXPECT_TRUE(removed.queue.empty());
	EXPECT_TRUE(game.isWatchdogRunning());

	// The pending advancement finds a new round and leaves it alone.
	std::this_thread::sleep_for(400ms);
	const auto later = game.snapshot();
	EXPECT_EQ(later.round, removed.round);
	EXPECT_EQ(later.seatA->id, "p1");
	EXPECT_EQ(later.seatB->id, "q1");
	EXPECT_TRUE(later.queue.empty());
}

TEST(Game, RemoveSeatedPlayerStopsWatchdogWithoutReplacement) {
	Game game(testConfig(10s, 10s));
	ASSERT_FALSE(game.addPlayer(player("p1")));
	ASSERT_FALSE(game.addPlayer(player("p2")));
	ASSERT_FALSE(game.placeMove(Move{"p1", {1u, 1u}}));
	ASSERT_TRUE(game.isWatchdogRunning());

	ASSERT_FALSE(game.removePlayer("p1"));
	const auto snapshot = game.snapshot();
	EXPECT_FALSE(snapshot.seatA.has_value());
	EXPECT_EQ(snapshot.seatB->id, "p2");
	EXPECT_EQ(snapshot.board, Board{});
	EXPECT_EQ(snapshot.status, GameStatus::InsufficientPlayers);
	EXPECT_FALSE(game.isWatchdogRunning());

	EXPECT_EQ(game.removePlayer("p1"), GameErrc::PlayerNotFound);
}

TEST(Game, UpdatePlayer) {
	Game game(testConfig(10s, 10s));
	ASSERT_FALSE(game.addPlayer(player("p1")));

	EXPECT_FALSE(game.updatePlayer(Player{.id = "p1", .name = "Alice"}));
	EXPECT_EQ(game.snapshot().seatA->name, "Alice");
	EXPECT_EQ(game.updatePlayer(player("p9")), GameErrc::PlayerNotFound);
}

TEST(Game, ResetClearsEverything) {
	Game game(testConfig(10s, 10s));
	ASSERT_FALSE(game.addPlayer(player("p1")));
	ASSERT_FALSE(game.addPlayer(player("p2")));
	ASSERT_FALSE(game.addPlayer(player("p3")));
	ASSERT_FALSE(game.placeMove(Move{"p1", {1u, 1u}}));

	game.reset();
	const auto snapshot = game.snapshot();
	EXPECT_EQ(snapshot.status, GameStatus::InsufficientPlayers);
	EXPECT_EQ(snapshot.turn, Seat::None);
	EXPECT_FALSE(snapshot.seatA.has_value());
	EXPECT_FALSE(snapshot.seatB.has_value());
	EXPECT_TRUE(snapshot.queue.empty());
	EXPECT_EQ(snapshot.board, Board{});
	EXPECT_FALSE(game.isWatchdogRunning());

	// Advancing a fresh table does nothing.
	EXPECT_FALSE(game.advance());
	EXPECT_EQ(game.snapshot().status, GameStatus::InsufficientPlayers);
}

TEST(Game, NotificationsDoNotBlockOperations) {
	BlockingListener listener;
	Game game(testConfig(10s, 10s));
	game.subscribeState(&listener);

	ASSERT_FALSE(game.addPlayer(player("p1")));
	ASSERT_TRUE(listener.waitForCall());

	// The listener is stuck in its first callback; the game keeps going.
	ASSERT_FALSE(game.addPlayer(player("p2")));
	ASSERT_FALSE(game.placeMove(Move{"p1", {0u, 0u}}));
	ASSERT_FALSE(game.placeMove(Move{"p2", {1u, 1u}}));
	EXPECT_EQ(game.snapshot().turn, Seat::A);

	listener.release();
	game.unsubscribeState(&listener);
}

TEST(Game, NotificationPerMutation) {
	RecordingListener listener;
	Game game(testConfig(10s, 10s));

	// Nothing is delivered before a listener subscribes.
	ASSERT_FALSE(game.addPlayer(player("p1")));
	game.subscribeState(&listener);

	ASSERT_FALSE(game.addPlayer(player("p2")));
	ASSERT_FALSE(game.placeMove(Move{"p1", {0u, 0u}}));
	EXPECT_EQ(game.placeMove(Move{"p1", {1u, 0u}}), GameErrc::InvalidMove); // Rejected: no notification.
	ASSERT_FALSE(game.updatePlayer(Player{.id = "p2", .name = "Bob"}));

	const auto last = listener.waitFor([](const GameSnapshot& s) { return s.seatB && s.seatB->name == "Bob"; });
	ASSERT_TRUE(last.has_value());
	EXPECT_EQ(last->board, makeBoard({-1, 0, 0, 0, 0, 0, 0, 0, 0}));
	EXPECT_EQ(listener.count(), 3u);

	game.unsubscribeState(&listener);
}

} // namespace ttt::gtest
