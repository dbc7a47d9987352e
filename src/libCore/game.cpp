#include "core/game.hpp"
#include "core/gameError.hpp"

#include "Logging.hpp"

#include <memory>
#include <random>
#include <string>
#include <utility>

namespace ttt {

static std::uint64_t seedFrom(const GameConfig& config) {
	return config.seed ? *config.seed : std::random_device{}();
}

Game::Game(GameConfig config)
    : m_config{std::move(config)}, m_table{seedFrom(m_config)}, m_hub{m_config.maxPendingNotifications},
      m_watchdog{m_ioContext, [this](std::uint64_t generation) { onWatchdogExpired(generation); }} {
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	m_ioThread = std::thread([this]() { m_ioContext.run(); });
}

Game::~Game() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_watchdog.stop();
	}

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
}

std::error_code Game::addPlayer(const Player& player) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto previous = m_table.status();
	if (const auto ec = m_table.addPlayer(player)) {
		return ec;
	}

	if (previous != GameStatus::InProgress && m_table.status() == GameStatus::InProgress) {
		m_watchdog.start(m_config.moveTimeout);
	}
	publishLocked();
	return {};
}

std::error_code Game::updatePlayer(const Player& player) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (const auto ec = m_table.updatePlayer(player)) {
		return ec;
	}
	publishLocked();
	return {};
}

std::error_code Game::removePlayer(const PlayerId& id) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto round = m_table.round();
	if (const auto ec = m_table.removePlayer(id)) {
		return ec;
	}

	// A vacated seat starts a new round.
	if (round != m_table.round()) {
		restartWatchdogLocked();
	}
	publishLocked();
	return {};
}

std::error_code Game::placeMove(const Move& move) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return placeMoveLocked(move);
}

std::error_code Game::advance() {
	std::lock_guard<std::mutex> lock(m_mutex);
	return advanceLocked();
}

void Game::reset() {
	std::lock_guard<std::mutex> lock(m_mutex);

	m_watchdog.stop();
	m_table.reset();
	Logger().Log(Logging::LogLevel::Info, "[Game] Table reset.");
	publishLocked();
}

GameSnapshot Game::snapshot() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_table.snapshot();
}

bool Game::isWatchdogRunning() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_watchdog.isRunning();
}

void Game::subscribeState(IGameStateListener* listener) {
	m_hub.subscribe(listener);
}

void Game::unsubscribeState(IGameStateListener* listener) {
	m_hub.unsubscribe(listener);
}

std::error_code Game::placeMoveLocked(const Move& move) {
	if (const auto ec = m_table.placeMove(move)) {
		return ec;
	}

	if (isTerminal(m_table.status())) {
		Logger().Log(Logging::LogLevel::Info, std::string("[Game] Round over with status ") + toString(m_table.status()) + ". Refreshing board.");
		m_watchdog.stop();
		scheduleAdvance(m_table.round());
	} else {
		m_watchdog.reset();
	}
	publishLocked();
	return {};
}

std::error_code Game::advanceLocked() {
	const auto round = m_table.round();
	if (const auto ec = m_table.advance()) {
		return ec;
	}

	if (round != m_table.round()) {
		restartWatchdogLocked();
		publishLocked();
	}
	return {};
}

void Game::restartWatchdogLocked() {
	m_watchdog.stop();
	if (m_table.seatsFilled()) {
		m_watchdog.start(m_config.moveTimeout);
	}
}

void Game::publishLocked() {
	m_hub.publish(m_table.snapshot());
}

void Game::scheduleAdvance(const std::uint64_t round) {
	auto timer = std::make_shared<asio::steady_timer>(m_ioContext, m_config.advanceDelay);
	timer->async_wait([this, timer, round](const asio::error_code& ec) {
		if (!ec) {
			onAdvanceDue(round);
		}
	});
}

void Game::onWatchdogExpired(const std::uint64_t generation) {
	std::lock_guard<std::mutex> lock(m_mutex);

	auto logger = Logger();
	if (!m_watchdog.isCurrent(generation)) {
		logger.Log(Logging::LogLevel::Debug, "[Watchdog] Ignoring stale timeout.");
		return;
	}
	logger.Log(Logging::LogLevel::Info, "[Watchdog] Timeout received.");

	// Took too long. Move for the player on the first free field.
	const auto playerId = m_table.turnPlayerId();
	if (!playerId) {
		logger.Log(Logging::LogLevel::Error, "[Watchdog] Unable to make automatic move: could not find current player id.");
		return;
	}
	const auto coord = m_table.board().firstEmpty();
	if (!coord) {
		logger.Log(Logging::LogLevel::Error, "[Watchdog] Unable to make automatic move: no empty field.");
		return;
	}

	logger.Log(Logging::LogLevel::Info,
	           "[Watchdog] Placing move for player '" + *playerId + "' at (" + std::to_string(coord->x) + ", " + std::to_string(coord->y) + ").");
	if (const auto ec = placeMoveLocked(Move{*playerId, *coord})) {
		logger.Log(Logging::LogLevel::Error, "[Watchdog] Unable to place automatic move: " + ec.message());
	}
}

void Game::onAdvanceDue(const std::uint64_t round) {
	std::lock_guard<std::mutex> lock(m_mutex);

	auto logger = Logger();
	if (m_table.round() != round || !isTerminal(m_table.status())) {
		logger.Log(Logging::LogLevel::Debug, "[Game] Round " + std::to_string(round) + " already advanced.");
		return;
	}

	if (const auto ec = advanceLocked()) {
		logger.Log(Logging::LogLevel::Error, "[Game] Error advancing: " + ec.message());
		return;
	}
	logger.Log(Logging::LogLevel::Info, std::string("[Game] Board refreshed. Status ") + toString(m_table.status()) + ".");
}

} // namespace ttt
