#include "core/turnWatchdog.hpp"

#include "Logging.hpp"

#include <utility>

namespace ttt {

TurnWatchdog::TurnWatchdog(asio::io_context& ioContext, Callback onExpired)
    : m_ioContext{ioContext}, m_timer{ioContext}, m_onExpired{std::move(onExpired)} {
}

void TurnWatchdog::start(const Duration duration) {
	m_duration = duration;
	m_running  = true;

	Logger().Log(Logging::LogLevel::Info, "[Watchdog] Starting timeout of " + std::to_string(duration.count()) + "ms.");
	arm(++m_generation, m_duration);
}

void TurnWatchdog::reset() {
	if (!m_running) {
		return;
	}

	Logger().Log(Logging::LogLevel::Debug, "[Watchdog] Resetting timeout.");
	arm(++m_generation, m_duration);
}

void TurnWatchdog::stop() {
	if (!m_running) {
		return;
	}
	m_running             = false;
	const auto generation = ++m_generation;

	Logger().Log(Logging::LogLevel::Info, "[Watchdog] Stopping timeout.");
	asio::post(m_ioContext, [this, generation] {
		if (generation == m_generation) {
			m_timer.cancel();
		}
	});
}

bool TurnWatchdog::isRunning() const {
	return m_running;
}

bool TurnWatchdog::isCurrent(const std::uint64_t generation) const {
	return m_running && generation == m_generation;
}

void TurnWatchdog::arm(const std::uint64_t generation, const Duration duration) {
	asio::post(m_ioContext, [this, generation, duration] {
		if (generation != m_generation) {
			return; // Superseded before it was armed.
		}

		// Re-arming cancels a pending wait. Its handler sees operation_aborted.
		m_timer.expires_after(duration);
		m_timer.async_wait([this, generation](const asio::error_code& ec) {
			if (ec == asio::error::operation_aborted || generation != m_generation) {
				return;
			}
			m_onExpired(generation);
		});
	});
}

} // namespace ttt
