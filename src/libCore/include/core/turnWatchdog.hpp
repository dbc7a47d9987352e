#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace ttt {

//! Per move timer. Fires once unless reset or stopped before it elapses.
//!
//! Every start, reset and stop begins a new generation. The expiry callback receives the generation
//! it was armed with; the owner compares it with isCurrent() under its own lock and ignores stale firings.
//! \note start, reset and stop must be called with the owner's lock held.
//!       Timer operations are posted to the io context so the timer is only touched on the IO thread.
class TurnWatchdog {
public:
	using Duration = std::chrono::milliseconds;
	using Callback = std::function<void(std::uint64_t generation)>;

	TurnWatchdog(asio::io_context& ioContext, Callback onExpired);

	void start(Duration duration); //!< Begin a fresh countdown.
	void reset();                  //!< Restart the countdown at full duration. No-op if not running.
	void stop();                   //!< Cancel the countdown without restart.

	bool isRunning() const;
	bool isCurrent(std::uint64_t generation) const; //!< True if a firing of this generation is still wanted.

private:
	void arm(std::uint64_t generation, Duration duration);

private:
	asio::io_context& m_ioContext;
	asio::steady_timer m_timer; //!< Only accessed on the IO thread.
	Callback m_onExpired;

	std::atomic<std::uint64_t> m_generation{0u};
	bool m_running{false};
	Duration m_duration{0};
};

} // namespace ttt
