#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace ttt {

//! Engine settings. Defaults match the public table.
struct GameConfig {
	using Duration = std::chrono::milliseconds;

	Duration moveTimeout{std::chrono::seconds(5)};  //!< Time a player has to move before a move is made automatically.
	Duration advanceDelay{std::chrono::seconds(3)}; //!< Finished boards stay visible this long before clearing.
	std::optional<std::uint64_t> seed;              //!< Seed for the draw coin flip. Random if empty.
	std::size_t maxPendingNotifications{64u};       //!< Backlog of undelivered snapshots.
};

} // namespace ttt
