#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace ttt {

//! FIFO waiting line of players that are not seated.
//! \note Position is the only ordering criterion. Duplicate checks are done by the table.
class PlayerQueue {
public:
	void push(const Player& player);      //!< Append a player to the back.
	std::optional<Player> pop();          //!< Take the player from the front. Empty if nobody waits.
	bool remove(const PlayerId& id);      //!< Splice out a player, keeping the order of the rest. False if not queued.
	Player* find(const PlayerId& id);     //!< Pointer to the queued player or nullptr.
	bool contains(const PlayerId& id) const;
	void clear();

	//! Append the outgoing player (if any), then pop the front.
	//! \note Append before pop: an eliminated player lines up behind everybody waiting.
	std::optional<Player> rotate(const std::optional<Player>& outgoing);

	std::size_t size() const;
	bool empty() const;
	std::vector<Player> players() const; //!< Copy of the queue, front first.

private:
	std::deque<Player> m_players;
};

} // namespace ttt
