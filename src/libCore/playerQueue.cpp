#include "core/playerQueue.hpp"

#include <algorithm>

namespace ttt {

void PlayerQueue::push(const Player& player) {
	m_players.push_back(player);
}

std::optional<Player> PlayerQueue::pop() {
	if (m_players.empty()) {
		return {};
	}
	auto front = std::move(m_players.front());
	m_players.pop_front();
	return front;
}

bool PlayerQueue::remove(const PlayerId& id) {
	const auto it = std::find_if(m_players.begin(), m_players.end(), [&](const Player& p) { return p.id == id; });
	if (it == m_players.end()) {
		return false;
	}
	m_players.erase(it);
	return true;
}

Player* PlayerQueue::find(const PlayerId& id) {
	const auto it = std::find_if(m_players.begin(), m_players.end(), [&](const Player& p) { return p.id == id; });
	return it == m_players.end() ? nullptr : &*it;
}

bool PlayerQueue::contains(const PlayerId& id) const {
	return std::any_of(m_players.begin(), m_players.end(), [&](const Player& p) { return p.id == id; });
}

void PlayerQueue::clear() {
	m_players.clear();
}

std::optional<Player> PlayerQueue::rotate(const std::optional<Player>& outgoing) {
	if (outgoing) {
		push(*outgoing);
	}
	return pop();
}

std::size_t PlayerQueue::size() const {
	return m_players.size();
}

bool PlayerQueue::empty() const {
	return m_players.empty();
}

std::vector<Player> PlayerQueue::players() const {
	return {m_players.begin(), m_players.end()};
}

} // namespace ttt
