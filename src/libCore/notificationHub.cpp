#include "core/notificationHub.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace ttt {

NotificationHub::NotificationHub(const std::size_t maxPending) : m_maxPending{maxPending} {
	m_dispatchThread = std::thread([this] { dispatchLoop(); });
}

NotificationHub::~NotificationHub() {
	m_pending.Release();
	if (m_dispatchThread.joinable()) {
		m_dispatchThread.join();
	}
}

void NotificationHub::subscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.push_back({listener});
	m_listenerCount = m_listeners.size();
}

void NotificationHub::unsubscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; }),
	                  m_listeners.end());
	m_listenerCount = m_listeners.size();
}

void NotificationHub::publish(const GameSnapshot& snapshot) {
	if (m_listenerCount == 0u) {
		return;
	}

	if (const auto dropped = m_pending.PushBounded(snapshot, m_maxPending)) {
		Logger().Log(Logging::LogLevel::Debug, "[Notify] Listeners lagging behind. Dropped " + std::to_string(dropped) + " pending snapshot(s).");
	}
}

void NotificationHub::dispatchLoop() {
	while (true) {
		try {
			deliver(m_pending.Pop());
		} catch (const QueueReleased&) {
			break;
		}
	}
}

void NotificationHub::deliver(const GameSnapshot& snapshot) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	for (const auto& entry: m_listeners) {
		try {
			entry.listener->onGameState(snapshot);
		} catch (const std::exception& ex) {
			Logger().Log(Logging::LogLevel::Error, std::string("[Notify] Listener failed: ") + ex.what());
		}
	}
}

} // namespace ttt
