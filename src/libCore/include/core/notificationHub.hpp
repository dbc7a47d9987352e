#pragma once

#include "core/IGameStateListener.hpp"
#include "core/SafeQueue.hpp"
#include "core/gameSnapshot.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

namespace ttt {

//! Allows external components to be updated on game state changes.
//! \note Publishing only enqueues. Listeners run on the hub's own dispatch thread.
class NotificationHub {
	struct ListenerEntry {
		IGameStateListener* listener; //!< Pointer to the listener.
	};

public:
	explicit NotificationHub(std::size_t maxPending);
	~NotificationHub();

	NotificationHub(const NotificationHub&)            = delete;
	NotificationHub& operator=(const NotificationHub&) = delete;

	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener); //!< No callback reaches the listener once this returns.

	//! Queue a snapshot for delivery. Never blocks on listeners.
	//! \note Without listeners the snapshot is dropped.
	void publish(const GameSnapshot& snapshot);

private:
	void dispatchLoop();                         //!< Dispatch thread: drain queue and deliver.
	void deliver(const GameSnapshot& snapshot); //!< Hand one snapshot to every listener.

private:
	std::mutex m_listenerMutex;
	std::vector<ListenerEntry> m_listeners;
	std::atomic<std::size_t> m_listenerCount{0u}; //!< Checked by publish without taking the listener lock.

	std::size_t m_maxPending;          //!< Oldest snapshots are dropped beyond this backlog.
	SafeQueue<GameSnapshot> m_pending; //!< Snapshots waiting for delivery.
	std::thread m_dispatchThread;
};

} // namespace ttt
