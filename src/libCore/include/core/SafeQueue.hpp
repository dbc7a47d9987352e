#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace ttt {

//! Thrown by SafeQueue::Pop once the queue is released and drained.
class QueueReleased : public std::runtime_error {
public:
	QueueReleased() : std::runtime_error("queue released") {
	}
};

//! Thread safe queue with a blocking Pop function.
template <class Entry>
class SafeQueue {
public:
	SafeQueue();

	//! Push element onto the queue.
	void Push(const Entry& value);

	//! Push element onto the queue, dropping the oldest entries beyond maxSize.
	//! \returns Number of dropped entries.
	std::size_t PushBounded(const Entry& value, std::size_t maxSize);

	//! Thread blocks here until there is an element to receive.
	//! \note Throws QueueReleased when the queue is empty and blocking for threads is disabled.
	Entry Pop();

	//! Returns true if the queue is empty; false otherwise.
	bool Empty() const;

	//! Stop blocking the threads trying to pop an element from the queue.
	void Release();

protected:
	std::deque<Entry> m_queue;           //!< Stores the entries.
	mutable std::mutex m_mutex;          //!< Manage access to the queue.
	std::condition_variable m_condition; //!< Notify that element can be popped.
	std::atomic<bool> m_blockThreads;    //!< Should the Pop function block the threads or not.
};


template <class Entry>
SafeQueue<Entry>::SafeQueue() : m_blockThreads(true) {
}

template <class Entry>
void SafeQueue<Entry>::Push(const Entry& value) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_queue.push_back(value);
	}
	m_condition.notify_one();
}

template <class Entry>
std::size_t SafeQueue<Entry>::PushBounded(const Entry& value, const std::size_t maxSize) {
	std::size_t dropped = 0u;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_queue.push_back(value);
		while (maxSize != 0u && m_queue.size() > maxSize) {
			m_queue.pop_front();
			++dropped;
		}
	}
	m_condition.notify_one();
	return dropped;
}

template <class Entry>
Entry SafeQueue<Entry>::Pop() {
	std::unique_lock<std::mutex> lock(m_mutex);
	m_condition.wait(lock, [this] { return !(m_queue.empty() && m_blockThreads); });

	if (m_queue.empty()) {
		throw QueueReleased();
	}
	Entry element = std::move(m_queue.front());
	m_queue.pop_front();
	return element;
}

template <class Entry>
bool SafeQueue<Entry>::Empty() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_queue.empty();
}

template <class Entry>
void SafeQueue<Entry>::Release() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_blockThreads.store(false);
	}
	m_condition.notify_all();
}

} // namespace ttt
