#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace wordgrid::network {

//! Thrown by Pop once the queue was released and drained.
class QueueReleased : public std::runtime_error {
public:
	QueueReleased() : std::runtime_error("Queue released") {}
};

//! Thread safe queue with a blocking Pop function.
template <class Entry>
class SafeQueue {
public:
	//! Push element onto the queue.
	void Push(Entry value);

	//! Thread blocks here until there is an element to receive.
	//! \note Throws QueueReleased when the queue is empty and blocking for threads is disabled.
	Entry Pop();

	//! Stop blocking the threads trying to pop an element from the queue.
	void Release();

private:
	std::deque<Entry> m_queue;              //!< Stores the entries.
	std::mutex m_mutex;                     //!< Manage access to the queue.
	std::condition_variable m_condition;    //!< Notify that element can be popped.
	std::atomic<bool> m_blockThreads{true}; //!< Should the Pop function block the threads or not.
};


template <class Entry>
void SafeQueue<Entry>::Push(Entry value) {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_queue.push_back(std::move(value));
	}
	m_condition.notify_one();
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
void SafeQueue<Entry>::Release() {
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_blockThreads.store(false);
	}
	m_condition.notify_all();
}

} // namespace wordgrid::network
