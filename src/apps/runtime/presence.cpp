#include "app/presence.hpp"

namespace wordgrid::app {

Presence::Presence(std::chrono::milliseconds grace) : m_grace(grace) {
}

void Presence::connected(const UserId& userId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	++m_connections[userId];
	m_deadlines.erase(userId);
}

void Presence::disconnected(const UserId& userId, Clock::time_point now) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_connections.find(userId);
	if (it == m_connections.end()) {
		return;
	}
	if (--it->second == 0u) {
		m_connections.erase(it);
		m_deadlines[userId] = now + m_grace;
	}
}

std::vector<UserId> Presence::expired(Clock::time_point now) {
	std::lock_guard<std::mutex> lock(m_mutex);

	std::vector<UserId> result;
	for (auto it = m_deadlines.begin(); it != m_deadlines.end();) {
		if (it->second <= now) {
			result.push_back(it->first);
			it = m_deadlines.erase(it);
		} else {
			++it;
		}
	}
	return result;
}

bool Presence::isOnline(const UserId& userId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_connections.contains(userId);
}

} // namespace wordgrid::app
