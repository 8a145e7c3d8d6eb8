#include "channelRegistry.hpp"

namespace wordgrid::network {

bool ChannelRegistry::subscribe(SessionId sessionId, const Channel& channel) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (!m_subscribers[channel].insert(sessionId).second) {
		return false;
	}
	m_channels[sessionId].insert(channel);
	return true;
}

bool ChannelRegistry::unsubscribe(SessionId sessionId, const Channel& channel) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_subscribers.find(channel);
	if (it == m_subscribers.end() || it->second.erase(sessionId) == 0u) {
		return false;
	}
	if (it->second.empty()) {
		m_subscribers.erase(it);
	}

	if (const auto sessionIt = m_channels.find(sessionId); sessionIt != m_channels.end()) {
		sessionIt->second.erase(channel);
		if (sessionIt->second.empty()) {
			m_channels.erase(sessionIt);
		}
	}
	return true;
}

void ChannelRegistry::removeSession(SessionId sessionId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto sessionIt = m_channels.find(sessionId);
	if (sessionIt == m_channels.end()) {
		return;
	}

	for (const auto& channel : sessionIt->second) {
		const auto it = m_subscribers.find(channel);
		if (it == m_subscribers.end()) {
			continue;
		}
		it->second.erase(sessionId);
		if (it->second.empty()) {
			m_subscribers.erase(it);
		}
	}
	m_channels.erase(sessionIt);
}

std::vector<Channel> ChannelRegistry::channels(SessionId sessionId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_channels.find(sessionId);
	if (it == m_channels.end()) {
		return {};
	}
	return {it->second.begin(), it->second.end()};
}

std::size_t ChannelRegistry::subscriberCount(const Channel& channel) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_subscribers.find(channel);
	return it == m_subscribers.end() ? 0u : it->second.size();
}

std::size_t ChannelRegistry::forEachSubscriber(const Channel& channel, const std::function<void(SessionId)>& visitor) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_subscribers.find(channel);
	if (it == m_subscribers.end()) {
		return 0u;
	}
	for (const auto sessionId : it->second) {
		visitor(sessionId);
	}
	return it->second.size();
}

} // namespace wordgrid::network
