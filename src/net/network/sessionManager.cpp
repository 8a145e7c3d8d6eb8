#include "sessionManager.hpp"

namespace wordgrid::network {

SessionId SessionManager::add(core::ConnectionId connectionId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto sessionId = m_nextSessionId++;
	m_sessions.emplace(sessionId, SessionContext{.connectionId = connectionId, .sessionId = sessionId, .identity = std::nullopt});
	m_connectionToSession[connectionId] = sessionId;
	return sessionId;
}

void SessionManager::remove(SessionId sessionId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_sessions.find(sessionId);
	if (it == m_sessions.end()) {
		return;
	}
	m_connectionToSession.erase(it->second.connectionId);
	m_sessions.erase(it);
}

std::optional<SessionId> SessionManager::sessionId(core::ConnectionId connectionId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_connectionToSession.find(connectionId);
	if (it == m_connectionToSession.end()) {
		return {};
	}
	return it->second;
}

std::optional<core::ConnectionId> SessionManager::connectionId(SessionId sessionId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_sessions.find(sessionId);
	if (it == m_sessions.end()) {
		return {};
	}
	return it->second.connectionId;
}

void SessionManager::identify(SessionId sessionId, ClientIdentity identity) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (const auto it = m_sessions.find(sessionId); it != m_sessions.end()) {
		it->second.identity = std::move(identity);
	}
}

std::optional<ClientIdentity> SessionManager::identity(SessionId sessionId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_sessions.find(sessionId);
	if (it == m_sessions.end()) {
		return {};
	}
	return it->second.identity;
}

} // namespace wordgrid::network
