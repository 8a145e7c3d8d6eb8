#include "core/eventHub.hpp"

#include <algorithm>

namespace wordgrid {

void EventHub::subscribe(IStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	if (std::ranges::find(m_listeners, listener) == m_listeners.end()) {
		m_listeners.push_back(listener);
	}
}

void EventHub::unsubscribe(IStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	std::erase(m_listeners, listener);
}

void EventHub::signalLobbyUpdated(const Lobby& lobby) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	for (auto* listener: m_listeners) {
		listener->onLobbyUpdated(lobby);
	}
}

void EventHub::signalLobbyDeleted(const Lobby& lobby) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	for (auto* listener: m_listeners) {
		listener->onLobbyDeleted(lobby);
	}
}

void EventHub::signalMatchStarted(const MatchState& match) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	for (auto* listener: m_listeners) {
		listener->onMatchStarted(match);
	}
}

void EventHub::signalMatchUpdated(const MatchState& match) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	for (auto* listener: m_listeners) {
		listener->onMatchUpdated(match);
	}
}

void EventHub::signalMatchCompleted(const MatchState& match) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);
	for (auto* listener: m_listeners) {
		listener->onMatchCompleted(match);
	}
}

} // namespace wordgrid
