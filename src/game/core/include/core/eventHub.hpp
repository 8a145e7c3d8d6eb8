#pragma once

#include "core/IStateListener.hpp"

#include <mutex>
#include <vector>

namespace wordgrid {

//! Fans state snapshots out to the registered listeners.
//! \note Signals are synchronous and run on the caller thread.
class EventHub {
public:
	void subscribe(IStateListener* listener);
	void unsubscribe(IStateListener* listener);

	void signalLobbyUpdated(const Lobby& lobby);
	void signalLobbyDeleted(const Lobby& lobby);
	void signalMatchStarted(const MatchState& match);
	void signalMatchUpdated(const MatchState& match);
	void signalMatchCompleted(const MatchState& match);

private:
	std::mutex m_listenerMutex;
	std::vector<IStateListener*> m_listeners;
};

} // namespace wordgrid
