#pragma once

#include "model/lobby.hpp"
#include "model/matchState.hpp"

namespace wordgrid {

//! Receives full snapshots after every accepted mutation.
//! \note Called synchronously while the entity is still locked, so per-entity order is preserved.
class IStateListener {
public:
	virtual ~IStateListener()                              = default;
	virtual void onLobbyUpdated(const Lobby& lobby)        = 0;
	virtual void onLobbyDeleted(const Lobby& lobby)        = 0; //!< Last snapshot before the lobby went away.
	virtual void onMatchStarted(const MatchState& match)   = 0;
	virtual void onMatchUpdated(const MatchState& match)   = 0;
	virtual void onMatchCompleted(const MatchState& match) = 0;
};

} // namespace wordgrid
