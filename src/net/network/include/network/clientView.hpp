#pragma once

#include "model/lobby.hpp"
#include "model/matchState.hpp"
#include "network/nwEvents.hpp"

#include <optional>
#include <vector>

namespace wordgrid::network {

//! What one client renders. Lobby and match are copies of server state and only ever replaced whole.
struct ClientView {
	std::optional<Lobby> lobby;
	std::optional<MatchState> match;
	std::vector<Coord> selection; //!< Tiles the local player picked for the next submission.
};

//! Fold one server event into the view of user self. Pure function.
//! \note Every match broadcast discards the local selection. Lobby listing updates are ignored.
ClientView apply(ClientView view, const ServerEvent& event, const UserId& self);

//! True if the server says it is this user's turn in the current match.
bool isMyTurn(const ClientView& view, const UserId& userId);

} // namespace wordgrid::network
