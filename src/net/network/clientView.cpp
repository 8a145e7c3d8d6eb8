#include "network/clientView.hpp"

#include "network/channels.hpp"

#include <type_traits>

namespace wordgrid::network {

static ClientView replaceMatch(ClientView view, const MatchState& match) {
	view.match = match;
	view.selection.clear();
	return view;
}

static ClientView reduce(ClientView view, const ServerLobbyUpdate& event) {
	// Listing channels carry other lobbies; only the lobby's own channel updates the view.
	if (event.channel == lobbyChannel(event.lobby.id)) {
		view.lobby = event.lobby;
	}
	return view;
}

static ClientView reduce(ClientView view, const ServerLobbyDeleted& event) {
	if (view.lobby && view.lobby->id == event.lobbyId) {
		return ClientView{};
	}
	return view;
}

static ClientView reduce(ClientView view, const ServerMatchStarted& event) {
	return replaceMatch(std::move(view), event.match);
}

static ClientView reduce(ClientView view, const ServerMatchUpdate& event) {
	return replaceMatch(std::move(view), event.match);
}

static ClientView reduce(ClientView view, const ServerMatchCompleted& event) {
	return replaceMatch(std::move(view), event.match);
}

static ClientView reduce(ClientView view, const ServerPlayerAction&) {
	return view;
}

static ClientView reduce(ClientView view, const ServerMatchmakingUpdate& event, const UserId& self) {
	// Every queued client hears every pairing on the server. Only adopt the lobby one was paired into.
	if (!view.lobby && event.lobby.findPlayer(self)) {
		view.lobby = event.lobby;
	}
	return view;
}

static ClientView reduce(ClientView view, const ServerReply& event) {
	if (event.error) {
		return view;
	}

	// A reply can trail broadcasts of later changes. Only take what the view does not know yet.
	if (event.lobby && (!view.lobby || view.lobby->id != event.lobby->id)) {
		view.lobby = event.lobby;
	}
	if (event.match && (!view.match || view.match->id != event.match->id)) {
		view = replaceMatch(std::move(view), *event.match);
	}
	return view;
}

ClientView apply(ClientView view, const ServerEvent& event, const UserId& self) {
	return std::visit(
	        [&](const auto& e) {
		        if constexpr (std::is_same_v<std::decay_t<decltype(e)>, ServerMatchmakingUpdate>) {
			        return reduce(std::move(view), e, self);
		        } else {
			        return reduce(std::move(view), e);
		        }
	        },
	        event);
}

bool isMyTurn(const ClientView& view, const UserId& userId) {
	return view.match && view.match->status == MatchStatus::InProgress && view.match->currentPlayerId == userId;
}

} // namespace wordgrid::network
