#pragma once

#include "model/lobby.hpp"
#include "model/matchState.hpp"
#include "network/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wordgrid::network {

//! Live selection feedback of the player on turn. Relayed as is, never changes state.
struct PlayerAction {
	std::string kind;             //!< Free form, e.g. "select" or "clear".
	std::vector<Coord> selection; //!< Cells currently selected.

	bool operator==(const PlayerAction&) const = default;
};

// Client Network Events (client -> server)
struct ClientIdentify {
	UserId userId;
	std::string username;
};
struct ClientSubscribe {
	Channel channel;
};
struct ClientUnsubscribe {
	Channel channel;
};
struct ClientPlayerAction {
	MatchId matchId;
	PlayerAction action;
};

// Requests (client -> server). Answered with a ServerReply carrying the same requestId.
struct CreateLobbyRequest {
	std::uint64_t requestId;
	Visibility visibility;
	ServerId serverId;
};
struct JoinLobbyRequest {
	std::uint64_t requestId;
	std::optional<LobbyId> lobbyId; //!< Either the id or the join code must be set.
	std::optional<std::string> code;
};
struct SetReadyRequest {
	std::uint64_t requestId;
	LobbyId lobbyId;
	bool ready;
};
struct LeaveLobbyRequest {
	std::uint64_t requestId;
	LobbyId lobbyId;
};
struct RemovePlayerRequest {
	std::uint64_t requestId;
	LobbyId lobbyId;
	UserId targetUserId;
};
struct StartMatchRequest {
	std::uint64_t requestId;
	LobbyId lobbyId;
};
struct ListLobbiesRequest {
	std::uint64_t requestId;
	ServerId serverId;
};
struct SubmitWordRequest {
	std::uint64_t requestId;
	MatchId matchId;
	std::vector<Coord> path;
};
struct ShuffleGridRequest {
	std::uint64_t requestId;
	MatchId matchId;
};
struct JoinQueueRequest {
	std::uint64_t requestId;
	ServerId serverId;
};
struct LeaveQueueRequest {
	std::uint64_t requestId;
};

// Server Events (server -> client). Broadcasts name the channel they were published on.
struct ServerLobbyUpdate {
	Channel channel;
	Lobby lobby;
};
struct ServerLobbyDeleted {
	Channel channel;
	LobbyId lobbyId;
};
struct ServerMatchStarted {
	Channel channel;
	MatchState match;
};
struct ServerMatchUpdate {
	Channel channel;
	MatchState match;
};
struct ServerMatchCompleted {
	Channel channel;
	MatchState match;
};
struct ServerPlayerAction {
	Channel channel;
	UserId playerId;
	std::string username;
	PlayerAction action;
};
struct ServerMatchmakingUpdate {
	Channel channel;
	Lobby lobby; //!< Lobby created for the paired players.
};

//! Reply error for requests of sessions that did not identify yet.
inline constexpr std::string_view ERROR_NOT_IDENTIFIED = "not_identified";

//! Answer to one request. Sent only to the requesting connection.
struct ServerReply {
	std::uint64_t requestId;
	std::optional<std::string> error; //!< Reject reason. Empty on success.
	std::optional<Lobby> lobby;
	std::optional<MatchState> match;
	std::vector<Lobby> lobbies;
	std::optional<std::size_t> queuePosition; //!< 1-based position while waiting in the matchmaking queue.
	std::optional<std::size_t> queueSize;
};

using ClientRequest = std::variant<CreateLobbyRequest, JoinLobbyRequest, SetReadyRequest, LeaveLobbyRequest, RemovePlayerRequest, StartMatchRequest,
                                   ListLobbiesRequest, SubmitWordRequest, ShuffleGridRequest, JoinQueueRequest, LeaveQueueRequest>;

using ClientEvent = std::variant<ClientIdentify, ClientSubscribe, ClientUnsubscribe, ClientPlayerAction, ClientRequest>;
using ServerEvent = std::variant<ServerLobbyUpdate, ServerLobbyDeleted, ServerMatchStarted, ServerMatchUpdate, ServerMatchCompleted, ServerPlayerAction,
                                 ServerMatchmakingUpdate, ServerReply>;

std::uint64_t requestIdOf(const ClientRequest& request);

// Serialize typed events to JSON messages.
std::string toMessage(const ClientEvent& event);
std::string toMessage(const ServerEvent& event);

// Parse JSON messages into typed events. Returns empty on invalid input.
std::optional<ClientEvent> fromClientMessage(const std::string& message);
std::optional<ServerEvent> fromServerMessage(const std::string& message);

} // namespace wordgrid::network
