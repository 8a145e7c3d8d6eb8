#include "network/nwEvents.hpp"

#include "model/json.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

namespace wordgrid::network {

using nlohmann::json;

static constexpr std::string_view CLIENT_IDENTIFY    = "identify";
static constexpr std::string_view CLIENT_SUBSCRIBE   = "subscribe";
static constexpr std::string_view CLIENT_UNSUBSCRIBE = "unsubscribe";
static constexpr std::string_view CLIENT_ACTION      = "player:action";

static constexpr std::string_view REQUEST_CREATE_LOBBY  = "lobby:create";
static constexpr std::string_view REQUEST_JOIN_LOBBY    = "lobby:join";
static constexpr std::string_view REQUEST_SET_READY     = "lobby:ready";
static constexpr std::string_view REQUEST_LEAVE_LOBBY   = "lobby:leave";
static constexpr std::string_view REQUEST_REMOVE_PLAYER = "lobby:remove";
static constexpr std::string_view REQUEST_START_MATCH   = "lobby:start";
static constexpr std::string_view REQUEST_LIST_LOBBIES  = "lobby:list";
static constexpr std::string_view REQUEST_SUBMIT_WORD   = "match:submit";
static constexpr std::string_view REQUEST_SHUFFLE_GRID  = "match:shuffle";
static constexpr std::string_view REQUEST_JOIN_QUEUE    = "matchmaking:join";
static constexpr std::string_view REQUEST_LEAVE_QUEUE   = "matchmaking:leave";

static constexpr std::string_view SERVER_LOBBY_UPDATE    = "lobby:update";
static constexpr std::string_view SERVER_LOBBY_DELETED   = "lobby:deleted";
static constexpr std::string_view SERVER_MATCH_STARTED   = "match:started";
static constexpr std::string_view SERVER_MATCH_UPDATE    = "match:update";
static constexpr std::string_view SERVER_MATCH_COMPLETED = "match:completed";
static constexpr std::string_view SERVER_PLAYER_ACTION   = "player:action";
static constexpr std::string_view SERVER_MATCHMAKING     = "matchmaking:update";
static constexpr std::string_view SERVER_REPLY           = "reply";

static json envelope(std::string_view type) {
	return json{{"type", std::string{type}}};
}

static json toJson(const PlayerAction& action) {
	return json{{"kind", action.kind}, {"selection", action.selection}};
}

static PlayerAction playerActionFromJson(const json& j) {
	return PlayerAction{
	        .kind      = j.at("kind").get<std::string>(),
	        .selection = j.at("selection").get<std::vector<Coord>>(),
	};
}

template <class T>
static std::optional<T> optionalFromJson(const json& j, const char* key) {
	if (!j.contains(key) || j.at(key).is_null()) {
		return std::nullopt;
	}
	return j.at(key).get<T>();
}

// Client Events

static json toJson(const CreateLobbyRequest& r) {
	auto j          = envelope(REQUEST_CREATE_LOBBY);
	j["visibility"] = r.visibility;
	j["serverId"]   = r.serverId;
	return j;
}
static json toJson(const JoinLobbyRequest& r) {
	auto j = envelope(REQUEST_JOIN_LOBBY);
	if (r.lobbyId) {
		j["lobbyId"] = *r.lobbyId;
	}
	if (r.code) {
		j["code"] = *r.code;
	}
	return j;
}
static json toJson(const SetReadyRequest& r) {
	auto j       = envelope(REQUEST_SET_READY);
	j["lobbyId"] = r.lobbyId;
	j["ready"]   = r.ready;
	return j;
}
static json toJson(const LeaveLobbyRequest& r) {
	auto j       = envelope(REQUEST_LEAVE_LOBBY);
	j["lobbyId"] = r.lobbyId;
	return j;
}
static json toJson(const RemovePlayerRequest& r) {
	auto j            = envelope(REQUEST_REMOVE_PLAYER);
	j["lobbyId"]      = r.lobbyId;
	j["targetUserId"] = r.targetUserId;
	return j;
}
static json toJson(const StartMatchRequest& r) {
	auto j       = envelope(REQUEST_START_MATCH);
	j["lobbyId"] = r.lobbyId;
	return j;
}
static json toJson(const ListLobbiesRequest& r) {
	auto j        = envelope(REQUEST_LIST_LOBBIES);
	j["serverId"] = r.serverId;
	return j;
}
static json toJson(const SubmitWordRequest& r) {
	auto j       = envelope(REQUEST_SUBMIT_WORD);
	j["matchId"] = r.matchId;
	j["path"]    = r.path;
	return j;
}
static json toJson(const ShuffleGridRequest& r) {
	auto j       = envelope(REQUEST_SHUFFLE_GRID);
	j["matchId"] = r.matchId;
	return j;
}
static json toJson(const JoinQueueRequest& r) {
	auto j        = envelope(REQUEST_JOIN_QUEUE);
	j["serverId"] = r.serverId;
	return j;
}
static json toJson(const LeaveQueueRequest&) {
	return envelope(REQUEST_LEAVE_QUEUE);
}

static json toJson(const ClientIdentify& e) {
	auto j        = envelope(CLIENT_IDENTIFY);
	j["userId"]   = e.userId;
	j["username"] = e.username;
	return j;
}
static json toJson(const ClientSubscribe& e) {
	auto j       = envelope(CLIENT_SUBSCRIBE);
	j["channel"] = e.channel;
	return j;
}
static json toJson(const ClientUnsubscribe& e) {
	auto j       = envelope(CLIENT_UNSUBSCRIBE);
	j["channel"] = e.channel;
	return j;
}
static json toJson(const ClientPlayerAction& e) {
	auto j       = envelope(CLIENT_ACTION);
	j["matchId"] = e.matchId;
	j["action"]  = toJson(e.action);
	return j;
}
static json toJson(const ClientRequest& request) {
	auto j = std::visit([](const auto& r) { return toJson(r); }, request);

	j["requestId"] = requestIdOf(request);
	return j;
}

std::uint64_t requestIdOf(const ClientRequest& request) {
	return std::visit([](const auto& r) { return r.requestId; }, request);
}

std::string toMessage(const ClientEvent& event) {
	return std::visit([](const auto& e) { return toJson(e).dump(); }, event);
}

static std::optional<ClientRequest> requestFromJson(const std::string& type, const json& j) {
	const auto requestId = j.at("requestId").get<std::uint64_t>();

	if (type == REQUEST_CREATE_LOBBY) {
		return CreateLobbyRequest{
		        .requestId  = requestId,
		        .visibility = j.at("visibility").get<Visibility>(),
		        .serverId   = j.value("serverId", DEFAULT_SERVER_ID),
		};
	}
	if (type == REQUEST_JOIN_LOBBY) {
		JoinLobbyRequest request{
		        .requestId = requestId,
		        .lobbyId   = optionalFromJson<LobbyId>(j, "lobbyId"),
		        .code      = optionalFromJson<std::string>(j, "code"),
		};
		if (!request.lobbyId && !request.code) {
			return {};
		}
		return request;
	}
	if (type == REQUEST_SET_READY) {
		return SetReadyRequest{.requestId = requestId, .lobbyId = j.at("lobbyId").get<LobbyId>(), .ready = j.at("ready").get<bool>()};
	}
	if (type == REQUEST_LEAVE_LOBBY) {
		return LeaveLobbyRequest{.requestId = requestId, .lobbyId = j.at("lobbyId").get<LobbyId>()};
	}
	if (type == REQUEST_REMOVE_PLAYER) {
		return RemovePlayerRequest{
		        .requestId    = requestId,
		        .lobbyId      = j.at("lobbyId").get<LobbyId>(),
		        .targetUserId = j.at("targetUserId").get<UserId>(),
		};
	}
	if (type == REQUEST_START_MATCH) {
		return StartMatchRequest{.requestId = requestId, .lobbyId = j.at("lobbyId").get<LobbyId>()};
	}
	if (type == REQUEST_LIST_LOBBIES) {
		return ListLobbiesRequest{.requestId = requestId, .serverId = j.value("serverId", DEFAULT_SERVER_ID)};
	}
	if (type == REQUEST_SUBMIT_WORD) {
		return SubmitWordRequest{
		        .requestId = requestId,
		        .matchId   = j.at("matchId").get<MatchId>(),
		        .path      = j.at("path").get<std::vector<Coord>>(),
		};
	}
	if (type == REQUEST_SHUFFLE_GRID) {
		return ShuffleGridRequest{.requestId = requestId, .matchId = j.at("matchId").get<MatchId>()};
	}
	if (type == REQUEST_JOIN_QUEUE) {
		return JoinQueueRequest{.requestId = requestId, .serverId = j.value("serverId", DEFAULT_SERVER_ID)};
	}
	if (type == REQUEST_LEAVE_QUEUE) {
		return LeaveQueueRequest{.requestId = requestId};
	}

	return {};
}

std::optional<ClientEvent> fromClientMessage(const std::string& message) {
	try {
		const auto j    = json::parse(message);
		const auto type = j.at("type").get<std::string>();

		if (type == CLIENT_IDENTIFY) {
			return ClientIdentify{.userId = j.at("userId").get<UserId>(), .username = j.at("username").get<std::string>()};
		}
		if (type == CLIENT_SUBSCRIBE) {
			return ClientSubscribe{.channel = j.at("channel").get<Channel>()};
		}
		if (type == CLIENT_UNSUBSCRIBE) {
			return ClientUnsubscribe{.channel = j.at("channel").get<Channel>()};
		}
		if (type == CLIENT_ACTION) {
			return ClientPlayerAction{.matchId = j.at("matchId").get<MatchId>(), .action = playerActionFromJson(j.at("action"))};
		}

		if (auto request = requestFromJson(type, j)) {
			return ClientEvent{std::move(*request)};
		}
	} catch (const std::exception&) {}

	// Invalid
	return {};
}

// Server Events

static json toJson(const ServerLobbyUpdate& e) {
	auto j       = envelope(SERVER_LOBBY_UPDATE);
	j["channel"] = e.channel;
	j["lobby"]   = e.lobby;
	return j;
}
static json toJson(const ServerLobbyDeleted& e) {
	auto j       = envelope(SERVER_LOBBY_DELETED);
	j["channel"] = e.channel;
	j["lobbyId"] = e.lobbyId;
	return j;
}
static json toJson(const ServerMatchStarted& e) {
	auto j       = envelope(SERVER_MATCH_STARTED);
	j["channel"] = e.channel;
	j["match"]   = e.match;
	return j;
}
static json toJson(const ServerMatchUpdate& e) {
	auto j       = envelope(SERVER_MATCH_UPDATE);
	j["channel"] = e.channel;
	j["match"]   = e.match;
	return j;
}
static json toJson(const ServerMatchCompleted& e) {
	auto j       = envelope(SERVER_MATCH_COMPLETED);
	j["channel"] = e.channel;
	j["match"]   = e.match;
	return j;
}
static json toJson(const ServerPlayerAction& e) {
	auto j        = envelope(SERVER_PLAYER_ACTION);
	j["channel"]  = e.channel;
	j["playerId"] = e.playerId;
	j["username"] = e.username;
	j["action"]   = toJson(e.action);
	return j;
}
static json toJson(const ServerMatchmakingUpdate& e) {
	auto j       = envelope(SERVER_MATCHMAKING);
	j["channel"] = e.channel;
	j["lobby"]   = e.lobby;
	return j;
}
static json toJson(const ServerReply& e) {
	auto j         = envelope(SERVER_REPLY);
	j["requestId"] = e.requestId;
	j["ok"]        = !e.error.has_value();
	if (e.error) {
		j["error"] = *e.error;
	}
	if (e.lobby) {
		j["lobby"] = *e.lobby;
	}
	if (e.match) {
		j["match"] = *e.match;
	}
	if (!e.lobbies.empty()) {
		j["lobbies"] = e.lobbies;
	}
	if (e.queuePosition) {
		j["queuePosition"] = *e.queuePosition;
	}
	if (e.queueSize) {
		j["queueSize"] = *e.queueSize;
	}
	return j;
}

std::string toMessage(const ServerEvent& event) {
	return std::visit([](const auto& e) { return toJson(e).dump(); }, event);
}

std::optional<ServerEvent> fromServerMessage(const std::string& message) {
	try {
		const auto j    = json::parse(message);
		const auto type = j.at("type").get<std::string>();

		if (type == SERVER_REPLY) {
			return ServerReply{
			        .requestId     = j.at("requestId").get<std::uint64_t>(),
			        .error         = optionalFromJson<std::string>(j, "error"),
			        .lobby         = optionalFromJson<Lobby>(j, "lobby"),
			        .match         = optionalFromJson<MatchState>(j, "match"),
			        .lobbies       = j.value("lobbies", std::vector<Lobby>{}),
			        .queuePosition = optionalFromJson<std::size_t>(j, "queuePosition"),
			        .queueSize     = optionalFromJson<std::size_t>(j, "queueSize"),
			};
		}

		const auto channel = j.at("channel").get<Channel>();
		if (type == SERVER_LOBBY_UPDATE) {
			return ServerLobbyUpdate{.channel = channel, .lobby = j.at("lobby").get<Lobby>()};
		}
		if (type == SERVER_LOBBY_DELETED) {
			return ServerLobbyDeleted{.channel = channel, .lobbyId = j.at("lobbyId").get<LobbyId>()};
		}
		if (type == SERVER_MATCH_STARTED) {
			return ServerMatchStarted{.channel = channel, .match = j.at("match").get<MatchState>()};
		}
		if (type == SERVER_MATCH_UPDATE) {
			return ServerMatchUpdate{.channel = channel, .match = j.at("match").get<MatchState>()};
		}
		if (type == SERVER_MATCH_COMPLETED) {
			return ServerMatchCompleted{.channel = channel, .match = j.at("match").get<MatchState>()};
		}
		if (type == SERVER_PLAYER_ACTION) {
			return ServerPlayerAction{
			        .channel  = channel,
			        .playerId = j.at("playerId").get<UserId>(),
			        .username = j.at("username").get<std::string>(),
			        .action   = playerActionFromJson(j.at("action")),
			};
		}
		if (type == SERVER_MATCHMAKING) {
			return ServerMatchmakingUpdate{.channel = channel, .lobby = j.at("lobby").get<Lobby>()};
		}
	} catch (const std::exception&) {}

	// Invalid
	return {};
}

} // namespace wordgrid::network
