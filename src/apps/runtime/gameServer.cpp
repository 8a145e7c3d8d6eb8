#include "app/gameServer.hpp"

#include "Logging.hpp"
#include "network/channels.hpp"

#include <format>
#include <iterator>

namespace wordgrid::app {

static constexpr std::chrono::seconds SWEEP_INTERVAL{1};

static LobbyOptions toLobbyOptions(const ServerConfig& config) {
	LobbyOptions options;
	options.maxPlayers               = config.maxPlayers;
	options.maxLobbies               = config.maxLobbies;
	options.match.maxRoundsPerPlayer = config.rounds;
	options.match.grid.rows          = config.gridRows;
	options.match.grid.cols          = config.gridCols;
	if (config.seed) {
		options.seed = *config.seed;
	}
	return options;
}

//! Reply with the accepted value, or with the wire name of the rejection.
template <class T, class Fill>
static network::ServerReply toReply(std::uint64_t requestId, const Outcome<T>& outcome, Fill&& fill) {
	network::ServerReply reply{.requestId = requestId};
	if (const auto* rejection = std::get_if<Rejection>(&outcome)) {
		reply.error = std::string{toString(rejection->reason)};
		return reply;
	}
	fill(reply, std::get<T>(outcome));
	return reply;
}

static std::string requestName(const network::ClientRequest& request) {
	static constexpr const char* NAMES[] = {
	        "lobby:create", "lobby:join",   "lobby:ready",   "lobby:leave",      "lobby:remove",      "lobby:start",
	        "lobby:list",   "match:submit", "match:shuffle", "matchmaking:join", "matchmaking:leave",
	};
	static_assert(std::size(NAMES) == std::variant_size_v<network::ClientRequest>, "Update request names.");
	return NAMES[request.index()];
}

GameServer::GameServer(const ServerConfig& config, const IDictionary& dictionary, IMatchArchive* archive)
    : m_config(config), m_lobbies(dictionary, toLobbyOptions(config), archive), m_matchmaker(m_lobbies), m_presence(config.grace), m_server(config.port) {
	m_lobbies.subscribe(this);
}

GameServer::~GameServer() {
	stop();
	m_lobbies.unsubscribe(this);
}

bool GameServer::start() {
	{
		std::lock_guard<std::mutex> lock(m_sweeperMutex);
		if (m_running) {
			Logger().Log(Logging::LogLevel::Warning, "[GameServer] Server already running. Start ignored.");
			return true;
		}
	}

	if (!m_server.registerHandler(this)) {
		Logger().Log(Logging::LogLevel::Warning, "[GameServer] Server handler already registered.");
	}
	if (!m_server.start()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[GameServer] Could not listen on port {}.", m_config.port));
		return false;
	}

	{
		std::lock_guard<std::mutex> lock(m_sweeperMutex);
		m_running = true;
	}
	m_sweeperThread = std::thread([this] { sweeperLoop(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Listening on port {}.", m_config.port));
	return true;
}

void GameServer::stop() {
	{
		std::lock_guard<std::mutex> lock(m_sweeperMutex);
		m_running = false;
	}
	m_sweeperWakeup.notify_all();
	if (m_sweeperThread.joinable()) {
		m_sweeperThread.join();
	}

	m_server.stop();
}

LobbyManager& GameServer::lobbies() {
	return m_lobbies;
}

network::ServerReply GameServer::handleRequest(const ClientIdentity& identity, const network::ClientRequest& request) {
	Logger().Log(Logging::LogLevel::Debug, std::format("[GameServer] Request '{}' #{} from '{}'.", requestName(request), network::requestIdOf(request), identity.userId));

	auto reply = std::visit([&](const auto& r) { return handle(identity, r); }, request);
	if (reply.error) {
		Logger().Log(Logging::LogLevel::Warning,
		             std::format("[GameServer] Rejected '{}' #{} from '{}': {}.", requestName(request), reply.requestId, identity.userId, *reply.error));
	}
	return reply;
}

void GameServer::sweep(Presence::Clock::time_point now) {
	for (const auto& userId : m_presence.expired(now)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Grace period of '{}' ended.", userId));

		m_matchmaker.leave(userId);
		for (const auto& lobbyId : m_lobbies.lobbiesOf(userId)) {
			// A rejection means the lobby went away or the user left meanwhile.
			if (isRejected(m_lobbies.leave(lobbyId, userId))) {
				Logger().Log(Logging::LogLevel::Debug, std::format("[GameServer] '{}' already gone from lobby {}.", userId, lobbyId));
			}
		}
	}

	m_lobbies.purgeIdle(now);
}

void GameServer::onClientIdentified(network::SessionId sessionId, const ClientIdentity& identity) {
	// A session may switch identity. Release the previous one first.
	if (const auto it = m_sessionUsers.find(sessionId); it != m_sessionUsers.end()) {
		m_presence.disconnected(it->second, Presence::Clock::now());
	}
	m_sessionUsers[sessionId] = identity.userId;
	m_presence.connected(identity.userId);
}

void GameServer::onClientDisconnected(network::SessionId sessionId, const std::optional<ClientIdentity>&) {
	const auto it = m_sessionUsers.find(sessionId);
	if (it == m_sessionUsers.end()) {
		return;
	}

	m_presence.disconnected(it->second, Presence::Clock::now());
	if (!m_presence.isOnline(it->second)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] '{}' went offline. Seats are kept for {}s.", it->second, m_config.grace.count()));
	}
	m_sessionUsers.erase(it);
}

void GameServer::onClientRequest(network::SessionId sessionId, const ClientIdentity& identity, const network::ClientRequest& request) {
	// Broadcasts of the mutation were already queued by the state listener. The reply follows them.
	m_server.send(sessionId, handleRequest(identity, request));
}

void GameServer::onLobbyUpdated(const Lobby& lobby) {
	const auto channel = network::lobbyChannel(lobby.id);
	m_server.publish(channel, network::ServerLobbyUpdate{.channel = channel, .lobby = lobby});

	if (lobby.visibility == Visibility::Public) {
		const auto listing = network::serverLobbiesChannel(lobby.serverId);
		m_server.publish(listing, network::ServerLobbyUpdate{.channel = listing, .lobby = lobby});
	}
}

void GameServer::onLobbyDeleted(const Lobby& lobby) {
	const auto channel = network::lobbyChannel(lobby.id);
	m_server.publish(channel, network::ServerLobbyDeleted{.channel = channel, .lobbyId = lobby.id});

	if (lobby.visibility == Visibility::Public) {
		const auto listing = network::serverLobbiesChannel(lobby.serverId);
		m_server.publish(listing, network::ServerLobbyDeleted{.channel = listing, .lobbyId = lobby.id});
	}
}

void GameServer::onMatchStarted(const MatchState& match) {
	const auto channel = network::lobbyChannel(match.lobbyId);
	m_server.publish(channel, network::ServerMatchStarted{.channel = channel, .match = match});

	const auto updates = network::matchChannel(match.id);
	m_server.publish(updates, network::ServerMatchUpdate{.channel = updates, .match = match});
}

void GameServer::onMatchUpdated(const MatchState& match) {
	const auto updates = network::matchChannel(match.id);
	m_server.publish(updates, network::ServerMatchUpdate{.channel = updates, .match = match});

	const auto channel = network::lobbyChannel(match.lobbyId);
	m_server.publish(channel, network::ServerMatchUpdate{.channel = channel, .match = match});
}

void GameServer::onMatchCompleted(const MatchState& match) {
	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Match {} of lobby {} completed.", match.id, match.lobbyId));

	const auto channel = network::lobbyChannel(match.lobbyId);
	m_server.publish(channel, network::ServerMatchCompleted{.channel = channel, .match = match});
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::CreateLobbyRequest& request) {
	const auto outcome = m_lobbies.create(identity.userId, identity.username, request.visibility, request.serverId);
	return toReply(request.requestId, outcome, [](ServerReply& reply, const Lobby& lobby) { reply.lobby = lobby; });
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::JoinLobbyRequest& request) {
	const auto outcome = request.lobbyId ? m_lobbies.join(*request.lobbyId, identity.userId, identity.username)
	                                     : m_lobbies.joinByCode(request.code.value_or(""), identity.userId, identity.username);
	return toReply(request.requestId, outcome, [](ServerReply& reply, const Lobby& lobby) { reply.lobby = lobby; });
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::SetReadyRequest& request) {
	const auto outcome = m_lobbies.setReady(request.lobbyId, identity.userId, request.ready);
	return toReply(request.requestId, outcome, [](ServerReply& reply, const Lobby& lobby) { reply.lobby = lobby; });
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::LeaveLobbyRequest& request) {
	const auto outcome = m_lobbies.leave(request.lobbyId, identity.userId);
	return toReply(request.requestId, outcome, [](ServerReply& reply, const std::optional<Lobby>& lobby) { reply.lobby = lobby; });
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::RemovePlayerRequest& request) {
	const auto outcome = m_lobbies.removePlayer(request.lobbyId, request.targetUserId, identity.userId);
	return toReply(request.requestId, outcome, [](ServerReply& reply, const Lobby& lobby) { reply.lobby = lobby; });
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::StartMatchRequest& request) {
	const auto outcome = m_lobbies.start(request.lobbyId, identity.userId);
	return toReply(request.requestId, outcome, [](ServerReply& reply, const StartResult& result) {
		reply.lobby = result.lobby;
		reply.match = result.match;
	});
}

GameServer::ServerReply GameServer::handle(const ClientIdentity&, const network::ListLobbiesRequest& request) {
	return ServerReply{.requestId = request.requestId, .lobbies = m_lobbies.list(request.serverId)};
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::SubmitWordRequest& request) {
	const auto outcome = m_lobbies.submitWord(request.matchId, identity.userId, request.path);
	return toReply(request.requestId, outcome, [](ServerReply& reply, const MatchState& match) { reply.match = match; });
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::ShuffleGridRequest& request) {
	const auto outcome = m_lobbies.shuffleGrid(request.matchId, identity.userId);
	return toReply(request.requestId, outcome, [](ServerReply& reply, const MatchState& match) { reply.match = match; });
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::JoinQueueRequest& request) {
	const auto status = m_matchmaker.join(identity.userId, identity.username, request.serverId);
	if (!status.lobby) {
		return ServerReply{.requestId = request.requestId, .queuePosition = status.position, .queueSize = status.queued};
	}

	// The partner waiting in the queue learns about the lobby through the matchmaking channel.
	const auto channel = network::matchmakingChannel(request.serverId);
	m_server.publish(channel, network::ServerMatchmakingUpdate{.channel = channel, .lobby = *status.lobby});
	return ServerReply{.requestId = request.requestId, .lobby = status.lobby};
}

GameServer::ServerReply GameServer::handle(const ClientIdentity& identity, const network::LeaveQueueRequest& request) {
	m_matchmaker.leave(identity.userId);
	return ServerReply{.requestId = request.requestId};
}

void GameServer::sweeperLoop() {
	std::unique_lock<std::mutex> lock(m_sweeperMutex);
	while (m_running) {
		if (m_sweeperWakeup.wait_for(lock, SWEEP_INTERVAL, [this] { return !m_running; })) {
			break;
		}

		lock.unlock();
		sweep(Presence::Clock::now());
		lock.lock();
	}
}

} // namespace wordgrid::app
