#pragma once

#include "app/config.hpp"
#include "app/presence.hpp"
#include "core/IDictionary.hpp"
#include "core/IMatchArchive.hpp"
#include "core/IStateListener.hpp"
#include "core/lobbyManager.hpp"
#include "core/matchmaker.hpp"
#include "network/server.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace wordgrid::app {

//! Glues the pub/sub server to the lobby and match state machines.
//! Requests are answered with a reply to the requester only. Every accepted mutation is published on
//! its channels first, so subscribers see the new state no later than the requester's reply.
class GameServer : public network::IServerHandler, public IStateListener {
public:
	GameServer(const ServerConfig& config, const IDictionary& dictionary, IMatchArchive* archive = nullptr);
	~GameServer();

	GameServer(const GameServer&)            = delete;
	GameServer& operator=(const GameServer&) = delete;
	GameServer(GameServer&&)                 = delete;
	GameServer& operator=(GameServer&&)      = delete;

	bool start(); //!< Boot the network listener and the sweeper. Returns false if the port is taken.
	void stop();  //!< Stop the sweeper and the network listener.

	//! Execute one request for an identified user.
	network::ServerReply handleRequest(const network::ClientIdentity& identity, const network::ClientRequest& request);

	//! Make users leave whose disconnect grace ran out and purge idle lobbies.
	void sweep(Presence::Clock::time_point now);

	LobbyManager& lobbies();

	// IServerHandler overrides
	void onClientIdentified(network::SessionId sessionId, const network::ClientIdentity& identity) override;
	void onClientDisconnected(network::SessionId sessionId, const std::optional<network::ClientIdentity>& identity) override;
	void onClientRequest(network::SessionId sessionId, const network::ClientIdentity& identity, const network::ClientRequest& request) override;

	// IStateListener overrides
	void onLobbyUpdated(const Lobby& lobby) override;
	void onLobbyDeleted(const Lobby& lobby) override;
	void onMatchStarted(const MatchState& match) override;
	void onMatchUpdated(const MatchState& match) override;
	void onMatchCompleted(const MatchState& match) override;

private:
	using ClientIdentity = network::ClientIdentity;
	using ServerReply    = network::ServerReply;

	// Processing of the requests. One per request type.
	ServerReply handle(const ClientIdentity& identity, const network::CreateLobbyRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::JoinLobbyRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::SetReadyRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::LeaveLobbyRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::RemovePlayerRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::StartMatchRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::ListLobbiesRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::SubmitWordRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::ShuffleGridRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::JoinQueueRequest& request);
	ServerReply handle(const ClientIdentity& identity, const network::LeaveQueueRequest& request);

	void sweeperLoop();

private:
	const ServerConfig m_config;

	LobbyManager m_lobbies;
	Matchmaker m_matchmaker;
	Presence m_presence;
	network::Server m_server;

	std::unordered_map<network::SessionId, UserId> m_sessionUsers; //!< Only touched on the server thread.

	bool m_running{false};
	std::mutex m_sweeperMutex;
	std::condition_variable m_sweeperWakeup;
	std::thread m_sweeperThread;
};

} // namespace wordgrid::app
