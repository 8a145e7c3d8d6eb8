#pragma once

#include "core/IDictionary.hpp"
#include "core/IMatchArchive.hpp"
#include "core/IStateListener.hpp"
#include "core/eventHub.hpp"
#include "core/match.hpp"
#include "core/outcome.hpp"
#include "model/lobby.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace wordgrid {

inline constexpr std::size_t MAX_LISTED_LOBBIES = 50u;
inline constexpr std::size_t MAX_LIVE_LOBBIES   = 9000u; //!< One four digit join code per live lobby.

struct LobbyOptions {
	std::size_t maxPlayers{MAX_LOBBY_PLAYERS};
	MatchOptions match{};
	std::chrono::milliseconds idleTimeout{std::chrono::minutes(5)}; //!< Waiting lobbies with at most one player are purged after this.
	std::uint64_t seed{std::random_device{}()};                     //!< Seeds join codes and match grids.
	std::size_t maxLobbies{MAX_LIVE_LOBBIES};                       //!< Further creates are rejected with no_free_code.
};

struct StartResult {
	Lobby lobby;
	MatchState match;
};

//! Owns every live lobby and the match each lobby started.
//! \note  Operations on the same lobby are serialized; different lobbies proceed in parallel.
//!        Each accepted mutation is signalled to the listeners before the call returns.
class LobbyManager {
public:
	explicit LobbyManager(const IDictionary& dictionary, LobbyOptions options = {}, IMatchArchive* archive = nullptr);
	~LobbyManager();

	LobbyManager(const LobbyManager&)            = delete;
	LobbyManager& operator=(const LobbyManager&) = delete;
	LobbyManager(LobbyManager&&)                 = delete;
	LobbyManager& operator=(LobbyManager&&)      = delete;

	void subscribe(IStateListener* listener);
	void unsubscribe(IStateListener* listener);

	//! Creates a waiting lobby with the caller as its only player and host.
	//! Rejected once every join code is taken.
	Outcome<Lobby> create(const UserId& hostId, const std::string& username, Visibility visibility, const ServerId& serverId = DEFAULT_SERVER_ID);

	//! Joining a lobby one is already part of returns it unchanged.
	Outcome<Lobby> join(const LobbyId& lobbyId, const UserId& userId, const std::string& username);
	Outcome<Lobby> joinByCode(const std::string& code, const UserId& userId, const std::string& username);

	//! No-op unless the player is present and the lobby is waiting.
	Outcome<Lobby> setReady(const LobbyId& lobbyId, const UserId& userId, bool ready);

	//! Empty result means the lobby was deleted because nobody is left.
	Outcome<std::optional<Lobby>> leave(const LobbyId& lobbyId, const UserId& userId);

	//! Host only eviction. Also removes the player from a running match.
	Outcome<Lobby> removePlayer(const LobbyId& lobbyId, const UserId& targetUserId, const UserId& requestedBy);

	//! Host only. Needs at least two players, all ready. Turn order is join order.
	Outcome<StartResult> start(const LobbyId& lobbyId, const UserId& requestedBy);

	Outcome<MatchState> submitWord(const MatchId& matchId, const UserId& playerId, const std::vector<Coord>& path);
	Outcome<MatchState> shuffleGrid(const MatchId& matchId, const UserId& playerId);

	std::optional<Lobby> lobby(const LobbyId& lobbyId) const;
	std::optional<Lobby> findByCode(const std::string& code) const;
	std::optional<MatchState> match(const MatchId& matchId) const;

	std::vector<Lobby> list(const ServerId& serverId) const; //!< Public waiting lobbies, newest first.
	std::vector<LobbyId> lobbiesOf(const UserId& userId) const;

	//! Deletes stale waiting lobbies. Returns the number removed.
	std::size_t purgeIdle(std::chrono::steady_clock::time_point now);

private:
	struct LobbyEntry {
		std::mutex mutex;
		Lobby lobby;
		std::shared_ptr<Match> match;
		std::uint64_t createdAt{0u};
		std::chrono::steady_clock::time_point updatedAt;
		bool deleted{false}; //!< Set under the entry mutex when the lobby leaves the registry.
	};

	std::shared_ptr<LobbyEntry> findEntry(const LobbyId& lobbyId) const;
	std::vector<std::shared_ptr<LobbyEntry>> entries() const;
	std::shared_ptr<Match> findMatch(const MatchId& matchId) const;

	std::optional<std::string> generateCode(); //!< Empty once the code space is exhausted. Expects the registry mutex.

	// Helpers below expect the entry mutex to be held.
	void removeFromMatch(LobbyEntry& entry, const UserId& userId);
	void erase(LobbyEntry& entry);
	void touch(LobbyEntry& entry);
	void verify(const Lobby& lobby) const;

	void finishLobby(const LobbyId& lobbyId); //!< Marks the lobby finished after its match completed.

private:
	const IDictionary& m_dictionary;
	const LobbyOptions m_options;
	IMatchArchive* m_archive{nullptr};
	EventHub m_eventHub;

	mutable std::mutex m_registryMutex; //!< Guards the maps, counters and rng. Never held while waiting for an entry.
	std::unordered_map<LobbyId, std::shared_ptr<LobbyEntry>> m_lobbies;
	std::unordered_map<std::string, LobbyId> m_codes;
	std::unordered_map<MatchId, std::shared_ptr<Match>> m_matches;
	std::uint64_t m_lobbyCounter{0u};
	std::uint64_t m_matchCounter{0u};
	std::uint64_t m_joinSequence{0u};
	std::mt19937_64 m_rng;
};

} // namespace wordgrid
