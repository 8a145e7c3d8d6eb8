#pragma once

#include "core/lobbyManager.hpp"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace wordgrid {

struct QueueStatus {
	std::optional<Lobby> lobby; //!< Set once the caller was paired into a lobby.
	std::size_t position{0u};   //!< 1-based place in the queue while waiting.
	std::size_t queued{0u};     //!< Players waiting on the same server.
};

//! First come first served pairing. Two queued players share a new public lobby.
class Matchmaker {
public:
	explicit Matchmaker(LobbyManager& lobbies);

	//! Queues the user, or pairs them with the earliest waiting player. Idempotent while queued.
	QueueStatus join(const UserId& userId, const std::string& username, const ServerId& serverId = DEFAULT_SERVER_ID);
	bool leave(const UserId& userId); //!< Returns false if the user was not queued.

	std::size_t queued(const ServerId& serverId) const;

private:
	struct Ticket {
		UserId userId;
		std::string username;
	};

	mutable std::mutex m_mutex;
	std::unordered_map<ServerId, std::deque<Ticket>> m_queues;
	LobbyManager& m_lobbies;
};

} // namespace wordgrid
