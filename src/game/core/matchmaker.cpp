#include "core/matchmaker.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <format>

namespace wordgrid {

Matchmaker::Matchmaker(LobbyManager& lobbies) : m_lobbies(lobbies) {
}

QueueStatus Matchmaker::join(const UserId& userId, const std::string& username, const ServerId& serverId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	auto& queue = m_queues[serverId];
	if (const auto it = std::ranges::find(queue, userId, &Ticket::userId); it != queue.end()) {
		return QueueStatus{.lobby = std::nullopt, .position = static_cast<std::size_t>(std::distance(queue.begin(), it)) + 1u, .queued = queue.size()};
	}

	queue.push_back(Ticket{.userId = userId, .username = username});
	if (queue.size() < 2u) {
		return QueueStatus{.lobby = std::nullopt, .position = queue.size(), .queued = queue.size()};
	}

	// The caller joins the earliest waiting player. Others stay queued if a pairing was postponed.
	const auto host  = queue.front();
	queue.pop_front();
	const auto guest = queue.back();
	queue.pop_back();

	Logger().Log(Logging::LogLevel::Info, std::format("[Matchmaker] Pairing '{}' with '{}' on server '{}'.", host.userId, guest.userId, serverId));

	const auto created = m_lobbies.create(host.userId, host.username, Visibility::Public, serverId);
	if (isRejected(created)) {
		// No lobby available right now. Both stay queued in their place.
		Logger().Log(Logging::LogLevel::Warning, std::format("[Matchmaker] Pairing on server '{}' postponed: no free lobby.", serverId));
		queue.push_front(host);
		queue.push_back(guest);
		return QueueStatus{.lobby = std::nullopt, .position = queue.size(), .queued = queue.size()};
	}

	const auto joined = m_lobbies.join(std::get<Lobby>(created).id, guest.userId, guest.username);
	if (isRejected(joined)) {
		// Only possible if the fresh lobby vanished in between. The caller stays queued.
		queue.push_back(guest);
		return QueueStatus{.lobby = std::nullopt, .position = queue.size(), .queued = queue.size()};
	}

	return QueueStatus{.lobby = std::get<Lobby>(joined), .position = 0u, .queued = queue.size()};
}

bool Matchmaker::leave(const UserId& userId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	for (auto& [serverId, queue]: m_queues) {
		if (std::erase_if(queue, [&](const Ticket& ticket) { return ticket.userId == userId; }) > 0u) {
			return true;
		}
	}
	return false;
}

std::size_t Matchmaker::queued(const ServerId& serverId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_queues.find(serverId);
	return it == m_queues.end() ? 0u : it->second.size();
}

} // namespace wordgrid
