#pragma once

#include "model/types.hpp"

#include <chrono>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace wordgrid::app {

//! Counts open connections per user and reports users that stayed away longer than the grace period.
//! \note Thread safe.
class Presence {
public:
	using Clock = std::chrono::steady_clock;

	explicit Presence(std::chrono::milliseconds grace);

	void connected(const UserId& userId);                           //!< Cancels a pending expiry.
	void disconnected(const UserId& userId, Clock::time_point now); //!< Starts the grace period once the last connection closed.

	//! Users whose grace period ended before now. Each user is reported once.
	std::vector<UserId> expired(Clock::time_point now);

	bool isOnline(const UserId& userId) const;

private:
	mutable std::mutex m_mutex;
	const std::chrono::milliseconds m_grace;
	std::unordered_map<UserId, unsigned> m_connections;
	std::unordered_map<UserId, Clock::time_point> m_deadlines;
};

} // namespace wordgrid::app
