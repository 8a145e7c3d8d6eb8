#pragma once

#include "network/types.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace wordgrid::network {

//! Channel subscriptions of all sessions.
//! \note Thread safe. forEachSubscriber holds the lock while visiting, so two publishes to a channel
//!       reach every subscriber in the same order.
class ChannelRegistry {
public:
	bool subscribe(SessionId sessionId, const Channel& channel);   //!< Returns false if already subscribed.
	bool unsubscribe(SessionId sessionId, const Channel& channel); //!< Returns false if not subscribed.
	void removeSession(SessionId sessionId);                       //!< Drop all subscriptions of a session.

	std::vector<Channel> channels(SessionId sessionId) const;
	std::size_t subscriberCount(const Channel& channel) const;

	//! Call the visitor for every subscriber of the channel. Returns the number of subscribers visited.
	std::size_t forEachSubscriber(const Channel& channel, const std::function<void(SessionId)>& visitor) const;

private:
	mutable std::mutex m_mutex;
	std::map<Channel, std::set<SessionId>> m_subscribers;
	std::map<SessionId, std::set<Channel>> m_channels;
};

} // namespace wordgrid::network
