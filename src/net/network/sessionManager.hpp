#pragma once

#include "network/core/protocol.hpp"
#include "network/types.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>

namespace wordgrid::network {

struct SessionContext {
	core::ConnectionId connectionId;        //!< Identify connection on network layer.
	SessionId sessionId;                    //!< Identify connection on application layer.
	std::optional<ClientIdentity> identity;  //!< Set once the client announced itself.
};

//! Maps network connections to sessions and the user behind them.
//! \note Thread safe. Publishing reads connection ids from arbitrary threads.
class SessionManager {
public:
	SessionId add(core::ConnectionId connectionId); //!< Register a new session.
	void remove(SessionId sessionId);               //!< Remove a session context.

	std::optional<SessionId> sessionId(core::ConnectionId connectionId) const;
	std::optional<core::ConnectionId> connectionId(SessionId sessionId) const;

	void identify(SessionId sessionId, ClientIdentity identity); //!< Set or replace who is behind the session.
	std::optional<ClientIdentity> identity(SessionId sessionId) const;

private:
	mutable std::mutex m_mutex;
	SessionId m_nextSessionId{1};
	std::unordered_map<SessionId, SessionContext> m_sessions;
	std::unordered_map<core::ConnectionId, SessionId> m_connectionToSession;
};

} // namespace wordgrid::network
