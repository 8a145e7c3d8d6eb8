#pragma once

#include "network/nwEvents.hpp"
#include "network/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace wordgrid::network {

//! Callback interface invoked on the server's processing thread.
//! \note Keep handlers lightweight. Requests are only forwarded for identified sessions.
class IServerHandler {
public:
	virtual ~IServerHandler() = default;

	virtual void onClientIdentified(SessionId sessionId, const ClientIdentity& identity)                            = 0;
	virtual void onClientDisconnected(SessionId sessionId, const std::optional<ClientIdentity>& identity)           = 0;
	virtual void onClientRequest(SessionId sessionId, const ClientIdentity& identity, const ClientRequest& request) = 0;
};

//! Pub/sub server. Clients identify, subscribe to channels and receive everything published on them.
//! \note publish and send may be called from any thread.
class Server {
public:
	Server();
	explicit Server(std::uint16_t port);
	~Server();

	Server(const Server&)            = delete;
	Server& operator=(const Server&) = delete;
	Server(Server&&)                 = delete;
	Server& operator=(Server&&)      = delete;

	bool start(); //!< Returns false if the port could not be bound.
	void stop();

	bool registerHandler(IServerHandler* handler); //!< Register a single handler. Returns false if already registered.

	std::size_t publish(const Channel& channel, const ServerEvent& event); //!< Send to all subscribers. Returns the number of receivers.
	bool send(SessionId sessionId, const ServerEvent& event);              //!< Send event to one session. Returns false on failure.

	std::size_t subscriberCount(const Channel& channel) const;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide networking protocol stuff.
};

} // namespace wordgrid::network
