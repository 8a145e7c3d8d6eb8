#pragma once

#include "network/nwEvents.hpp"
#include "network/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wordgrid::network {

//! Callback interface invoked on the client's connection thread.
//! \note onConnected for the first connection runs on the thread calling Client::connect.
class IClientHandler {
public:
	virtual ~IClientHandler()                            = default;
	virtual void onConnected()                           = 0; //!< Identify and resubscribe were sent.
	virtual void onServerEvent(const ServerEvent& event) = 0;
	virtual void onDisconnected()                        = 0;
};

struct ClientOptions {
	std::chrono::milliseconds reconnectDelay{DEFAULT_RECONNECT_DELAY}; //!< Fixed wait between reconnect attempts.
};

//! Pub/sub client. Reconnects on its own after a connection loss and then re-sends identify and
//! every subscription it holds.
//! \note Nothing is queued while disconnected. Sends during that time are dropped.
class Client {
public:
	Client();
	explicit Client(ClientOptions options);
	~Client();

	Client(const Client&)            = delete;
	Client& operator=(const Client&) = delete;
	Client(Client&&)                 = delete;
	Client& operator=(Client&&)      = delete;

	bool registerHandler(IClientHandler* handler); //!< Register a single handler. Returns false if already registered.

	//! Connect, identify and start the background connection loop. Returns false if the first connect fails.
	bool connect(const std::string& host, std::uint16_t port, const ClientIdentity& identity);
	void disconnect(); //!< Close the connection and stop reconnecting.
	bool isConnected() const;

	void subscribe(const Channel& channel);   //!< Remembered across reconnects.
	void unsubscribe(const Channel& channel);
	std::vector<Channel> subscriptions() const;

	//! Assign a fresh requestId and send. Returns the id or empty if the request was dropped.
	std::optional<std::uint64_t> send(ClientRequest request);
	bool sendPlayerAction(const MatchId& matchId, const PlayerAction& action);

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide networking protocol stuff.
};

} // namespace wordgrid::network
