#pragma once

#include "directory/directory.hpp"
#include "network/types.hpp"
#include "protocol/message.hpp"

#include <map>
#include <string>

namespace tc::teamNet {

//! Server side request handling. Maps one inbound datagram to exactly one reply and owns the directory.
//! Not thread safe: call handle() from one thread only.
class Dispatcher {
public:
	explicit Dispatcher(directory::Directory directory);

	//! Decode, apply and answer one request. Never throws for bad input; every failure becomes an Error reply.
	protocol::ServerMessage handle(const network::Endpoint& sender, const protocol::Bytes& datagram);

	const directory::Directory& directory() const;
	const protocol::ServerMessage& serverDescription() const; //!< Encoded once at construction.

private:
	protocol::ServerMessage dispatch(const network::Endpoint& sender, const protocol::ClientMessage& message);

	protocol::ServerMessage serviceNetIdRequest(const network::Endpoint& sender, const protocol::ClientMessage& message);
	protocol::ServerMessage serviceStatusUpdate(const protocol::ClientMessage& message);
	protocol::ServerMessage serviceTeamStatusRequest(const protocol::ClientMessage& message);
	protocol::ServerMessage serviceServerDescriptionRequest() const;

	//! Last registration per sender. Lets a retransmitted NetIdRequest get its original ID back.
	struct Registration {
		std::string displayName;
		directory::NetworkId networkId;
	};

private:
	directory::Directory m_directory;
	const protocol::ServerMessage m_serverDescription;
	std::map<network::Endpoint, Registration> m_registrations;
};

} // namespace tc::teamNet
