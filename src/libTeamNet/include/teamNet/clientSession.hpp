#pragma once

#include "directory/types.hpp"
#include "network/udpClient.hpp"
#include "protocol/message.hpp"
#include "teamNet/config.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tc::teamNet {

inline constexpr std::chrono::milliseconds MESSAGE_TIMEOUT{1000};

struct RetryPolicy {
	std::chrono::milliseconds timeout{MESSAGE_TIMEOUT}; //!< Wait per attempt before resending.
	std::size_t maxAttempts{0};                         //!< 0 retries forever.
};

//! Occupied roster slot of a team status report.
struct TeamMember {
	std::string name;
	directory::StatusId status;
};

//! Client side of the protocol. Every request carries the session's network ID, team and status
//! and is resent verbatim until the expected reply arrives.
class ClientSession {
public:
	using ErrorCallback = std::function<void(const std::string&)>;

	//! \note Throws ProtocolError(InvalidConfiguration) for an invalid name and std::runtime_error if
	//!       the server cannot be resolved.
	explicit ClientSession(ClientConfig config, RetryPolicy policy = {});

	void onError(ErrorCallback callback); //!< Receives the text of every Error reply.

	//! Send and resend until a reply of the expected type arrives. Error replies are reported
	//! through the error callback and treated like no reply.
	//! \note Blocks. Throws ProtocolError(RequestTimeout) only if the policy caps the attempts.
	protocol::ServerMessage requestUntilAcknowledged(protocol::ClientMessageType type, const protocol::Bytes& body,
	                                                 protocol::ServerMessageType expectedReplyType);

	void registerUser();           //!< Request a network ID unless one is known.
	void fetchServerDescription(); //!< Load the team and status names.

	void updateStatus(directory::StatusId status);
	void changeTeam(directory::TeamId teamId);
	void leave(); //!< Reset team and status to the sigils and tell the server.

	//! Members of the session's team. Throws ProtocolError(InvalidTeamId) when not on a team.
	std::vector<TeamMember> teamStatus();

	bool hasNetworkId() const;
	directory::NetworkId networkId() const;
	const std::string& displayName() const;
	directory::TeamId teamId() const;
	directory::StatusId status() const;
	const std::vector<std::string>& teamNames() const;
	const std::vector<std::string>& statusNames() const;
	const ClientConfig& config() const;

private:
	//! One send and one bounded wait. Returns the reply if it has the expected type.
	std::optional<protocol::ServerMessage> transmitAndReceive(const protocol::Bytes& request, protocol::ServerMessageType expectedReplyType);

	void sendStatusUpdate();

private:
	ClientConfig m_config;
	RetryPolicy m_policy;
	network::UdpClient m_client;
	ErrorCallback m_onError;

	directory::NetworkId m_networkId;
	directory::TeamId m_teamId;
	directory::StatusId m_status;

	std::vector<std::string> m_teamNames;
	std::vector<std::string> m_statusNames;
};

} // namespace tc::teamNet
