#include "teamNet/clientSession.hpp"

#include "Logging.hpp"
#include "protocol/error.hpp"

#include <stdexcept>
#include <utility>

namespace tc::teamNet {

using protocol::ClientMessageType;
using protocol::ServerMessageType;

ClientSession::ClientSession(ClientConfig config, RetryPolicy policy)
    : m_config(std::move(config)), m_policy(policy), m_networkId(protocol::NETWORK_ID_LIMIT), m_teamId(protocol::TEAM_WILDCARD),
      m_status(protocol::INACTIVE_STATUS) {
	validate(m_config);

	if (m_config.networkId) {
		m_networkId = *m_config.networkId;
	}

	if (!m_client.open(m_config.host, m_config.port)) {
		throw std::runtime_error("Could not reach server at " + m_config.host + ":" + std::to_string(m_config.port));
	}
}

void ClientSession::onError(ErrorCallback callback) {
	m_onError = std::move(callback);
}

protocol::ServerMessage ClientSession::requestUntilAcknowledged(ClientMessageType type, const protocol::Bytes& body, ServerMessageType expectedReplyType) {
	// Encoded once so every retransmission is identical.
	const auto request = protocol::ClientMessage(type, m_networkId, m_teamId, m_status, body).encode();

	for (std::size_t attempt = 1;; ++attempt) {
		if (auto reply = transmitAndReceive(request, expectedReplyType)) {
			return std::move(*reply);
		}

		if (m_policy.maxAttempts != 0 && attempt >= m_policy.maxAttempts) {
			throw protocol::ProtocolError(protocol::ErrorKind::RequestTimeout, "No " + std::string(protocol::typeName(expectedReplyType)) + " reply after " +
			                                                                           std::to_string(attempt) + " attempts");
		}
		Logger().Log(Logging::LogLevel::Debug, "[ClientSession] Resending " + std::string(protocol::typeName(type)) + " (attempt " + std::to_string(attempt + 1) + ").");
	}
}

std::optional<protocol::ServerMessage> ClientSession::transmitAndReceive(const protocol::Bytes& request, ServerMessageType expectedReplyType) {
	if (!m_client.send(request)) {
		// Unreliable transport: a failed send is just another lost datagram.
		return std::nullopt;
	}

	const auto datagram = m_client.receive(m_policy.timeout);
	if (!datagram) {
		return std::nullopt;
	}

	try {
		auto reply = protocol::ServerMessage::decode(*datagram);
		if (reply.type() == expectedReplyType) {
			return reply;
		}

		if (reply.type() == ServerMessageType::Error) {
			const auto reason = reply.bodyText();
			Logger().Log(Logging::LogLevel::Warning, "[ClientSession] Server error: " + reason);
			if (m_onError) {
				m_onError(reason);
			}
		}
	} catch (const protocol::ProtocolError& ex) {
		Logger().Log(Logging::LogLevel::Warning, std::string("[ClientSession] Dropped reply: ") + ex.what());
	}
	return std::nullopt;
}

void ClientSession::registerUser() {
	if (hasNetworkId()) {
		return;
	}

	const protocol::Bytes name(m_config.displayName.begin(), m_config.displayName.end());
	const auto reply = requestUntilAcknowledged(ClientMessageType::NetIdRequest, name, ServerMessageType::AckNewUser);
	m_networkId      = reply.networkId();
	Logger().Log(Logging::LogLevel::Info, "[ClientSession] Registered as '" + m_config.displayName + "' with network ID " + std::to_string(m_networkId) + ".");
}

void ClientSession::fetchServerDescription() {
	const auto reply = requestUntilAcknowledged(ClientMessageType::ServerDescriptionRequest, protocol::emptyBody(), ServerMessageType::ServerDescription);
	m_teamNames      = reply.teamNames();
	m_statusNames    = reply.statusNames();
}

void ClientSession::updateStatus(directory::StatusId status) {
	m_status = status;
	sendStatusUpdate();
}

void ClientSession::changeTeam(directory::TeamId teamId) {
	m_teamId = teamId;
	sendStatusUpdate();
}

void ClientSession::leave() {
	m_teamId = protocol::TEAM_WILDCARD;
	m_status = protocol::INACTIVE_STATUS;
	sendStatusUpdate();
}

std::vector<TeamMember> ClientSession::teamStatus() {
	if (m_teamId == protocol::TEAM_WILDCARD) {
		throw protocol::ProtocolError(protocol::ErrorKind::InvalidTeamId, "You are not on a team. To get team status updates, join a team.");
	}

	const auto reply    = requestUntilAcknowledged(ClientMessageType::TeamStatusRequest, protocol::emptyBody(), ServerMessageType::TeamStatus);
	const auto names    = reply.userNames();
	const auto statuses = reply.statusVector();

	std::vector<TeamMember> members;
	for (std::size_t i = 0; i < names.size() && i < statuses.size(); ++i) {
		if (!names[i].empty()) {
			members.push_back(TeamMember{names[i], statuses[i]});
		}
	}
	return members;
}

void ClientSession::sendStatusUpdate() {
	requestUntilAcknowledged(ClientMessageType::StatusUpdate, protocol::emptyBody(), ServerMessageType::AckStatusUpdate);
}

bool ClientSession::hasNetworkId() const {
	return m_networkId != protocol::NETWORK_ID_LIMIT;
}

directory::NetworkId ClientSession::networkId() const {
	return m_networkId;
}

const std::string& ClientSession::displayName() const {
	return m_config.displayName;
}

directory::TeamId ClientSession::teamId() const {
	return m_teamId;
}

directory::StatusId ClientSession::status() const {
	return m_status;
}

const std::vector<std::string>& ClientSession::teamNames() const {
	return m_teamNames;
}

const std::vector<std::string>& ClientSession::statusNames() const {
	return m_statusNames;
}

const ClientConfig& ClientSession::config() const {
	return m_config;
}

} // namespace tc::teamNet
