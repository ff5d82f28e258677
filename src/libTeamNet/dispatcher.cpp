#include "teamNet/dispatcher.hpp"

#include "Logging.hpp"
#include "protocol/error.hpp"

#include <exception>
#include <optional>
#include <utility>

namespace tc::teamNet {

using protocol::ClientMessageType;
using protocol::ProtocolError;
using protocol::ServerMessage;

static constexpr char MSG_MALFORMED[]    = "Failed to parse malformed message";
static constexpr char MSG_UNKNOWN_TYPE[] = "Could not process request - Invalid client message type";
static constexpr char MSG_INTERNAL[]     = "Could not process request - Internal server error";

static ServerMessage describe(const directory::Directory& directory) {
	const auto description = directory.staticDescription();
	return protocol::makeServerDescription(description.teamNames, description.statusNames);
}

Dispatcher::Dispatcher(directory::Directory directory) : m_directory(std::move(directory)), m_serverDescription(describe(m_directory)) {
}

ServerMessage Dispatcher::handle(const network::Endpoint& sender, const protocol::Bytes& datagram) {
	std::optional<protocol::ClientMessage> message;
	try {
		message = protocol::ClientMessage::decode(datagram);
	} catch (const ProtocolError& ex) {
		Logger().Log(Logging::LogLevel::Warning, "[Dispatcher] " + network::toString(sender) + ": " + ex.what());
		return protocol::makeError(MSG_MALFORMED);
	}

	Logger().Log(Logging::LogLevel::Info,
	             "[Dispatcher] Extracted client message of type " + std::string(protocol::typeName(message->type())) + " from " + network::toString(sender) + ".");

	try {
		return dispatch(sender, *message);
	} catch (const ProtocolError& ex) {
		Logger().Log(Logging::LogLevel::Warning, "[Dispatcher] Rejected " + std::string(protocol::typeName(message->type())) + " (" +
		                                                 std::string(protocol::toString(ex.kind())) + "): " + ex.what());
		return protocol::makeError(ex.what());
	} catch (const std::exception& ex) {
		Logger().Log(Logging::LogLevel::Error, "[Dispatcher] Failed to handle " + std::string(protocol::typeName(message->type())) + ": " + ex.what());
		return protocol::makeError(MSG_INTERNAL);
	}
}

const directory::Directory& Dispatcher::directory() const {
	return m_directory;
}

const ServerMessage& Dispatcher::serverDescription() const {
	return m_serverDescription;
}

ServerMessage Dispatcher::dispatch(const network::Endpoint& sender, const protocol::ClientMessage& message) {
	switch (message.type()) {
	case ClientMessageType::NetIdRequest:
		return serviceNetIdRequest(sender, message);
	case ClientMessageType::StatusUpdate:
		return serviceStatusUpdate(message);
	case ClientMessageType::TeamStatusRequest:
		return serviceTeamStatusRequest(message);
	case ClientMessageType::ServerDescriptionRequest:
		return serviceServerDescriptionRequest();
	}
	throw ProtocolError(protocol::ErrorKind::UnknownMessageType, MSG_UNKNOWN_TYPE);
}

ServerMessage Dispatcher::serviceNetIdRequest(const network::Endpoint& sender, const protocol::ClientMessage& message) {
	const auto userName = message.userName();

	// Same sender, same name: the ack got lost and the client retried.
	const auto it = m_registrations.find(sender);
	if (it != m_registrations.end() && it->second.displayName == userName) {
		Logger().Log(Logging::LogLevel::Debug, "[Dispatcher] Repeated registration of '" + userName + "', resending ID " + std::to_string(it->second.networkId) + ".");
		return protocol::makeAckNewUser(it->second.networkId);
	}

	const auto& user = m_directory.createUser(userName);
	m_registrations[sender] = Registration{user.displayName(), user.networkId()};

	Logger().Log(Logging::LogLevel::Info, "[Dispatcher] Created user '" + user.displayName() + "' with ID " + std::to_string(user.networkId()) + ".");
	return protocol::makeAckNewUser(user.networkId());
}

ServerMessage Dispatcher::serviceStatusUpdate(const protocol::ClientMessage& message) {
	if (!m_directory.setUserStatusAndTeam(message.networkId(), message.status(), message.teamId())) {
		Logger().Log(Logging::LogLevel::Warning, "[Dispatcher] Team " + std::to_string(message.teamId()) + " is full, user " + std::to_string(message.networkId()) +
		                                                 " is not listed in its reports.");
	}
	return protocol::makeAckStatusUpdate();
}

ServerMessage Dispatcher::serviceTeamStatusRequest(const protocol::ClientMessage& message) {
	const auto view = m_directory.teamStatusView(message.teamId());
	return protocol::makeTeamStatus(view.names, view.statuses);
}

ServerMessage Dispatcher::serviceServerDescriptionRequest() const {
	return m_serverDescription;
}

} // namespace tc::teamNet
