#include "protocol/message.hpp"

#include "protocol/error.hpp"
#include "protocol/identifiers.hpp"

#include <charconv>

namespace tc::protocol {

static std::string trimmedText(const Bytes& body) {
	auto end = body.end();
	while (end != body.begin() && *(end - 1) == 0u) {
		--end;
	}
	return std::string(body.begin(), end);
}

static void checkBody(const Bytes& body, std::size_t maxBodySize) {
	if (body.empty() || body.size() > maxBodySize) {
		throw ProtocolError(ErrorKind::InvalidBody, "Cannot build message with a body of " + std::to_string(body.size()) + " bytes");
	}
}

static void checkDatagram(const Bytes& datagram, std::size_t headerSize) {
	if (datagram.size() < headerSize + 1 || datagram.size() > MAX_SEGMENT_SIZE) {
		throw ProtocolError(ErrorKind::MalformedMessage, "Cannot read malformed datagram of " + std::to_string(datagram.size()) + " bytes");
	}
}

std::string_view typeName(ClientMessageType type) {
	switch (type) {
	case ClientMessageType::NetIdRequest:
		return "NET_ID_REQUEST";
	case ClientMessageType::StatusUpdate:
		return "STATUS_UPDATE";
	case ClientMessageType::TeamStatusRequest:
		return "TEAM_STATUS_REQUEST";
	case ClientMessageType::ServerDescriptionRequest:
		return "SERVER_DESCRIPTION_REQUEST";
	}
	return "UNKNOWN";
}

std::string_view typeName(ServerMessageType type) {
	switch (type) {
	case ServerMessageType::Error:
		return "ERROR";
	case ServerMessageType::AckNewUser:
		return "ACK_NEW_USER";
	case ServerMessageType::ServerDescription:
		return "SERVER_DESCRIPTION";
	case ServerMessageType::TeamStatus:
		return "TEAM_STATUS";
	case ServerMessageType::AckStatusUpdate:
		return "ACK_STATUS_UPDATE";
	}
	return "UNKNOWN";
}

// ClientMessage

ClientMessage::ClientMessage(ClientMessageType type, std::uint32_t networkId, unsigned teamId, unsigned status, Bytes body)
    : m_type(type), m_body(std::move(body)) {
	checkBody(m_body, MAX_BODY_SIZE);

	if (teamId > 0xffu || status > 0xffu) {
		throw ProtocolError(ErrorKind::InvalidHeaderValue, "Invalid header values");
	}
	if (networkId > NETWORK_ID_LIMIT) {
		throw ProtocolError(ErrorKind::InvalidHeaderValue, "Invalid network ID: " + std::to_string(networkId));
	}

	m_networkId = networkId;
	m_teamId    = static_cast<std::uint8_t>(teamId);
	m_status    = static_cast<std::uint8_t>(status);
}

ClientMessage::ClientMessage(ClientMessageType type, Bytes body)
    : ClientMessage(type, NETWORK_ID_LIMIT, TEAM_WILDCARD, INACTIVE_STATUS, std::move(body)) {
}

ClientMessage ClientMessage::decode(const Bytes& datagram) {
	checkDatagram(datagram, HEADER_SIZE);

	ClientMessage message;
	message.m_type      = static_cast<ClientMessageType>(datagram[0]);
	message.m_networkId = (static_cast<std::uint32_t>(datagram[1]) << 16) | (static_cast<std::uint32_t>(datagram[2]) << 8) | datagram[3];
	message.m_teamId    = datagram[4];
	message.m_status    = datagram[5];
	message.m_body.assign(datagram.begin() + HEADER_SIZE, datagram.end());
	return message;
}

Bytes ClientMessage::encode() const {
	Bytes out;
	out.reserve(HEADER_SIZE + m_body.size());

	out.push_back(static_cast<std::uint8_t>(m_type));
	out.push_back(static_cast<std::uint8_t>((m_networkId >> 16) & 0xffu)); // High byte
	out.push_back(static_cast<std::uint8_t>((m_networkId >> 8) & 0xffu));
	out.push_back(static_cast<std::uint8_t>(m_networkId & 0xffu));         // Low byte
	out.push_back(m_teamId);
	out.push_back(m_status);

	out.insert(out.end(), m_body.begin(), m_body.end());
	return out;
}

ClientMessageType ClientMessage::type() const {
	return m_type;
}

std::uint32_t ClientMessage::networkId() const {
	return m_networkId;
}

std::uint8_t ClientMessage::teamId() const {
	return m_teamId;
}

std::uint8_t ClientMessage::status() const {
	return m_status;
}

const Bytes& ClientMessage::body() const {
	return m_body;
}

std::string ClientMessage::bodyText() const {
	return trimmedText(m_body);
}

std::string ClientMessage::userName() const {
	expectType(ClientMessageType::NetIdRequest);
	return bodyText();
}

void ClientMessage::expectType(ClientMessageType type) const {
	if (m_type != type) {
		throw ProtocolError(ErrorKind::UnexpectedMessageType,
		                    "Attempted to read " + std::string(typeName(m_type)) + " message as " + std::string(typeName(type)));
	}
}

// ServerMessage

ServerMessage::ServerMessage(ServerMessageType type, Bytes body) : m_type(type), m_body(std::move(body)) {
	checkBody(m_body, MAX_BODY_SIZE);
}

ServerMessage::ServerMessage(ServerMessageType type, std::string_view body) : ServerMessage(type, Bytes(body.begin(), body.end())) {
}

ServerMessage ServerMessage::decode(const Bytes& datagram) {
	checkDatagram(datagram, HEADER_SIZE);

	ServerMessage message;
	message.m_type = static_cast<ServerMessageType>(datagram[0]);
	message.m_body.assign(datagram.begin() + HEADER_SIZE, datagram.end());
	return message;
}

Bytes ServerMessage::encode() const {
	Bytes out;
	out.reserve(HEADER_SIZE + m_body.size());
	out.push_back(static_cast<std::uint8_t>(m_type));
	out.insert(out.end(), m_body.begin(), m_body.end());
	return out;
}

ServerMessageType ServerMessage::type() const {
	return m_type;
}

const Bytes& ServerMessage::body() const {
	return m_body;
}

std::string ServerMessage::bodyText() const {
	return trimmedText(m_body);
}

std::uint32_t ServerMessage::networkId() const {
	expectType(ServerMessageType::AckNewUser);

	const auto text = bodyText();
	std::uint32_t networkId{};
	const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), networkId);
	if (ec != std::errc() || ptr != text.data() + text.size() || text.empty() || networkId >= NETWORK_ID_LIMIT) {
		throw ProtocolError(ErrorKind::MalformedMessage, "AckNewUser carries no valid network ID: \"" + text + "\"");
	}
	return networkId;
}

std::vector<std::string> ServerMessage::teamNames() const {
	expectType(ServerMessageType::ServerDescription);
	return unpackIdentifiersByDelimiter(m_body, DELIM_TEAMS);
}

std::vector<std::string> ServerMessage::statusNames() const {
	expectType(ServerMessageType::ServerDescription);
	return unpackIdentifiersByDelimiter(m_body, DELIM_STATUSES);
}

std::vector<std::string> ServerMessage::userNames() const {
	expectType(ServerMessageType::TeamStatus);

	// Only the slot region: the status vector behind it is raw bytes, not slots.
	const auto slotBytes = (rosterSize() + 1) * MAX_IDENTIFIER_SIZE;
	const Bytes slots(m_body.begin(), m_body.begin() + static_cast<std::ptrdiff_t>(slotBytes));
	return unpackIdentifiersByDelimiter(slots, DELIM_USERS);
}

std::vector<std::uint8_t> ServerMessage::statusVector() const {
	expectType(ServerMessageType::TeamStatus);

	const auto count = rosterSize();
	return std::vector<std::uint8_t>(m_body.end() - static_cast<std::ptrdiff_t>(count), m_body.end());
}

std::size_t ServerMessage::rosterSize() const {
	// Layout: delimiter slot, n name slots, n status bytes.
	constexpr auto entrySize = MAX_IDENTIFIER_SIZE + 1;
	if (m_body.size() < MAX_IDENTIFIER_SIZE || (m_body.size() - MAX_IDENTIFIER_SIZE) % entrySize != 0) {
		throw ProtocolError(ErrorKind::MalformedMessage, "Team status body of " + std::to_string(m_body.size()) + " bytes has no valid layout");
	}
	return (m_body.size() - MAX_IDENTIFIER_SIZE) / entrySize;
}

void ServerMessage::expectType(ServerMessageType type) const {
	if (m_type != type) {
		throw ProtocolError(ErrorKind::UnexpectedMessageType,
		                    "Attempted to read " + std::string(typeName(m_type)) + " message as " + std::string(typeName(type)));
	}
}

// Builders

ServerMessage makeError(std::string_view reason) {
	if (reason.empty()) {
		return ServerMessage(ServerMessageType::Error, emptyBody());
	}
	return ServerMessage(ServerMessageType::Error, reason.substr(0, ServerMessage::MAX_BODY_SIZE));
}

ServerMessage makeAckNewUser(std::uint32_t networkId) {
	return ServerMessage(ServerMessageType::AckNewUser, std::to_string(networkId));
}

ServerMessage makeAckStatusUpdate() {
	return ServerMessage(ServerMessageType::AckStatusUpdate, emptyBody());
}

ServerMessage makeServerDescription(const std::vector<std::string>& teamNames, const std::vector<std::string>& statusNames) {
	const std::vector<IdentifierCategory> categories{
	        {std::string(DELIM_TEAMS), teamNames},
	        {std::string(DELIM_STATUSES), statusNames},
	};
	return ServerMessage(ServerMessageType::ServerDescription, packIdentifierList(categories, true));
}

ServerMessage makeTeamStatus(const std::vector<std::string>& userNames, const std::vector<std::uint8_t>& statusVector) {
	if (userNames.size() != statusVector.size()) {
		throw ProtocolError(ErrorKind::InvalidBody, "Team status needs one status per roster slot");
	}

	auto body = packIdentifierList({{std::string(DELIM_USERS), userNames}}, false);
	body.insert(body.end(), statusVector.begin(), statusVector.end());
	return ServerMessage(ServerMessageType::TeamStatus, std::move(body));
}

} // namespace tc::protocol
