#pragma once

#include "protocol/protocol.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tc::protocol {

//! Message sent by a client. Header (6 bytes):
//!  - type (1 byte)
//!  - network ID (3 bytes, big-endian)
//!  - team ID (1 byte)
//!  - status (1 byte)
class ClientMessage {
public:
	static constexpr std::size_t HEADER_SIZE   = 6;
	static constexpr std::size_t MAX_BODY_SIZE = MAX_SEGMENT_SIZE - HEADER_SIZE;

	//! Build a message from its parts.
	//! \note Throws ProtocolError(InvalidHeaderValue) if a field does not fit its width and
	//!       ProtocolError(InvalidBody) if the body is empty or too large.
	ClientMessage(ClientMessageType type, std::uint32_t networkId, unsigned teamId, unsigned status, Bytes body);

	//! Message without user context: unassigned network ID, no team, no status.
	ClientMessage(ClientMessageType type, Bytes body);

	//! Parse a received datagram. Throws ProtocolError(MalformedMessage) on size violations.
	static ClientMessage decode(const Bytes& datagram);

	Bytes encode() const; //!< Header followed by body.

	ClientMessageType type() const;
	std::uint32_t networkId() const;
	std::uint8_t teamId() const;
	std::uint8_t status() const;
	const Bytes& body() const;

	std::string bodyText() const; //!< Body with trailing zero bytes removed.
	std::string userName() const; //!< Requested display name. NetIdRequest only.

	bool operator==(const ClientMessage& other) const = default;

private:
	ClientMessage() = default;

	void expectType(ClientMessageType type) const;

	ClientMessageType m_type{};
	std::uint32_t m_networkId{NETWORK_ID_LIMIT};
	std::uint8_t m_teamId{TEAM_WILDCARD};
	std::uint8_t m_status{INACTIVE_STATUS};
	Bytes m_body;
};

//! Message sent by the server. Header is the type byte only.
class ServerMessage {
public:
	static constexpr std::size_t HEADER_SIZE   = 1;
	static constexpr std::size_t MAX_BODY_SIZE = MAX_SEGMENT_SIZE - HEADER_SIZE;

	//! \note Throws ProtocolError(InvalidBody) if the body is empty or too large.
	ServerMessage(ServerMessageType type, Bytes body);
	ServerMessage(ServerMessageType type, std::string_view body);

	//! Parse a received datagram. Throws ProtocolError(MalformedMessage) on size violations.
	static ServerMessage decode(const Bytes& datagram);

	Bytes encode() const;

	ServerMessageType type() const;
	const Bytes& body() const;
	std::string bodyText() const;

	// Typed readers. Throw ProtocolError(UnexpectedMessageType) when called on another type.
	std::uint32_t networkId() const;                 //!< AckNewUser: assigned network ID.
	std::vector<std::string> teamNames() const;      //!< ServerDescription: all team names.
	std::vector<std::string> statusNames() const;    //!< ServerDescription: all status names.
	std::vector<std::string> userNames() const;      //!< TeamStatus: one name per roster slot, empty if vacant.
	std::vector<std::uint8_t> statusVector() const;  //!< TeamStatus: one status per roster slot.

	bool operator==(const ServerMessage& other) const = default;

private:
	ServerMessage() = default;

	void expectType(ServerMessageType type) const;
	std::size_t rosterSize() const; //!< Number of roster slots in a TeamStatus body.

	ServerMessageType m_type{};
	Bytes m_body;
};

// Server reply builders.
ServerMessage makeError(std::string_view reason); //!< Reason is cut to the maximum body size.
ServerMessage makeAckNewUser(std::uint32_t networkId);
ServerMessage makeAckStatusUpdate();
ServerMessage makeServerDescription(const std::vector<std::string>& teamNames, const std::vector<std::string>& statusNames);
ServerMessage makeTeamStatus(const std::vector<std::string>& userNames, const std::vector<std::uint8_t>& statusVector);

} // namespace tc::protocol
