#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tc {
namespace protocol {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::uint16_t DEFAULT_PORT = 2000;

//! Largest datagram either side sends or accepts. No fragmentation.
inline constexpr std::size_t MAX_SEGMENT_SIZE = 1u << 10;

//! Width of one padded slot and the longest allowed identifier.
inline constexpr std::size_t MAX_IDENTIFIER_SIZE = 16;

inline constexpr std::uint8_t TEAM_WILDCARD   = 0xff; //!< Team sigil: member of no team.
inline constexpr std::uint8_t INACTIVE_STATUS = 0xff; //!< Status sigil: no status.

//! Network ID of a client that has not been assigned one yet. Also the exclusive
//! upper bound of assigned IDs, so every ID fits the 3 byte header field.
inline constexpr std::uint32_t NETWORK_ID_LIMIT = 0xffffff;

//! Body of a message that carries no content. Bodies are never empty.
inline constexpr std::uint8_t EMPTY_BODY_BYTE = '&';

inline constexpr char DELIMITER_PREFIX          = '#';
inline constexpr std::uint8_t DESCRIPTION_END   = '#'; //!< Ends a multi-category description.
inline constexpr std::string_view DELIM_TEAMS    = "#TEAMS";
inline constexpr std::string_view DELIM_STATUSES = "#STATUSES";
inline constexpr std::string_view DELIM_USERS    = "#USERS";

inline Bytes emptyBody() {
	return Bytes{EMPTY_BODY_BYTE};
}

// Client -> Server
enum class ClientMessageType : std::uint8_t {
	NetIdRequest             = 1, //!< Body: requested display name.
	StatusUpdate             = 2, //!< Header carries the new team and status.
	TeamStatusRequest        = 3, //!< Header carries the team to report.
	ServerDescriptionRequest = 4, //!< Teams and statuses supported by the server.
};

// Server -> Client
enum class ServerMessageType : std::uint8_t {
	Error             = 1, //!< Body: human readable reason.
	AckNewUser        = 2, //!< Body: assigned network ID as decimal text.
	ServerDescription = 3, //!< Body: #TEAMS and #STATUSES padded lists.
	TeamStatus        = 4, //!< Body: #USERS padded list followed by one status byte per roster slot.
	AckStatusUpdate   = 5, //!< Body: empty body byte.
};

//! Name of a message type for diagnostics. Unknown values map to "UNKNOWN".
std::string_view typeName(ClientMessageType type);
std::string_view typeName(ServerMessageType type);

} // namespace protocol
} // namespace tc
