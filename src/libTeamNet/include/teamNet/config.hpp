#pragma once

#include "directory/types.hpp"
#include "protocol/protocol.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tc::teamNet {

//! Everything a server needs at startup. Fixed for the server's lifetime.
struct ServerConfig {
	std::uint16_t port{protocol::DEFAULT_PORT};
	std::vector<std::string> teamNames;   //!< 1 to 20 identifiers, team ID is the index.
	std::vector<std::string> statusNames; //!< 1 to 20 identifiers, status is the index.
};

struct ClientConfig {
	std::string host{"127.0.0.1"};
	std::uint16_t port{protocol::DEFAULT_PORT};
	std::string displayName;
	std::optional<directory::NetworkId> networkId; //!< Known ID from an earlier registration. Skips NetIdRequest.
};

//! Split a list like "The A Team/The B Team". Empty entries are kept so validation can reject them.
std::vector<std::string> splitNames(std::string_view list, char separator = '/');

//! Throws ProtocolError(InvalidConfiguration) for an invalid display name or network ID.
void validate(const ClientConfig& config);

} // namespace tc::teamNet
