#pragma once

#include <asio/ip/udp.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace tc::network {

using Datagram = std::vector<std::uint8_t>;
using Endpoint = asio::ip::udp::endpoint; //!< Address and port a datagram came from or goes to.

//! "address:port" for log lines.
inline std::string toString(const Endpoint& endpoint) {
	return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace tc::network
