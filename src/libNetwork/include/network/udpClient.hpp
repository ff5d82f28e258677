#pragma once

#include "network/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace tc::network {

//! Minimal synchronous UDP client talking to a single server endpoint.
class UdpClient {
public:
	UdpClient();
	~UdpClient();

	//! Resolve the server and open a socket on a free local port. Returns false on failure.
	bool open(const std::string& host, std::uint16_t port);
	void close();
	bool isOpen() const;

	bool send(const Datagram& datagram); //!< Send one datagram to the server. Returns false on failure.

	//! Wait up to timeout for a datagram from the server.
	//! Datagrams from other endpoints are dropped. Returns empty on timeout or error.
	std::optional<Datagram> receive(std::chrono::milliseconds timeout);

	Endpoint serverEndpoint() const;
	Endpoint localEndpoint() const;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace tc::network
