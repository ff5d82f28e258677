#pragma once

#include "teamNet/config.hpp"

#include <cstdint>
#include <memory>

namespace tc::teamNet {

//! Directory server. Receives, handles and answers one datagram at a time on a single IO thread,
//! which is the only thread that touches the directory.
class Server {
public:
	//! \note Throws ProtocolError(InvalidConfiguration) for unusable team/status lists and
	//!       std::system_error if the port cannot be bound.
	explicit Server(const ServerConfig& config);
	~Server();

	void start(); //!< Serve on a background IO thread.
	void run();   //!< Serve on the calling thread until stop().
	void stop();

	std::uint16_t port() const; //!< Bound port. Useful when configured with port 0.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace tc::teamNet
