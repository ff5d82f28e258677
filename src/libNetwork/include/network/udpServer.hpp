#pragma once

#include "network/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace tc::network {

//! UDP endpoint bound to a port that hands every received datagram to one handler.
//! All datagrams are handled one after another on a single IO thread, so the handler
//! never runs concurrently with itself.
class UdpServer {
public:
	//! Called per datagram. The returned datagram, if any, is sent back to the sender.
	using Handler = std::function<std::optional<Datagram>(const Endpoint& sender, const Datagram& datagram)>;

	//! Bind to the port on all IPv4 interfaces. Port 0 picks a free port.
	//! \note Throws std::system_error if the socket cannot be bound.
	explicit UdpServer(std::uint16_t port);
	~UdpServer();

	void connect(Handler handler); //!< Set the datagram handler. Call before start/run.

	//! Serve on a dedicated IO thread. After stop() the socket is bound again to the same port.
	//! \note Throws std::system_error if rebinding fails.
	void start();
	void run();  //!< Serve on the calling thread until stop() is called.
	void stop(); //!< Stop serving and close the socket.

	std::uint16_t port() const; //!< Port the socket is bound to.
	bool isRunning() const;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace tc::network
