#include "teamNet/server.hpp"

#include "Logging.hpp"
#include "network/udpServer.hpp"
#include "teamNet/dispatcher.hpp"

#include <optional>

namespace tc::teamNet {

class Server::Implementation {
public:
	explicit Implementation(const ServerConfig& config);

	void start();
	void run();
	void stop();

	std::uint16_t port() const;

private:
	//! Network callback. Runs on the IO thread.
	std::optional<network::Datagram> onDatagram(const network::Endpoint& sender, const network::Datagram& datagram);

private:
	Dispatcher m_dispatcher;
	network::UdpServer m_network;
};

Server::Implementation::Implementation(const ServerConfig& config)
    : m_dispatcher(directory::Directory(config.teamNames, config.statusNames)), m_network(config.port) {
	m_network.connect([this](const network::Endpoint& sender, const network::Datagram& datagram) { return onDatagram(sender, datagram); });
	Logger().Log(Logging::LogLevel::Info, "[Server] Successfully set up TeamConnect server on port " + std::to_string(m_network.port()) + " with " +
	                                              std::to_string(config.teamNames.size()) + " teams and " + std::to_string(config.statusNames.size()) +
	                                              " statuses.");
}

void Server::Implementation::start() {
	m_network.start();
}

void Server::Implementation::run() {
	Logger().Log(Logging::LogLevel::Info, "[Server] Running...");
	m_network.run();
}

void Server::Implementation::stop() {
	m_network.stop();
}

std::uint16_t Server::Implementation::port() const {
	return m_network.port();
}

std::optional<network::Datagram> Server::Implementation::onDatagram(const network::Endpoint& sender, const network::Datagram& datagram) {
	const auto reply = m_dispatcher.handle(sender, datagram);
	Logger().Log(Logging::LogLevel::Debug, "[Server] Replying " + std::string(protocol::typeName(reply.type())) + " to " + network::toString(sender) + ".");
	return reply.encode();
}


Server::Server(const ServerConfig& config) : m_pimpl(std::make_unique<Implementation>(config)) {
}

Server::~Server() {
	stop();
}

void Server::start() {
	m_pimpl->start();
}

void Server::run() {
	m_pimpl->run();
}

void Server::stop() {
	m_pimpl->stop();
}

std::uint16_t Server::port() const {
	return m_pimpl->port();
}

} // namespace tc::teamNet
