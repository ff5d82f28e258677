#include "network/udpClient.hpp"

#include "Logging.hpp"
#include "protocol/protocol.hpp"

#include <asio.hpp>

#include <array>

namespace tc::network {

class UdpClient::Implementation {
public:
	Implementation();

public:
	bool open(const std::string& host, std::uint16_t port);
	void close();
	bool isOpen() const;

	bool send(const Datagram& datagram);
	std::optional<Datagram> receive(std::chrono::milliseconds timeout);

	Endpoint serverEndpoint() const;
	Endpoint localEndpoint() const;

private:
	//! One receive attempt bounded by timeout. Returns the byte count, empty on timeout or error.
	std::optional<std::size_t> receiveOnce(std::chrono::steady_clock::duration timeout, Endpoint& sender);

	asio::io_context m_ioContext{};
	asio::ip::udp::resolver m_resolver;
	asio::ip::udp::socket m_socket;

	Endpoint m_server;
	std::array<std::uint8_t, protocol::MAX_SEGMENT_SIZE + 1> m_buffer{};
};

UdpClient::Implementation::Implementation() : m_resolver(m_ioContext), m_socket(m_ioContext) {
}

bool UdpClient::Implementation::open(const std::string& host, std::uint16_t port) {
	if (m_socket.is_open()) {
		return false;
	}

	asio::error_code ec;
	const auto endpoints = m_resolver.resolve(asio::ip::udp::v4(), host, std::to_string(port), ec);
	if (ec || endpoints.empty()) {
		Logger().Log(Logging::LogLevel::Error, "[UdpClient] Could not resolve " + host + ":" + std::to_string(port) + ": " + ec.message());
		return false;
	}
	m_server = *endpoints.begin();

	m_socket.open(asio::ip::udp::v4(), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, "[UdpClient] Could not open socket: " + ec.message());
		return false;
	}
	m_socket.bind(Endpoint(asio::ip::udp::v4(), 0), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, "[UdpClient] Could not bind socket: " + ec.message());
		m_socket.close(ec);
		return false;
	}

	Logger().Log(Logging::LogLevel::Info, "[UdpClient] Talking to server at " + toString(m_server) + ".");
	return true;
}

void UdpClient::Implementation::close() {
	asio::error_code ec;
	m_socket.cancel(ec);
	m_socket.close(ec);
}

bool UdpClient::Implementation::isOpen() const {
	return m_socket.is_open();
}

bool UdpClient::Implementation::send(const Datagram& datagram) {
	if (!m_socket.is_open()) {
		return false;
	}

	asio::error_code ec;
	m_socket.send_to(asio::buffer(datagram), m_server, 0, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, "[UdpClient] Send failed: " + ec.message());
		return false;
	}
	return true;
}

std::optional<Datagram> UdpClient::Implementation::receive(std::chrono::milliseconds timeout) {
	if (!m_socket.is_open()) {
		return std::nullopt;
	}

	const auto deadline = std::chrono::steady_clock::now() + timeout;
	while (true) {
		const auto remaining = deadline - std::chrono::steady_clock::now();
		if (remaining <= std::chrono::steady_clock::duration::zero()) {
			return std::nullopt;
		}

		Endpoint sender;
		const auto bytes = receiveOnce(remaining, sender);
		if (!bytes) {
			return std::nullopt;
		}

		if (sender != m_server) {
			Logger().Log(Logging::LogLevel::Warning, "[UdpClient] Dropped datagram from unexpected sender " + toString(sender) + ".");
			continue;
		}
		return Datagram(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(*bytes));
	}
}

std::optional<std::size_t> UdpClient::Implementation::receiveOnce(std::chrono::steady_clock::duration timeout, Endpoint& sender) {
	std::optional<std::size_t> received;
	asio::error_code receiveEc;

	m_socket.async_receive_from(asio::buffer(m_buffer), sender, [&](asio::error_code ec, std::size_t bytes) {
		receiveEc = ec;
		if (!ec) {
			received = bytes;
		}
	});

	// Run until the receive completes or the timeout expires.
	m_ioContext.restart();
	m_ioContext.run_for(timeout);

	if (!m_ioContext.stopped()) {
		// Timed out: cancel and let the aborted handler run before the locals go away.
		asio::error_code ec;
		m_socket.cancel(ec);
		m_ioContext.run();
	}

	if (receiveEc && receiveEc != asio::error::operation_aborted) {
		Logger().Log(Logging::LogLevel::Error, "[UdpClient] Receive failed: " + receiveEc.message());
	}
	return received;
}

Endpoint UdpClient::Implementation::serverEndpoint() const {
	return m_server;
}

Endpoint UdpClient::Implementation::localEndpoint() const {
	asio::error_code ec;
	return m_socket.local_endpoint(ec);
}


UdpClient::UdpClient() : m_pimpl(std::make_unique<Implementation>()) {
}

UdpClient::~UdpClient() {
	close();
}

bool UdpClient::open(const std::string& host, std::uint16_t port) {
	return m_pimpl->open(host, port);
}

void UdpClient::close() {
	m_pimpl->close();
}

bool UdpClient::isOpen() const {
	return m_pimpl->isOpen();
}

bool UdpClient::send(const Datagram& datagram) {
	return m_pimpl->send(datagram);
}

std::optional<Datagram> UdpClient::receive(std::chrono::milliseconds timeout) {
	return m_pimpl->receive(timeout);
}

Endpoint UdpClient::serverEndpoint() const {
	return m_pimpl->serverEndpoint();
}

Endpoint UdpClient::localEndpoint() const {
	return m_pimpl->localEndpoint();
}

} // namespace tc::network
