#include "network/udpServer.hpp"

#include "Logging.hpp"
#include "protocol/protocol.hpp"

#include <asio.hpp>

#include <array>
#include <atomic>
#include <thread>
#include <utility>

namespace tc::network {

class UdpServer::Implementation {
public:
	explicit Implementation(std::uint16_t port);

	void connect(Handler handler);

	void start();
	void run();
	void stop();

	std::uint16_t port() const;
	bool isRunning() const;

private:
	void prepare();                           //!< Reopen the socket if a previous stop() closed it.
	bool send(const Endpoint& receiver, const Datagram& datagram);
	void doReceive();                         //!< Prime async receive for the next datagram.
	void handleDatagram(std::size_t bytes);   //!< Runs on the IO thread. Calls handler and replies.

private:
	asio::io_context m_ioContext;
	asio::ip::udp::socket m_socket;
	std::uint16_t m_port; //!< Bound port, kept for rebinding after stop().
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;

	std::thread m_ioThread;             //!< IO context thread when started with start().
	std::atomic<bool> m_running{false}; //!< Server running.

	Handler m_handler; //!< Handles each received datagram.

	// One byte beyond the segment size so oversized datagrams are seen as such.
	std::array<std::uint8_t, protocol::MAX_SEGMENT_SIZE + 1> m_buffer{};
	Endpoint m_sender; //!< Sender of the datagram in m_buffer.
};

UdpServer::Implementation::Implementation(std::uint16_t port)
    : m_ioContext(), m_socket(m_ioContext, Endpoint(asio::ip::udp::v4(), port)), m_port(m_socket.local_endpoint().port()) {
	Logger().Log(Logging::LogLevel::Info, "[UdpServer] Bound to port " + std::to_string(m_port) + ".");
}

void UdpServer::Implementation::connect(Handler handler) {
	m_handler = std::move(handler);
}

void UdpServer::Implementation::start() {
	if (m_running.exchange(true)) {
		return;
	}

	prepare();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });
}

void UdpServer::Implementation::run() {
	if (m_running.exchange(true)) {
		return;
	}

	prepare();
	m_ioContext.run();
}

void UdpServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::post(m_ioContext, [this] {
		asio::error_code ec;
		m_socket.cancel(ec);
		m_socket.close(ec);
	});

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}

	// Without work the IO context returns once the posted close has run.
	if (m_ioThread.joinable() && m_ioThread.get_id() != std::this_thread::get_id()) {
		m_ioThread.join();
	}
	Logger().Log(Logging::LogLevel::Info, "[UdpServer] Stopped.");
}

void UdpServer::Implementation::prepare() {
	if (!m_socket.is_open()) {
		try {
			m_socket.open(asio::ip::udp::v4());
			m_socket.bind(Endpoint(asio::ip::udp::v4(), m_port));
		} catch (const asio::system_error& ex) {
			m_running = false;
			asio::error_code ec;
			m_socket.close(ec);
			Logger().Log(Logging::LogLevel::Error, "[UdpServer] Could not rebind port " + std::to_string(m_port) + ": " + ex.what());
			throw;
		}
		Logger().Log(Logging::LogLevel::Info, "[UdpServer] Bound to port " + std::to_string(m_port) + " again.");
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doReceive();
}

bool UdpServer::Implementation::send(const Endpoint& receiver, const Datagram& datagram) {
	asio::error_code ec;
	m_socket.send_to(asio::buffer(datagram), receiver, 0, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, "[UdpServer] Failed to send " + std::to_string(datagram.size()) + "b to " + toString(receiver) + ": " + ec.message());
		return false;
	}
	return true;
}

std::uint16_t UdpServer::Implementation::port() const {
	return m_port;
}

bool UdpServer::Implementation::isRunning() const {
	return m_running;
}

void UdpServer::Implementation::doReceive() {
	m_socket.async_receive_from(asio::buffer(m_buffer), m_sender, [this](asio::error_code ec, std::size_t bytes) {
		if (!m_running) {
			return;
		}

		if (ec) {
			if (ec == asio::error::operation_aborted) {
				return;
			}
			// A failed receive must not take the server down.
			Logger().Log(Logging::LogLevel::Error, "[UdpServer] Receive failed: " + ec.message());
		} else {
			handleDatagram(bytes);
		}

		if (m_running) {
			doReceive();
		}
	});
}

void UdpServer::Implementation::handleDatagram(std::size_t bytes) {
	Logger().Log(Logging::LogLevel::Debug, "[UdpServer] Received " + std::to_string(bytes) + "b packet from " + toString(m_sender) + ".");

	if (!m_handler) {
		return;
	}

	const Datagram datagram(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(bytes));
	const auto reply = m_handler(m_sender, datagram);
	if (reply) {
		send(m_sender, *reply);
	}
}


UdpServer::UdpServer(std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(port)) {
}

UdpServer::~UdpServer() {
	stop();
}

void UdpServer::connect(Handler handler) {
	m_pimpl->connect(std::move(handler));
}

void UdpServer::start() {
	m_pimpl->start();
}

void UdpServer::run() {
	m_pimpl->run();
}

void UdpServer::stop() {
	m_pimpl->stop();
}

std::uint16_t UdpServer::port() const {
	return m_pimpl->port();
}

bool UdpServer::isRunning() const {
	return m_pimpl->isRunning();
}

} // namespace tc::network
