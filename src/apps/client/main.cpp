#include "clientMenu.hpp"

#include "protocol/error.hpp"
#include "teamNet/clientSession.hpp"
#include "teamNet/config.hpp"

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

tc::teamNet::ClientConfig ParseClientOptions(int argc, char* argv[]) {
	cxxopts::Options options("teamconnect-client", "TeamConnect directory client");
	options.add_options()
		("a,host", "Server address", cxxopts::value<std::string>()->default_value("127.0.0.1"))
		("p,port", "Server port", cxxopts::value<std::uint16_t>()->default_value(std::to_string(tc::protocol::DEFAULT_PORT)))
		("n,name", "Display name, at most 16 bytes", cxxopts::value<std::string>())
		("i,id", "Network ID from an earlier registration", cxxopts::value<std::uint32_t>())
		("h,help", "Show help");
	options.parse_positional({"host", "port", "name"});
	options.positional_help("[host port name]");

	cxxopts::ParseResult result;
	try {
		result = options.parse(argc, argv);
	} catch (const cxxopts::exceptions::exception& ex) {
		std::cerr << "Error: " << ex.what() << "\n";
		std::cerr << options.help() << std::endl;
		std::exit(1);
	}

	if (result.count("help")) {
		std::cout << options.help() << std::endl;
		std::exit(0);
	}
	if (!result.count("name")) {
		std::cerr << "Error: a display name is required.\n";
		std::cerr << options.help() << std::endl;
		std::exit(1);
	}

	tc::teamNet::ClientConfig config;
	config.host        = result["host"].as<std::string>();
	config.port        = result["port"].as<std::uint16_t>();
	config.displayName = result["name"].as<std::string>();
	if (result.count("id")) {
		config.networkId = result["id"].as<std::uint32_t>();
	}
	return config;
}

} // namespace

int main(int argc, char* argv[]) {
	const auto config = ParseClientOptions(argc, argv);

	try {
		std::cout << "Attempting to connect to server at " << config.host << ":" << config.port << "\n";

		tc::teamNet::ClientSession session(config);
		session.onError([](const std::string& reason) { std::cout << reason << "\n"; });

		session.registerUser();
		std::cout << "Now running TeamConnect client with netID " << session.networkId() << "\n";
		session.fetchServerDescription();

		tc::app::ClientMenu menu(session, std::cin, std::cout);
		menu.run();
	} catch (const tc::protocol::ProtocolError& ex) {
		std::cerr << ex.what() << "\n";
		return 1;
	} catch (const std::runtime_error& ex) {
		std::cerr << ex.what() << "\n";
		return 1;
	}
	return 0;
}
