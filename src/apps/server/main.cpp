#include "protocol/error.hpp"
#include "teamNet/config.hpp"
#include "teamNet/server.hpp"

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <system_error>

namespace {

tc::teamNet::ServerConfig ParseServerOptions(int argc, char* argv[]) {
	cxxopts::Options options("teamconnect-server", "TeamConnect directory server");
	options.add_options()
		("p,port", "UDP port to serve on", cxxopts::value<std::uint16_t>()->default_value(std::to_string(tc::protocol::DEFAULT_PORT)))
		("t,teams", "Team names separated by '/', e.g. \"The A Team/The B Team\"", cxxopts::value<std::string>())
		("s,statuses", "Status names separated by '/', e.g. \"Busy/Asleep\"", cxxopts::value<std::string>())
		("h,help", "Show help");
	options.parse_positional({"port", "teams", "statuses"});
	options.positional_help("[port teams statuses]");

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
	if (!result.count("teams") || !result.count("statuses")) {
		std::cerr << "Error: team names and status names are required.\n";
		std::cerr << options.help() << std::endl;
		std::exit(1);
	}

	tc::teamNet::ServerConfig config;
	config.port        = result["port"].as<std::uint16_t>();
	config.teamNames   = tc::teamNet::splitNames(result["teams"].as<std::string>());
	config.statusNames = tc::teamNet::splitNames(result["statuses"].as<std::string>());
	return config;
}

} // namespace

int main(int argc, char* argv[]) {
	const auto config = ParseServerOptions(argc, argv);

	try {
		tc::teamNet::Server server(config);
		server.start();
		std::cout << "TeamConnect server listening on port " << server.port() << ". Type 'quit' to stop.\n";

		// Keep the server process alive until stdin closes or quit command.
		std::string line;
		while (std::getline(std::cin, line)) {
			if (line == "quit" || line == "exit") {
				break;
			}
		}

		server.stop();
	} catch (const tc::protocol::ProtocolError& ex) {
		std::cerr << "Invalid configuration: " << ex.what() << "\n";
		return 1;
	} catch (const std::system_error& ex) {
		std::cerr << "Could not start server: " << ex.what() << "\n";
		return 1;
	}
	return 0;
}
