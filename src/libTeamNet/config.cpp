#include "teamNet/config.hpp"

#include "protocol/error.hpp"
#include "protocol/identifiers.hpp"

namespace tc::teamNet {

std::vector<std::string> splitNames(std::string_view list, char separator) {
	std::vector<std::string> names;
	std::size_t start = 0;
	while (true) {
		const auto end = list.find(separator, start);
		names.emplace_back(list.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
		if (end == std::string_view::npos) {
			break;
		}
		start = end + 1;
	}
	return names;
}

void validate(const ClientConfig& config) {
	if (!protocol::isValidIdentifier(config.displayName)) {
		throw protocol::ProtocolError(protocol::ErrorKind::InvalidConfiguration,
		                              "User names should consist of 1 to " + std::to_string(protocol::MAX_IDENTIFIER_SIZE) +
		                                      " letters, numbers, and spaces. The name \"" + config.displayName + "\" is invalid.");
	}
	if (config.networkId && *config.networkId >= protocol::NETWORK_ID_LIMIT) {
		throw protocol::ProtocolError(protocol::ErrorKind::InvalidConfiguration, "Invalid network ID: " + std::to_string(*config.networkId));
	}
}

} // namespace tc::teamNet
