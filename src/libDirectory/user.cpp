#include "directory/user.hpp"

#include "protocol/protocol.hpp"

#include <utility>

namespace tc::directory {

User::User(NetworkId networkId, std::string displayName)
    : m_networkId(networkId), m_displayName(std::move(displayName)), m_status(protocol::INACTIVE_STATUS), m_teamId(protocol::TEAM_WILDCARD) {
}

NetworkId User::networkId() const {
	return m_networkId;
}

const std::string& User::displayName() const {
	return m_displayName;
}

StatusId User::status() const {
	return m_status;
}

TeamId User::teamId() const {
	return m_teamId;
}

bool User::hasTeam() const {
	return m_teamId != protocol::TEAM_WILDCARD;
}

} // namespace tc::directory
