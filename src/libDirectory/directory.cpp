#include "directory/directory.hpp"

#include "protocol/error.hpp"
#include "protocol/identifiers.hpp"

#include <algorithm>
#include <utility>

namespace tc::directory {

using protocol::ErrorKind;
using protocol::ProtocolError;

static void validateNames(const std::vector<std::string>& names, std::size_t maxCount, const std::string& what) {
	if (names.empty() || names.size() > maxCount) {
		throw ProtocolError(ErrorKind::InvalidConfiguration, "Server supports between 1 and " + std::to_string(maxCount) + " " + what + ", " +
		                                                             std::to_string(names.size()) + " were given");
	}

	for (const auto& name: names) {
		if (!protocol::isValidIdentifier(name)) {
			throw ProtocolError(ErrorKind::InvalidConfiguration, "Names should consist of 1 to " + std::to_string(protocol::MAX_IDENTIFIER_SIZE) +
			                                                             " letters, numbers, and spaces. The name \"" + name + "\" is invalid.");
		}
	}
}

Directory::Directory(std::vector<std::string> teamNames, std::vector<std::string> statusNames, NetworkId userLimit)
    : m_teamNames(std::move(teamNames)), m_statusNames(std::move(statusNames)), m_userLimit(std::min(userLimit, protocol::NETWORK_ID_LIMIT)) {
	validateNames(m_teamNames, MAX_TEAM_COUNT, "teams");
	validateNames(m_statusNames, MAX_STATUS_COUNT, "statuses");

	m_teams.reserve(m_teamNames.size());
	for (const auto& name: m_teamNames) {
		m_teams.emplace_back(name);
	}
	m_users.reserve(INITIAL_USERBASE_SIZE);
}

const User& Directory::createUser(const std::string& displayName) {
	if (m_users.size() >= m_userLimit) {
		throw ProtocolError(ErrorKind::CapacityExceeded, "Could not create new user, this server has reached its limit of users supported");
	}

	if (!protocol::isValidIdentifier(displayName)) {
		throw ProtocolError(ErrorKind::InvalidIdentifier, "Usernames must be between 1 and " + std::to_string(protocol::MAX_IDENTIFIER_SIZE) +
		                                                          " letters, numbers and spaces. \"" + displayName + "\" is not a valid username.");
	}

	// Grow by doubling so IDs stay dense indices.
	if (m_users.size() == m_users.capacity()) {
		m_users.reserve(std::max(m_users.capacity() * 2, INITIAL_USERBASE_SIZE));
	}

	const auto networkId = static_cast<NetworkId>(m_users.size());
	return m_users.emplace_back(networkId, displayName);
}

const User* Directory::lookupUser(NetworkId networkId) const {
	if (networkId >= m_users.size()) {
		return nullptr;
	}
	return &m_users[networkId];
}

bool Directory::setUserStatusAndTeam(NetworkId networkId, unsigned status, unsigned teamId) {
	if (networkId >= m_users.size()) {
		throw ProtocolError(ErrorKind::InvalidNetworkId, "Cannot resolve invalid user ID: " + std::to_string(networkId));
	}
	if (!isValidStatus(status)) {
		throw ProtocolError(ErrorKind::InvalidStatus, "Invalid status: " + std::to_string(status));
	}
	if (!isValidTeam(teamId)) {
		throw ProtocolError(ErrorKind::InvalidTeamId, "Invalid team ID: " + std::to_string(teamId));
	}

	auto& user            = m_users[networkId];
	const auto oldTeamId  = user.m_teamId;
	const auto newTeamId  = static_cast<TeamId>(teamId);
	const bool teamChange = newTeamId != oldTeamId;

	user.m_status = static_cast<StatusId>(status);

	if (teamChange && oldTeamId != protocol::TEAM_WILDCARD) {
		m_teams[oldTeamId].remove(networkId);
	}
	if (teamChange && newTeamId != protocol::TEAM_WILDCARD) {
		m_teams[newTeamId].add(networkId); // No-op if already present or the roster is full.
	}

	user.m_teamId = newTeamId;
	return newTeamId == protocol::TEAM_WILDCARD || m_teams[newTeamId].contains(networkId);
}

TeamStatusView Directory::teamStatusView(unsigned teamId) const {
	if (teamId >= m_teams.size()) {
		throw ProtocolError(ErrorKind::InvalidTeamId, "Invalid Team ID: " + std::to_string(teamId));
	}

	TeamStatusView view;
	view.names.reserve(MAX_TEAM_SIZE);
	view.statuses.reserve(MAX_TEAM_SIZE);

	for (const auto& slot: m_teams[teamId].slots()) {
		if (!slot) {
			view.names.emplace_back();
			view.statuses.push_back(protocol::INACTIVE_STATUS);
			continue;
		}
		const auto& user = m_users[*slot];
		view.names.push_back(user.displayName());
		view.statuses.push_back(user.status());
	}
	return view;
}

StaticDescription Directory::staticDescription() const {
	return StaticDescription{m_teamNames, m_statusNames};
}

const Team& Directory::team(TeamId teamId) const {
	return m_teams.at(teamId);
}

std::size_t Directory::teamCount() const {
	return m_teams.size();
}

std::size_t Directory::userCount() const {
	return m_users.size();
}

std::size_t Directory::userCapacity() const {
	return m_users.capacity();
}

bool Directory::isValidTeam(unsigned teamId) const {
	return teamId < m_teams.size() || teamId == protocol::TEAM_WILDCARD;
}

bool Directory::isValidStatus(unsigned status) {
	return status < MAX_STATUS_COUNT || status == protocol::INACTIVE_STATUS;
}

} // namespace tc::directory
