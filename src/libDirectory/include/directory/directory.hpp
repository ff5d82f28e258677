#pragma once

#include "directory/team.hpp"
#include "directory/types.hpp"
#include "directory/user.hpp"
#include "protocol/protocol.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tc::directory {

//! Parallel arrays describing every roster slot of one team.
struct TeamStatusView {
	std::vector<std::string> names;  //!< Display name, empty for vacant slots.
	std::vector<StatusId> statuses;  //!< Status, inactive sigil for vacant slots.
};

//! Team and status names the server was set up with. Index equals team ID or status.
struct StaticDescription {
	const std::vector<std::string>& teamNames;
	const std::vector<std::string>& statusNames;
};

//! In-memory registry of teams and users.
//! Not thread safe. Exactly one owner may call into it; the server's IO thread is that owner.
class Directory {
public:
	//! Set up the fixed teams and supported statuses.
	//! \param userLimit Exclusive upper bound for network IDs; capped at the protocol limit.
	//! \note Throws ProtocolError(InvalidConfiguration) on empty or oversized lists and invalid names.
	Directory(std::vector<std::string> teamNames, std::vector<std::string> statusNames, NetworkId userLimit = protocol::NETWORK_ID_LIMIT);

	//! Register a user without team and with inactive status.
	//! \note Throws ProtocolError(InvalidIdentifier) or ProtocolError(CapacityExceeded).
	const User& createUser(const std::string& displayName);

	//! Returns nullptr for IDs that were never assigned.
	const User* lookupUser(NetworkId networkId) const;

	//! Apply absolute status and team values. Repeating the same call changes nothing.
	//! The recorded status and team are always updated. A user moving to a full team keeps the
	//! recorded team but gets no roster slot, so team reports do not list them.
	//! \return False if the user is recorded on a team without holding a slot in its roster.
	//! \note Throws ProtocolError with InvalidNetworkId, InvalidStatus or InvalidTeamId.
	//!       Nothing is modified when it throws.
	bool setUserStatusAndTeam(NetworkId networkId, unsigned status, unsigned teamId);

	//! Names and statuses of every roster slot. Throws ProtocolError(InvalidTeamId) if out of range.
	TeamStatusView teamStatusView(unsigned teamId) const;

	StaticDescription staticDescription() const; //!< Fixed at construction.
	const Team& team(TeamId teamId) const;

	std::size_t teamCount() const;
	std::size_t userCount() const;
	std::size_t userCapacity() const;

private:
	bool isValidTeam(unsigned teamId) const;
	static bool isValidStatus(unsigned status);

private:
	const std::vector<std::string> m_teamNames;
	const std::vector<std::string> m_statusNames;
	const NetworkId m_userLimit;

	std::vector<Team> m_teams;
	std::vector<User> m_users; //!< Index equals network ID.
};

} // namespace tc::directory
