#pragma once

#include "directory/types.hpp"

#include <string>

namespace tc::directory {

//! Registered user. Identity (network ID, display name) never changes; team and status do.
class User {
public:
	User(NetworkId networkId, std::string displayName);

	NetworkId networkId() const;
	const std::string& displayName() const;
	StatusId status() const;
	TeamId teamId() const;
	bool hasTeam() const; //!< False while teamId is the wildcard.

private:
	friend class Directory;

	NetworkId m_networkId;
	std::string m_displayName;
	StatusId m_status;
	TeamId m_teamId;
};

} // namespace tc::directory
