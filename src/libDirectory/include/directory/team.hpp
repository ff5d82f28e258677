#pragma once

#include "directory/types.hpp"

#include <array>
#include <optional>
#include <string>

namespace tc::directory {

//! Fixed capacity roster. A slot holds the network ID of a member or is vacant.
//! The slot index carries no meaning beyond ordering the team status report.
class Team {
public:
	using Slots = std::array<std::optional<NetworkId>, MAX_TEAM_SIZE>;

	explicit Team(std::string name);

	//! Place the user in the first vacant slot.
	//! Returns false if the user is already a member or the roster is full.
	bool add(NetworkId networkId);
	bool remove(NetworkId networkId); //!< Returns false if the user was not a member.

	bool contains(NetworkId networkId) const;
	bool isFull() const;
	std::size_t size() const; //!< Number of occupied slots.

	const std::string& name() const;
	const Slots& slots() const;

private:
	std::string m_name;
	Slots m_slots{};
};

} // namespace tc::directory
