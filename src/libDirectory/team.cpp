#include "directory/team.hpp"

#include <algorithm>
#include <utility>

namespace tc::directory {

Team::Team(std::string name) : m_name(std::move(name)) {
}

bool Team::add(NetworkId networkId) {
	auto freeSlot = m_slots.end();
	for (auto it = m_slots.begin(); it != m_slots.end(); ++it) {
		// Duplicate: do not add twice.
		if (*it == networkId) {
			return false;
		}
		if (freeSlot == m_slots.end() && !it->has_value()) {
			freeSlot = it;
		}
	}

	if (freeSlot == m_slots.end()) {
		return false;
	}
	*freeSlot = networkId;
	return true;
}

bool Team::remove(NetworkId networkId) {
	const auto it = std::find(m_slots.begin(), m_slots.end(), networkId);
	if (it == m_slots.end()) {
		return false;
	}
	it->reset();
	return true;
}

bool Team::contains(NetworkId networkId) const {
	return std::find(m_slots.begin(), m_slots.end(), networkId) != m_slots.end();
}

bool Team::isFull() const {
	return size() == m_slots.size();
}

std::size_t Team::size() const {
	return static_cast<std::size_t>(std::count_if(m_slots.begin(), m_slots.end(), [](const auto& slot) { return slot.has_value(); }));
}

const std::string& Team::name() const {
	return m_name;
}

const Team::Slots& Team::slots() const {
	return m_slots;
}

} // namespace tc::directory
