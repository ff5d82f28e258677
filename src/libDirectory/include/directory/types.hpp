#pragma once

#include <cstddef>
#include <cstdint>

namespace tc::directory {

using NetworkId = std::uint32_t; //!< Sequential user ID, doubles as index into the user base.
using TeamId    = std::uint8_t;
using StatusId  = std::uint8_t;

inline constexpr std::size_t MAX_TEAM_COUNT        = 20; //!< Teams a server can be configured with.
inline constexpr std::size_t MAX_TEAM_SIZE         = 50; //!< Roster slots per team.
inline constexpr std::size_t MAX_STATUS_COUNT      = 20; //!< Statuses a server can be configured with.
inline constexpr std::size_t INITIAL_USERBASE_SIZE = 16; //!< User base capacity before the first doubling.

} // namespace tc::directory
