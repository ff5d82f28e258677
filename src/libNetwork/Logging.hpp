#pragma once

#include "Logger/Logger.hpp"

namespace tc::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace tc::network
