#pragma once

#include "Logger/Logger.hpp"

namespace tc::teamNet {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace tc::teamNet
