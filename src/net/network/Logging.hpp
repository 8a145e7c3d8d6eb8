#pragma once

#include "Logger/Logger.hpp"

namespace wordgrid::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace wordgrid::network
