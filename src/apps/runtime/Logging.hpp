#pragma once

#include "Logger/Logger.hpp"

namespace wordgrid::app {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace wordgrid::app
