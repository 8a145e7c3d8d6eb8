#include "core/invariant.hpp"

#include "Logging.hpp"

#include <format>

namespace wordgrid {

void raiseInvariantViolation(std::string_view component, std::string_view what, const nlohmann::json& state) {
	const auto message = std::format("[{}] Invariant violated: {}.", component, what);
	Logger().Log(Logging::LogLevel::Error, std::format("{} State: {}", message, state.dump()));
	throw InvariantViolation(message);
}

} // namespace wordgrid
