#pragma once

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string_view>

namespace wordgrid {

//! Raised when an entity reaches a state the rules can never produce.
//! \note Not meant to be handled. It signals a bug upstream.
class InvariantViolation : public std::logic_error {
public:
	using std::logic_error::logic_error;
};

//! Logs the violation together with the full entity state and throws InvariantViolation.
[[noreturn]] void raiseInvariantViolation(std::string_view component, std::string_view what, const nlohmann::json& state);

} // namespace wordgrid
