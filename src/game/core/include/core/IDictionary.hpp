#pragma once

#include <string_view>

namespace wordgrid {

//! Word oracle consulted by the scoring engine.
class IDictionary {
public:
	virtual ~IDictionary() = default;

	//! Receives the candidate in lower case. Must answer deterministically for the lifetime of a match.
	virtual bool isValidWord(std::string_view word) const = 0;
};

} // namespace wordgrid
