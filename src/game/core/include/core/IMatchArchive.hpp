#pragma once

#include "model/matchState.hpp"

namespace wordgrid {

//! Persistence collaborator. Receives every completed match exactly once.
//! \note Fire and forget: a throwing archive is logged and not retried.
class IMatchArchive {
public:
	virtual ~IMatchArchive()                      = default;
	virtual void archive(const MatchState& match) = 0;
};

} // namespace wordgrid
