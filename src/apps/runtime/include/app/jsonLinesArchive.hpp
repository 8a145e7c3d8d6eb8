#pragma once

#include "core/IMatchArchive.hpp"

#include <filesystem>
#include <mutex>

namespace wordgrid::app {

//! Appends every completed match as one JSON document per line.
class JsonLinesArchive : public IMatchArchive {
public:
	explicit JsonLinesArchive(std::filesystem::path path);

	//! \note Throws std::runtime_error if the file cannot be written.
	void archive(const MatchState& match) override;

	const std::filesystem::path& path() const;

private:
	std::mutex m_mutex; //!< Lines of concurrently completing matches must not interleave.
	std::filesystem::path m_path;
};

} // namespace wordgrid::app
