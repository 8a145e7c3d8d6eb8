#include "app/jsonLinesArchive.hpp"

#include "model/json.hpp"

#include <format>
#include <fstream>
#include <stdexcept>

namespace wordgrid::app {

JsonLinesArchive::JsonLinesArchive(std::filesystem::path path) : m_path(std::move(path)) {
}

void JsonLinesArchive::archive(const MatchState& match) {
	const auto line = nlohmann::json(match).dump();

	std::lock_guard<std::mutex> lock(m_mutex);
	std::ofstream file(m_path, std::ios::app);
	if (!file) {
		throw std::runtime_error(std::format("Could not open match archive '{}'.", m_path.string()));
	}
	file << line << '\n';
	if (!file) {
		throw std::runtime_error(std::format("Could not write match archive '{}'.", m_path.string()));
	}
}

const std::filesystem::path& JsonLinesArchive::path() const {
	return m_path;
}

} // namespace wordgrid::app
