#include "app/wordListDictionary.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>

namespace wordgrid::app {

static std::string normalize(std::string_view word) {
	// Trim surrounding whitespace, also the '\r' of CRLF files.
	const auto first = word.find_first_not_of(" \t\r\n");
	if (first == std::string_view::npos) {
		return {};
	}
	const auto last = word.find_last_not_of(" \t\r\n");

	std::string result(word.substr(first, last - first + 1u));
	std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return result;
}

WordListDictionary::WordListDictionary(const std::vector<std::string>& words) {
	for (const auto& word : words) {
		add(word);
	}
}

std::optional<WordListDictionary> WordListDictionary::load(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Dictionary] Could not open word list '{}'.", path.string()));
		return {};
	}

	WordListDictionary dictionary;
	std::string line;
	while (std::getline(file, line)) {
		if (!line.empty() && line.front() == '#') {
			continue;
		}
		dictionary.add(line);
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Dictionary] Loaded {} words from '{}'.", dictionary.size(), path.string()));
	return dictionary;
}

void WordListDictionary::add(std::string_view word) {
	auto normalized = normalize(word);
	if (!normalized.empty()) {
		m_words.insert(std::move(normalized));
	}
}

std::size_t WordListDictionary::size() const {
	return m_words.size();
}

bool WordListDictionary::isValidWord(std::string_view word) const {
	return m_words.contains(normalize(word));
}

} // namespace wordgrid::app
