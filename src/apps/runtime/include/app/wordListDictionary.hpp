#pragma once

#include "core/IDictionary.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace wordgrid::app {

//! In memory word list. Lookups ignore case.
class WordListDictionary : public IDictionary {
public:
	WordListDictionary() = default;
	explicit WordListDictionary(const std::vector<std::string>& words);

	//! Load a newline separated list. Blank lines and lines starting with '#' are skipped.
	static std::optional<WordListDictionary> load(const std::filesystem::path& path);

	void add(std::string_view word);
	std::size_t size() const;

	bool isValidWord(std::string_view word) const override;

private:
	std::unordered_set<std::string> m_words;
};

} // namespace wordgrid::app
