#include "app/config.hpp"

#include "Logging.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <format>
#include <fstream>
#include <limits>
#include <string_view>

namespace wordgrid::app {

using nlohmann::json;

template <class T>
static std::optional<T> parseNumber(std::string_view value) {
	T parsed{};
	const auto* end      = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
	if (value.empty() || ec != std::errc() || ptr != end) {
		return {};
	}
	return parsed;
}

//! Checks values that are valid numbers but make no sense for a server.
static bool isValid(const ServerConfig& config) {
	return config.rounds > 0u && config.gridRows > 0u && config.gridCols > 0u && config.maxPlayers >= 2u && config.maxPlayers <= MAX_LOBBY_PLAYERS &&
	       config.maxLobbies > 0u && config.maxLobbies <= MAX_LIVE_LOBBIES;
}

static bool applyOption(ServerConfig& config, std::string_view option, std::string_view value) {
	if (option == "--port") {
		const auto port = parseNumber<std::uint16_t>(value);
		if (!port) {
			return false;
		}
		config.port = *port;
	} else if (option == "--dictionary") {
		config.dictionary = std::filesystem::path(value);
	} else if (option == "--archive") {
		config.archive = std::filesystem::path(value);
	} else if (option == "--rounds") {
		const auto rounds = parseNumber<unsigned>(value);
		if (!rounds) {
			return false;
		}
		config.rounds = *rounds;
	} else if (option == "--grid-rows") {
		const auto rows = parseNumber<unsigned>(value);
		if (!rows) {
			return false;
		}
		config.gridRows = *rows;
	} else if (option == "--grid-cols") {
		const auto cols = parseNumber<unsigned>(value);
		if (!cols) {
			return false;
		}
		config.gridCols = *cols;
	} else if (option == "--max-players") {
		const auto maxPlayers = parseNumber<std::size_t>(value);
		if (!maxPlayers) {
			return false;
		}
		config.maxPlayers = *maxPlayers;
	} else if (option == "--max-lobbies") {
		const auto maxLobbies = parseNumber<std::size_t>(value);
		if (!maxLobbies) {
			return false;
		}
		config.maxLobbies = *maxLobbies;
	} else if (option == "--seed") {
		const auto seed = parseNumber<std::uint64_t>(value);
		if (!seed) {
			return false;
		}
		config.seed = *seed;
	} else if (option == "--grace-seconds") {
		const auto grace = parseNumber<unsigned>(value);
		if (!grace) {
			return false;
		}
		config.grace = std::chrono::seconds(*grace);
	} else {
		return false;
	}
	return true;
}

//! Overlay values of a JSON config file. Keys are the option names without leading dashes.
static bool applyFile(ServerConfig& config, const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Could not open config file '{}'.", path.string()));
		return false;
	}

	try {
		const auto j = json::parse(file);
		if (!j.is_object()) {
			return false;
		}

		for (const auto& [key, value] : j.items()) {
			const auto text = value.is_string() ? value.get<std::string>() : value.dump();
			if (!applyOption(config, "--" + key, text)) {
				Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Invalid entry '{}' in '{}'.", key, path.string()));
				return false;
			}
		}
	} catch (const json::exception& e) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Could not parse '{}': {}", path.string(), e.what()));
		return false;
	}
	return true;
}

std::optional<ServerConfig> parseConfig(const std::vector<std::string>& args) {
	if (args.size() % 2u != 0u) {
		return {};
	}

	ServerConfig config;

	// File first so that explicit flags override it.
	for (std::size_t i = 0; i < args.size(); i += 2u) {
		if (args[i] == "--config" && !applyFile(config, args[i + 1u])) {
			return {};
		}
	}
	for (std::size_t i = 0; i < args.size(); i += 2u) {
		if (args[i] == "--config") {
			continue;
		}
		if (!applyOption(config, args[i], args[i + 1u])) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Config] Invalid argument '{} {}'.", args[i], args[i + 1u]));
			return {};
		}
	}

	if (!isValid(config)) {
		return {};
	}
	return config;
}

std::optional<ServerConfig> parseConfig(int argc, char** argv) {
	std::vector<std::string> args;
	for (int i = 1; i < argc; ++i) {
		args.emplace_back(argv[i]);
	}
	return parseConfig(args);
}

std::string usage() {
	return "Usage: wordgrid_server [options]\n"
	       "  --port <n>           TCP port to listen on\n"
	       "  --dictionary <file>  Newline separated word list\n"
	       "  --archive <file>     Append completed matches as JSON lines\n"
	       "  --rounds <n>         Rounds per player\n"
	       "  --grid-rows <n>      Grid rows\n"
	       "  --grid-cols <n>      Grid columns\n"
	       "  --max-players <n>    Lobby capacity (2-8)\n"
	       "  --max-lobbies <n>    Live lobbies at once (1-9000)\n"
	       "  --seed <n>           Fixed random seed\n"
	       "  --grace-seconds <n>  Disconnect grace period\n"
	       "  --config <file>      JSON file with the options above, e.g. {\"port\": 4000}\n";
}

} // namespace wordgrid::app
