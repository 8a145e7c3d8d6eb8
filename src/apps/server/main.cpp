#include "app/config.hpp"
#include "app/gameServer.hpp"
#include "app/jsonLinesArchive.hpp"
#include "app/wordListDictionary.hpp"

#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
	using namespace wordgrid::app;

	const auto config = parseConfig(argc, argv);
	if (!config) {
		std::cerr << usage();
		return 1;
	}

	const auto dictionary = WordListDictionary::load(config->dictionary);
	if (!dictionary) {
		std::cerr << "Could not load word list " << config->dictionary << '\n';
		return 1;
	}

	std::unique_ptr<JsonLinesArchive> archive;
	if (!config->archive.empty()) {
		archive = std::make_unique<JsonLinesArchive>(config->archive);
	}

	GameServer server(*config, *dictionary, archive.get());
	if (!server.start()) {
		std::cerr << "Could not listen on port " << config->port << '\n';
		return 1;
	}

	// Keep the server process alive until stdin closes or quit command.
	std::string line;
	while (std::getline(std::cin, line)) {
		if (line == "quit" || line == "exit") {
			break;
		}
	}

	server.stop();
	return 0;
}
