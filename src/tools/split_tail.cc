// Live log viewer: prints every new line of the game log and marks the lines
// the tracker would react to. Useful to check what a game version logs when
// entering the nether, a bastion, etc.
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "../common/configuration.h"
#include "../tracker/line_stream_reader.h"
#include "../tracker/pattern_table.h"

namespace {

volatile std::sig_atomic_t g_stop = 0;

void HandleStop(int) {
	g_stop = 1;
}

} // end of namespace

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	FLAGS_logtostderr = 1;

	cxxopts::Options options("split_tail", "Print new game log lines and the split rule each one matches");
	options.add_options()
		("f,file", "Log file to watch", cxxopts::value<std::string>())
		("c,config", "YAML configuration file for custom patterns", cxxopts::value<std::string>())
		("all", "Print the file from its start instead of its end")
		("interval_ms", "Poll interval", cxxopts::value<int>()->default_value("100"))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");
	options.parse_positional({"file"});

	std::optional<cxxopts::ParseResult> parsed;
	try {
		parsed.emplace(options.parse(argc, argv));
	} catch (const std::exception& e) {
		std::cerr << e.what() << "\n" << options.help() << std::endl;
		return EXIT_FAILURE;
	}
	const cxxopts::ParseResult& arguments = *parsed;
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}
	FLAGS_v = arguments["log_level"].as<int>();

	Splitwatch::Configuration& config = Splitwatch::Configuration::getInstance();
	if (arguments.count("config") && !config.loadFromFile(arguments["config"].as<std::string>())) {
		LOG(ERROR) << "Failed to load configuration file";
		return EXIT_FAILURE;
	}
	std::string path;
	if (arguments.count("file")) {
		path = arguments["file"].as<std::string>();
	} else {
		path = config.config().tracker.log_file.get();
	}
	if (path.empty()) {
		std::cerr << "No log file given.\n" << options.help() << std::endl;
		return EXIT_FAILURE;
	}
	int interval_ms = arguments["interval_ms"].as<int>();
	if (interval_ms < 10) {
		LOG(WARNING) << "Poll interval raised to 10ms";
		interval_ms = 10;
	}

	Splitwatch::PatternTable patterns(config.getPatternRules());
	Splitwatch::LineStreamReader reader(path, arguments.count("all") > 0);

	std::signal(SIGINT, HandleStop);
	std::signal(SIGTERM, HandleStop);

	std::cout << "Watching: " << path << "\n"
		<< "Every new log line is printed; lines a split rule matches are prefixed.\n"
		<< "Press Ctrl+C to stop.\n" << std::endl;

	while (!g_stop) {
		for (const auto& line : reader.Poll()) {
			const Splitwatch::PatternRule* rule = patterns.MatchingRule(line);
			if (rule != nullptr) {
				std::cout << ">> " << Splitwatch::EventKindName(rule->kind) << "("
					<< Splitwatch::MilestoneName(rule->milestone) << ") " << line << std::endl;
			} else {
				std::cout << line << std::endl;
			}
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
	}
	std::cout << "\nStopped." << std::endl;
	return EXIT_SUCCESS;
}
