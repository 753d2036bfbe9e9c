#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// System includes
#include <pthread.h>
#include <signal.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "../common/configuration.h"
#include "../presence/presence_publisher.h"
#include "../presence/presence_sink.h"
#include "../tracker/pattern_table.h"
#include "../tracker/split_state_machine.h"
#include "../tracker/split_tracker.h"

namespace {

constexpr char kDefaultConfigPath[] = "config/splitwatch.yaml";

// Blocks SIGINT/SIGTERM for this thread and every thread started after it,
// so the main thread can collect them with sigwait().
bool BlockStopSignals(sigset_t* set) {
	sigemptyset(set);
	sigaddset(set, SIGINT);
	sigaddset(set, SIGTERM);
	int rc = pthread_sigmask(SIG_BLOCK, set, nullptr);
	if (rc != 0) {
		LOG(ERROR) << "pthread_sigmask failed: " << strerror(rc);
		return false;
	}
	return true;
}

int WaitForStopSignal(const sigset_t* set) {
	int sig = 0;
	while (true) {
		int rc = sigwait(set, &sig);
		if (rc == 0) {
			return sig;
		}
		if (rc != EINTR) {
			LOG(ERROR) << "sigwait failed: " << strerror(rc);
			return -1;
		}
	}
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files

	cxxopts::Options options("splitwatch", "Minecraft speedrun split tracker driving a status display");
	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("log_file", "Game log to tail (latest.log)", cxxopts::value<std::string>())
		("snapshot_root", "Directory searched for split record files", cxxopts::value<std::string>())
		("status_file", "Write the rendered presence to this file", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>())
		("h,help", "Print usage");

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

	// *************** Configuration **********************
	Splitwatch::Configuration& config = Splitwatch::Configuration::getInstance();
	std::string config_path = arguments.count("config") ? arguments["config"].as<std::string>() : "";
	if (!config_path.empty()) {
		if (!config.loadFromFile(config_path)) {
			LOG(ERROR) << "Failed to load configuration file " << config_path;
			return EXIT_FAILURE;
		}
	} else if (std::ifstream(kDefaultConfigPath).good()) {
		if (!config.loadFromFile(kDefaultConfigPath)) {
			LOG(ERROR) << "Failed to load configuration file " << kDefaultConfigPath;
			return EXIT_FAILURE;
		}
	}
	config.overrideFromCommandLine(arguments);

	if (!config.validate()) {
		LOG(ERROR) << "Configuration validation failed";
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Validation error: " << error;
		}
		return EXIT_FAILURE;
	}
	FLAGS_v = config.config().logging.verbosity.get();

	// *************** Initialize components **********************
	std::vector<std::shared_ptr<Splitwatch::IPresenceSink>> sinks;
	if (config.config().presence.log_renders.get()) {
		sinks.push_back(std::make_shared<Splitwatch::LogPresenceSink>());
	}
	std::string status_file = config.config().presence.status_file.get();
	if (!status_file.empty()) {
		sinks.push_back(std::make_shared<Splitwatch::StatusFileSink>(status_file));
		LOG(INFO) << "Writing presence to " << status_file;
	}
	Splitwatch::PresencePublisher publisher(std::move(sinks));

	Splitwatch::SplitStateMachine state_machine(config.getDisplayBand(), config.getCooldown());
	Splitwatch::PatternTable patterns(config.getPatternRules());
	LOG(INFO) << "Loaded " << patterns.size() << " log patterns";

	sigset_t stop_signals;
	if (!BlockStopSignals(&stop_signals)) {
		return EXIT_FAILURE;
	}

	Splitwatch::SplitTracker tracker(config.getTrackerOptions(), std::move(patterns),
			state_machine, &publisher);
	tracker.Start();
	LOG(INFO) << "Splitwatch running. Press Ctrl+C to stop.";

	// *************** Wait for a stop signal **********************
	int sig = WaitForStopSignal(&stop_signals);
	LOG(INFO) << "Stopping tracker" << (sig > 0 ? std::string(" on ") + strsignal(sig) : std::string());
	tracker.Stop();

	LOG(INFO) << "Splitwatch terminating";
	return EXIT_SUCCESS;
}
