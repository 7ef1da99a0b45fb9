#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/configuration.h"
#include "peer_agent.h"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void HandleShutdownSignal(int) {
	g_shutdown_requested = true;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("sonar_peer", "Clock responder for the Sonar latency monitor");
	options.allow_unrecognised_options();
	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("peer-id", "Identifier announced to the coordinator (generated if empty)",
		 cxxopts::value<std::string>()->default_value(""))
		("r,coordinator", "Coordinator address host:port", cxxopts::value<std::string>())
		("k,clock-port", "Port of the clock service", cxxopts::value<int>())
		("H,advertise-host", "Host the coordinator dials back", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	Sonar::Configuration& configuration = Sonar::Configuration::getInstance();
	configuration.overrideFromCommandLine(argc, argv);
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}
	const Sonar::SonarConfig& config = configuration.config();

	Sonar::PeerAgentOptions agent_options;
	agent_options.peer_id = arguments["peer-id"].as<std::string>();
	if (agent_options.peer_id.empty()) {
		agent_options.peer_id = Sonar::GeneratePeerId();
		LOG(INFO) << "peer_id is set to generated: " << agent_options.peer_id;
	}
	agent_options.coordinator_address = config.peer.coordinator_address.get();
	agent_options.clock_port = config.peer.clock_port.get();
	agent_options.advertise_host = config.peer.advertise_host.get();

	Sonar::PeerAgent agent(agent_options);
	if (!agent.Start()) {
		LOG(ERROR) << "Peer " << agent_options.peer_id << " could not join the monitor";
		return EXIT_FAILURE;
	}

	std::signal(SIGINT, HandleShutdownSignal);
	std::signal(SIGTERM, HandleShutdownSignal);

	while (!g_shutdown_requested) {
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}

	LOG(INFO) << "Received shutdown signal";
	agent.Stop();
	return EXIT_SUCCESS;
}
