#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>

// Project includes
#include "common/configuration.h"
#include "coordinator_service.h"
#include "grpc_probe_transport.h"
#include "monitor/latency_monitor.h"
#include "monitor/observation_log.h"
#include "peer_directory.h"

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

	cxxopts::Options options("sonar_coordinator",
			"Round-robin latency and clock offset monitor for connected peers");
	options.allow_unrecognised_options();
	options.add_options()
		("f,config", "YAML configuration file", cxxopts::value<std::string>())
		("y,total-cycle-ms", "Time to probe every peer once", cxxopts::value<int>())
		("a,listen", "Coordinator listen address", cxxopts::value<std::string>())
		("d,probe-deadline-ms", "Per-probe deadline, 0 for none", cxxopts::value<int>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Sonar::Configuration& configuration = Sonar::Configuration::getInstance();
	configuration.overrideFromCommandLine(argc, argv);
	if (!configuration.validate()) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}

	const std::string listen_address = configuration.getListenAddress();

	// *************** Initialize components **********************
	Sonar::PeerDirectory directory;
	Sonar::GrpcProbeTransport transport(configuration.getProbeDeadlineMs());
	Sonar::LogObservationSink sink;

	Sonar::MonitorOptions monitor_options;
	monitor_options.total_cycle_ms = configuration.getTotalCycleMs();
	Sonar::LatencyMonitor monitor(monitor_options, &transport, &directory, &sink);

	Sonar::CoordinatorServiceImpl service(&monitor, &directory);
	service.RegisterPeerLeftCallback(
			std::bind(&Sonar::GrpcProbeTransport::Forget, &transport, std::placeholders::_1));

	grpc::ServerBuilder builder;
	builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials());
	builder.RegisterService(&service);
	std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
	if (!server) {
		LOG(ERROR) << "Failed to start the coordinator on " << listen_address;
		return EXIT_FAILURE;
	}

	std::signal(SIGINT, HandleShutdownSignal);
	std::signal(SIGTERM, HandleShutdownSignal);

	std::thread shutdown_watcher([&server]() {
			while (!g_shutdown_requested) {
				std::this_thread::sleep_for(std::chrono::milliseconds(100));
			}
			LOG(INFO) << "Received shutdown signal";
			server->Shutdown();
			});

	monitor.Start();
	LOG(INFO) << "Sonar coordinator listening on " << listen_address
		<< ", cycle " << monitor_options.total_cycle_ms << "ms";

	// *************** Wait until shutdown **********************
	server->Wait();
	shutdown_watcher.join();
	monitor.Stop();

	LOG(INFO) << "Sonar coordinator terminating";
	return EXIT_SUCCESS;
}
