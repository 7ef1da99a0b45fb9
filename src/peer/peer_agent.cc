#include "peer_agent.h"

#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#include <glog/logging.h>

namespace Sonar {

PeerAgent::PeerAgent(PeerAgentOptions options)
	: options_(std::move(options)) {}

PeerAgent::~PeerAgent() {
	Stop();
}

std::string PeerAgent::ClockAddress() const {
	return options_.advertise_host + ":" + std::to_string(options_.clock_port);
}

bool PeerAgent::Start() {
	// Only one clock responder per peer
	if (server_) {
		return true;
	}

	clock_service_ = std::make_unique<PeerClockServiceImpl>(options_.peer_id);
	grpc::ServerBuilder builder;
	builder.AddListeningPort("0.0.0.0:" + std::to_string(options_.clock_port),
			grpc::InsecureServerCredentials());
	builder.RegisterService(clock_service_.get());
	server_ = builder.BuildAndStart();
	if (!server_) {
		LOG(ERROR) << "Failed to start clock service on port " << options_.clock_port;
		clock_service_.reset();
		return false;
	}

	coordinator_ = sonar_rpc::Coordinator::NewStub(
			grpc::CreateChannel(options_.coordinator_address, grpc::InsecureChannelCredentials()));

	if (!Join()) {
		server_->Shutdown();
		server_.reset();
		clock_service_.reset();
		return false;
	}
	return true;
}

void PeerAgent::Stop() {
	if (!server_) {
		return;
	}
	Leave();
	server_->Shutdown();
	server_.reset();
	clock_service_.reset();
}

bool PeerAgent::Join() {
	grpc::ClientContext context;
	sonar_rpc::JoinRequest request;
	request.set_peer_id(options_.peer_id);
	request.set_clock_address(ClockAddress());
	sonar_rpc::JoinReply reply;

	grpc::Status status = coordinator_->JoinMonitor(&context, request, &reply);
	if (!status.ok()) {
		LOG(ERROR) << "JoinMonitor to " << options_.coordinator_address
			<< " failed: " << status.error_message();
		return false;
	}
	if (!reply.success()) {
		LOG(ERROR) << "Coordinator refused peer " << options_.peer_id << ": " << reply.message();
		return false;
	}
	joined_ = true;
	LOG(INFO) << "Peer " << options_.peer_id << " joined " << options_.coordinator_address
		<< ", clock at " << ClockAddress();
	return true;
}

void PeerAgent::Leave() {
	if (!joined_) {
		return;
	}
	grpc::ClientContext context;
	context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(2));
	sonar_rpc::LeaveRequest request;
	request.set_peer_id(options_.peer_id);
	sonar_rpc::LeaveReply reply;

	grpc::Status status = coordinator_->LeaveMonitor(&context, request, &reply);
	joined_ = false;
	if (!status.ok()) {
		LOG(WARNING) << "LeaveMonitor failed: " << status.error_message();
		return;
	}
	if (!reply.success()) {
		LOG(WARNING) << "Coordinator did not unregister peer " << options_.peer_id
			<< ": " << reply.message();
		return;
	}
	LOG(INFO) << "Peer " << options_.peer_id << " left " << options_.coordinator_address;
}

// We do not use the address as identifier b/c multiple peers could run on a single host
std::string GeneratePeerId() {
	auto now = std::chrono::system_clock::now();
	auto now_ms = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
	long long timestamp = now_ms.time_since_epoch().count();

	std::random_device rd;
	std::mt19937 gen(rd());
	std::uniform_int_distribution<> dis(0, 999999);
	int random_num = dis(gen);

	std::stringstream ss;
	ss << std::hex << std::setfill('0')
		<< std::setw(12) << timestamp
		<< std::setw(6) << random_num;
	return ss.str();
}

} // namespace Sonar
