#include "grpc_probe_transport.h"

#include <chrono>

#include <glog/logging.h>

namespace Sonar {

ProbeResult GrpcProbeTransport::Probe(const PeerHandle& peer) {
	std::shared_ptr<sonar_rpc::PeerClock::Stub> stub = GetStub(peer.address);

	grpc::ClientContext context;
	if (deadline_ms_ > 0) {
		context.set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(deadline_ms_));
	}

	sonar_rpc::ClockRequest request;
	request.set_peer_id(peer.peer_id);
	sonar_rpc::ClockReading reply;

	grpc::Status status = stub->ReadClock(&context, request, &reply);
	if (!status.ok()) {
		return ProbeResult::Failure(
				"ReadClock to " + peer.address + " failed (" +
				std::to_string(static_cast<int>(status.error_code())) + "): " + status.error_message());
	}
	return ProbeResult::Success(reply.timestamp());
}

void GrpcProbeTransport::Forget(const std::string& address) {
	absl::MutexLock lock(&mutex_);
	stubs_.erase(address);
}

size_t GrpcProbeTransport::cached_channels() const {
	absl::MutexLock lock(&mutex_);
	return stubs_.size();
}

std::shared_ptr<sonar_rpc::PeerClock::Stub> GrpcProbeTransport::GetStub(const std::string& address) {
	absl::MutexLock lock(&mutex_);
	auto it = stubs_.find(address);
	if (it != stubs_.end()) {
		return it->second;
	}
	VLOG(2) << "Opening clock channel to " << address;
	std::shared_ptr<sonar_rpc::PeerClock::Stub> stub = sonar_rpc::PeerClock::NewStub(
			grpc::CreateChannel(address, grpc::InsecureChannelCredentials()));
	stubs_[address] = stub;
	return stub;
}

} // namespace Sonar
