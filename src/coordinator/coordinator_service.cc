#include "coordinator_service.h"

#include <optional>

#include <glog/logging.h>

namespace Sonar {

Status CoordinatorServiceImpl::JoinMonitor(ServerContext* context,
		const JoinRequest* request, JoinReply* reply) {
	const std::string& peer_id = request->peer_id();
	if (peer_id.empty() || request->clock_address().empty()) {
		reply->set_success(false);
		reply->set_message("peer_id and clock_address are required");
		return Status::OK;
	}

	absl::MutexLock lock(&membership_mutex_);
	if (!directory_->Connect(peer_id, request->clock_address())) {
		reply->set_success(false);
		reply->set_message("Peer already registered");
		return Status::OK;
	}

	RegistryStatus status = monitor_->Register(peer_id);
	if (status != RegistryStatus::kOk) {
		// Registry already tracks this id without a live connection
		directory_->Disconnect(peer_id);
		reply->set_success(false);
		reply->set_message("Peer already registered");
		return Status::OK;
	}

	VLOG(1) << "Peer " << peer_id << " joined from " << request->clock_address();
	reply->set_success(true);
	reply->set_message("Peer registered successfully");
	return Status::OK;
}

Status CoordinatorServiceImpl::LeaveMonitor(ServerContext* context,
		const LeaveRequest* request, LeaveReply* reply) {
	const std::string& peer_id = request->peer_id();
	absl::MutexLock lock(&membership_mutex_);

	std::optional<std::string> address = directory_->Disconnect(peer_id);
	if (address.has_value() && peer_left_callback_) {
		peer_left_callback_(*address);
	}

	RegistryStatus status = monitor_->Unregister(peer_id);
	if (status != RegistryStatus::kOk) {
		reply->set_success(false);
		reply->set_message(std::string("Cannot unregister peer: ") + ToString(status));
		return Status::OK;
	}

	VLOG(1) << "Peer " << peer_id << " left";
	reply->set_success(true);
	reply->set_message("Peer unregistered successfully");
	return Status::OK;
}

} // namespace Sonar
