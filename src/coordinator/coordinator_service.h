#ifndef SONAR_SRC_COORDINATOR_COORDINATOR_SERVICE_H_
#define SONAR_SRC_COORDINATOR_COORDINATOR_SERVICE_H_

#include <functional>
#include <string>
#include <utility>

#include <grpcpp/grpcpp.h>
#include <sonar.grpc.pb.h>

#include "absl/synchronization/mutex.h"
#include "monitor/latency_monitor.h"
#include "peer_directory.h"

namespace Sonar {

using grpc::ServerContext;
using grpc::Status;
using sonar_rpc::JoinReply;
using sonar_rpc::JoinRequest;
using sonar_rpc::LeaveReply;
using sonar_rpc::LeaveRequest;

using PeerLeftCallback = std::function<void(const std::string& clock_address)>;

/// Lifecycle notifications from peers. Join records the peer as connected and
/// then registers it for probing; leave does the reverse in the same order.
/// Each handler applies both steps under one lock, so the directory and the
/// registry always agree on who is a member.
class CoordinatorServiceImpl final : public sonar_rpc::Coordinator::Service {
	public:
		CoordinatorServiceImpl(LatencyMonitor* monitor, PeerDirectory* directory)
			: monitor_(monitor), directory_(directory) {}

		Status JoinMonitor(ServerContext* context, const JoinRequest* request,
				JoinReply* reply) override;

		Status LeaveMonitor(ServerContext* context, const LeaveRequest* request,
				LeaveReply* reply) override;

		/// Invoked after a peer is dropped from the directory
		void RegisterPeerLeftCallback(PeerLeftCallback callback) {
			peer_left_callback_ = std::move(callback);
		}

	private:
		LatencyMonitor* monitor_;
		PeerDirectory* directory_;
		PeerLeftCallback peer_left_callback_;

		absl::Mutex membership_mutex_;
};

} // namespace Sonar

#endif // SONAR_SRC_COORDINATOR_COORDINATOR_SERVICE_H_
