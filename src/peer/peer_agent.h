#ifndef SONAR_SRC_PEER_PEER_AGENT_H_
#define SONAR_SRC_PEER_PEER_AGENT_H_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <sonar.grpc.pb.h>

#include "peer_clock_service.h"

namespace Sonar {

struct PeerAgentOptions {
	std::string peer_id;
	/// host:port of the coordinator
	std::string coordinator_address;
	/// Port the clock service listens on
	int clock_port = 0;
	/// Host the coordinator should dial to reach the clock service
	std::string advertise_host;
};

/// Peer side of the monitor: serves PeerClock and announces itself to the
/// coordinator.
class PeerAgent {
	public:
		explicit PeerAgent(PeerAgentOptions options);
		~PeerAgent();

		/// Start the clock service, then join the coordinator. Calling it again
		/// after a successful start does nothing.
		/// @return false if the server could not bind or the join was refused
		bool Start();

		/// Leave the coordinator and stop the clock service
		void Stop();

		bool IsJoined() const { return joined_; }
		const std::string& peer_id() const { return options_.peer_id; }
		std::string ClockAddress() const;

	private:
		bool Join();
		void Leave();

		PeerAgentOptions options_;
		std::unique_ptr<PeerClockServiceImpl> clock_service_;
		std::unique_ptr<grpc::Server> server_;
		std::unique_ptr<sonar_rpc::Coordinator::Stub> coordinator_;
		bool joined_ = false;
};

/// Identifier unique across processes on the same host: hex timestamp plus a
/// random suffix.
std::string GeneratePeerId();

} // namespace Sonar

#endif // SONAR_SRC_PEER_PEER_AGENT_H_
