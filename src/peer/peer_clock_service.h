#ifndef SONAR_SRC_PEER_PEER_CLOCK_SERVICE_H_
#define SONAR_SRC_PEER_PEER_CLOCK_SERVICE_H_

#include <atomic>
#include <cstdint>
#include <string>

#include <grpcpp/grpcpp.h>
#include <sonar.grpc.pb.h>

#include "monitor/interfaces.h"

namespace Sonar {

/// Answers coordinator probes with this peer's wall clock
class PeerClockServiceImpl final : public sonar_rpc::PeerClock::Service {
	public:
		PeerClockServiceImpl(std::string peer_id, ClockFn clock = WallClockSeconds);

		/// A probe addressed to another peer id means the coordinator reached the
		/// wrong process at this address; it is refused so no sample is recorded.
		grpc::Status ReadClock(grpc::ServerContext* context,
				const sonar_rpc::ClockRequest* request,
				sonar_rpc::ClockReading* reply) override;

		uint64_t reads() const { return reads_; }

	private:
		const std::string peer_id_;
		ClockFn clock_;
		std::atomic<uint64_t> reads_{0};
};

} // namespace Sonar

#endif // SONAR_SRC_PEER_PEER_CLOCK_SERVICE_H_
