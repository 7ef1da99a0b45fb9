#ifndef SONAR_SRC_COORDINATOR_GRPC_PROBE_TRANSPORT_H_
#define SONAR_SRC_COORDINATOR_GRPC_PROBE_TRANSPORT_H_

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include <sonar.grpc.pb.h>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "monitor/interfaces.h"

namespace Sonar {

/// Probes peers by calling PeerClock.ReadClock. One channel is kept per peer
/// address and reused across cycles.
class GrpcProbeTransport : public ProbeTransport {
	public:
		/// @param deadline_ms Per-call deadline, 0 for none
		explicit GrpcProbeTransport(int deadline_ms = 0) : deadline_ms_(deadline_ms) {}

		ProbeResult Probe(const PeerHandle& peer) override;

		/// Drop the cached channel for a departed peer. A probe already using it
		/// keeps its own reference.
		void Forget(const std::string& address);

		size_t cached_channels() const;

	private:
		std::shared_ptr<sonar_rpc::PeerClock::Stub> GetStub(const std::string& address);

		const int deadline_ms_;
		mutable absl::Mutex mutex_;
		absl::flat_hash_map<std::string, std::shared_ptr<sonar_rpc::PeerClock::Stub>> stubs_
			ABSL_GUARDED_BY(mutex_);
};

} // namespace Sonar

#endif // SONAR_SRC_COORDINATOR_GRPC_PROBE_TRANSPORT_H_
