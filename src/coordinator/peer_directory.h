#ifndef SONAR_SRC_COORDINATOR_PEER_DIRECTORY_H_
#define SONAR_SRC_COORDINATOR_PEER_DIRECTORY_H_

#include <chrono>
#include <optional>
#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "monitor/interfaces.h"

namespace Sonar {

struct ConnectedPeer {
	std::string clock_address;
	std::chrono::steady_clock::time_point connected_at;
};

/// Peers with a live connection to the coordinator. A peer leaves this set
/// before it leaves the monitor's registry, which is what lets the scheduler
/// skip peers whose leave is still being processed.
class PeerDirectory : public PeerLocator {
	public:
		/// @return false if peer_id is already connected
		bool Connect(const std::string& peer_id, const std::string& clock_address);

		/// @return The address the peer was connected with, nullopt if unknown
		std::optional<std::string> Disconnect(const std::string& peer_id);

		std::optional<PeerHandle> ResolveLivePeer(const std::string& peer_id) override;

		size_t size() const;

	private:
		mutable absl::Mutex mutex_;
		absl::flat_hash_map<std::string, ConnectedPeer> peers_ ABSL_GUARDED_BY(mutex_);
};

} // namespace Sonar

#endif // SONAR_SRC_COORDINATOR_PEER_DIRECTORY_H_
