#ifndef SONAR_SRC_MONITOR_PROBE_SCHEDULER_H_
#define SONAR_SRC_MONITOR_PROBE_SCHEDULER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "interfaces.h"
#include "interval_controller.h"
#include "peer_registry.h"

namespace Sonar {

enum class TickOutcome {
	/// Nothing registered
	kIdle,
	/// Registered peer was no longer connected
	kSkippedStale,
	/// Transport reported an error
	kProbeFailed,
	/// Statistics updated and an observation emitted
	kProbed,
	/// Peer unregistered while its probe was in flight
	kDiscarded
};

const char* ToString(TickOutcome outcome);

/// Round-robin prober. Each Tick probes at most one peer, walking the
/// registry from head to tail and starting over once the tail is passed.
///
/// Register/Unregister may be called from any thread. Tick must be driven by a
/// single thread; the probe itself runs without holding the lock so joins and
/// leaves are never blocked behind a slow peer.
class ProbeScheduler {
	public:
		ProbeScheduler(int64_t total_cycle_ms, ProbeTransport* transport,
				PeerLocator* locator, ObservationSink* sink, ClockFn clock = WallClockSeconds);

		ProbeScheduler(const ProbeScheduler&) = delete;
		ProbeScheduler& operator=(const ProbeScheduler&) = delete;

		RegistryStatus Register(const std::string& id);

		/// If the cursor names the removed peer it moves to that peer's successor
		RegistryStatus Unregister(const std::string& id);

		TickOutcome Tick();

		double CurrentIntervalSeconds() const;
		void SetTotalCycleMs(int64_t total_cycle_ms);

		/// Peer the next tick will probe, nullopt between cycles
		std::optional<std::string> CursorId() const;

		std::optional<PeerEntry> Lookup(const std::string& id) const;
		std::vector<PeerEntry> Snapshot() const;
		size_t size() const;

	private:
		/// Move the cursor past a probed entry unless Unregister already moved it
		void AdvancePast(EntryHandle probed) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

		mutable absl::Mutex mu_;
		PeerRegistry registry_ ABSL_GUARDED_BY(mu_);
		IntervalController interval_ ABSL_GUARDED_BY(mu_);
		EntryHandle cursor_ ABSL_GUARDED_BY(mu_);

		ProbeTransport* transport_;
		PeerLocator* locator_;
		ObservationSink* sink_;
		ClockFn clock_;
};

} // namespace Sonar

#endif // SONAR_SRC_MONITOR_PROBE_SCHEDULER_H_
