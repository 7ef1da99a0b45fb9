#ifndef SONAR_SRC_MONITOR_LATENCY_MONITOR_H_
#define SONAR_SRC_MONITOR_LATENCY_MONITOR_H_

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "common/config.h"
#include "interfaces.h"
#include "probe_scheduler.h"

namespace Sonar {

struct MonitorOptions {
	int64_t total_cycle_ms = kDefaultTotalCycleMs;
};

/// Owns the probe loop. Peers join and leave through Register/Unregister
/// while the loop thread started by Start() probes them one per interval.
class LatencyMonitor {
	public:
		LatencyMonitor(const MonitorOptions& options, ProbeTransport* transport,
				PeerLocator* locator, ObservationSink* sink, ClockFn clock = WallClockSeconds);
		~LatencyMonitor();

		LatencyMonitor(const LatencyMonitor&) = delete;
		LatencyMonitor& operator=(const LatencyMonitor&) = delete;

		/// Launch the probe loop
		/// @return false if it is already running
		bool Start();

		/// Wake the loop and join it. A probe in flight finishes first. Safe to
		/// call from several threads at once; only one of them joins.
		void Stop();

		bool IsRunning() const { return running_; }

		RegistryStatus Register(const std::string& id) { return scheduler_.Register(id); }
		RegistryStatus Unregister(const std::string& id) { return scheduler_.Unregister(id); }

		double CurrentIntervalSeconds() const { return scheduler_.CurrentIntervalSeconds(); }
		std::vector<PeerEntry> Snapshot() const { return scheduler_.Snapshot(); }

		/// Number of ticks the loop has executed
		uint64_t ticks() const { return ticks_; }

		ProbeScheduler& scheduler() { return scheduler_; }

	private:
		void Run();

		ProbeScheduler scheduler_;

		// Serializes Start and Stop, including the join
		absl::Mutex lifecycle_mutex_;

		absl::Mutex stop_mutex_;
		absl::CondVar stop_cv_;
		bool stop_requested_ ABSL_GUARDED_BY(stop_mutex_) = false;

		std::atomic<bool> running_{false};
		std::atomic<uint64_t> ticks_{0};
		std::thread loop_thread_;
};

} // namespace Sonar

#endif // SONAR_SRC_MONITOR_LATENCY_MONITOR_H_
