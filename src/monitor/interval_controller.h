#ifndef SONAR_SRC_MONITOR_INTERVAL_CONTROLLER_H_
#define SONAR_SRC_MONITOR_INTERVAL_CONTROLLER_H_

#include <cstddef>
#include <cstdint>

#include "common/config.h"

namespace Sonar {

/// Spreads one probe cycle over the active peers. With total_cycle_ms of 1000
/// and 10 peers, one peer is probed every 100 ms, so the aggregate probe rate
/// stays fixed as peers join.
class IntervalController {
	public:
		/// @param total_cycle_ms Must be positive
		explicit IntervalController(int64_t total_cycle_ms = kDefaultTotalCycleMs);

		/// Recalculate the per-peer spacing
		/// @param active_count Number of registered peers
		/// @return The new spacing in seconds
		double Recompute(size_t active_count);

		double current_interval_seconds() const { return current_interval_seconds_; }

		int64_t total_cycle_ms() const { return total_cycle_ms_; }
		/// Takes effect on the next Recompute
		void set_total_cycle_ms(int64_t total_cycle_ms);

	private:
		int64_t total_cycle_ms_;
		double current_interval_seconds_ = kIdleIntervalSeconds;
};

} // namespace Sonar

#endif // SONAR_SRC_MONITOR_INTERVAL_CONTROLLER_H_
