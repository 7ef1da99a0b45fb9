#include "interval_controller.h"

#include <glog/logging.h>

namespace Sonar {

IntervalController::IntervalController(int64_t total_cycle_ms)
	: total_cycle_ms_(total_cycle_ms) {
	CHECK_GT(total_cycle_ms_, 0) << "Probe cycle must be at least 1 ms";
}

void IntervalController::set_total_cycle_ms(int64_t total_cycle_ms) {
	CHECK_GT(total_cycle_ms, 0) << "Probe cycle must be at least 1 ms";
	total_cycle_ms_ = total_cycle_ms;
}

double IntervalController::Recompute(size_t active_count) {
	if (active_count > 0) {
		current_interval_seconds_ =
			(static_cast<double>(total_cycle_ms_) / static_cast<double>(active_count)) / 1000.0;
	} else {
		current_interval_seconds_ = kIdleIntervalSeconds;
	}
	return current_interval_seconds_;
}

} // namespace Sonar
