#include "latency_monitor.h"

#include <exception>
#include <utility>

#include <glog/logging.h>

#include "absl/time/time.h"

namespace Sonar {

LatencyMonitor::LatencyMonitor(const MonitorOptions& options, ProbeTransport* transport,
		PeerLocator* locator, ObservationSink* sink, ClockFn clock)
	: scheduler_(options.total_cycle_ms, transport, locator, sink, std::move(clock)) {}

LatencyMonitor::~LatencyMonitor() {
	Stop();
}

bool LatencyMonitor::Start() {
	absl::MutexLock lifecycle(&lifecycle_mutex_);
	if (running_) {
		return false;
	}
	running_ = true;
	{
		absl::MutexLock lock(&stop_mutex_);
		stop_requested_ = false;
	}
	loop_thread_ = std::thread([this]() {
			this->Run();
			});
	LOG(INFO) << "[LatencyMonitor] Started";
	return true;
}

void LatencyMonitor::Stop() {
	absl::MutexLock lifecycle(&lifecycle_mutex_);
	if (!running_) {
		return;
	}
	{
		absl::MutexLock lock(&stop_mutex_);
		stop_requested_ = true;
		stop_cv_.SignalAll();
	}
	if (loop_thread_.joinable()) {
		loop_thread_.join();
	}
	running_ = false;
	LOG(INFO) << "[LatencyMonitor] Stopped after " << ticks_ << " ticks";
}

void LatencyMonitor::Run() {
	while (true) {
		absl::Duration interval = absl::Seconds(scheduler_.CurrentIntervalSeconds());
		{
			absl::MutexLock lock(&stop_mutex_);
			absl::Time deadline = absl::Now() + interval;
			// WaitWithDeadline returns true once the deadline passes
			while (!stop_requested_ && !stop_cv_.WaitWithDeadline(&stop_mutex_, deadline)) {
			}
			if (stop_requested_) {
				break;
			}
		}

		try {
			TickOutcome outcome = scheduler_.Tick();
			VLOG(3) << "Tick " << ticks_ << ": " << ToString(outcome);
		} catch (const std::exception& e) {
			LOG(FATAL) << "[LatencyMonitor] Probe loop failed: " << e.what();
		}
		ticks_++;
	}
}

} // namespace Sonar
