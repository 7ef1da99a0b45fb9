#include "observation_log.h"

#include <chrono>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

namespace Sonar {

double WallClockSeconds() {
	using namespace std::chrono;
	return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

std::string FormatObservation(const Observation& o) {
	std::stringstream ss;
	ss << std::fixed << std::setprecision(6)
		<< "Peer " << o.peer_id
		<< " - PingTx: " << o.send_timestamp
		<< "; PeerClock: " << o.remote_timestamp
		<< "; PongRx: " << o.receive_timestamp
		<< "; Latency: " << o.latency
		<< "; AvgLatency: " << o.avg_latency
		<< "; ClockOffset: " << o.clock_offset
		<< "; AvgClockOffset: " << o.avg_clock_offset
		<< "; Samples: " << o.sample_count;
	return ss.str();
}

void LogObservationSink::OnObservation(const Observation& observation) {
	LOG(INFO) << FormatObservation(observation);
}

void LogObservationSink::OnProbeFailed(const std::string& peer_id, const std::string& error) {
	LOG(WARNING) << "Failed to probe peer " << peer_id << ". ERROR: " << error;
}

} // namespace Sonar
