#ifndef SONAR_SRC_MONITOR_OBSERVATION_LOG_H_
#define SONAR_SRC_MONITOR_OBSERVATION_LOG_H_

#include <string>

#include "interfaces.h"

namespace Sonar {

std::string FormatObservation(const Observation& observation);

/// Writes every observation to the glog INFO stream and failures to WARNING
class LogObservationSink : public ObservationSink {
	public:
		void OnObservation(const Observation& observation) override;
		void OnProbeFailed(const std::string& peer_id, const std::string& error) override;
};

} // namespace Sonar

#endif // SONAR_SRC_MONITOR_OBSERVATION_LOG_H_
