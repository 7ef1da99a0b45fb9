#ifndef SONAR_SRC_MONITOR_STATS_ENGINE_H_
#define SONAR_SRC_MONITOR_STATS_ENGINE_H_

#include "peer_entry.h"

namespace Sonar {

/// Running averages over at most kMaxSamples samples.
///
/// Each update weighs the new sample by 1/n with n = min(samples + 1, kMaxSamples).
/// Up to kMaxSamples this is the exact arithmetic mean; afterwards every
/// update keeps a 1/kMaxSamples weight, which behaves like an exponential
/// average over roughly the last kMaxSamples probes.
class StatsEngine {
	public:
		static void Update(PeerEntry& entry, double latency_sample, double offset_sample);

		/// avg - avg/n + sample/n
		static double Fold(double avg, double sample, int n);
};

} // namespace Sonar

#endif // SONAR_SRC_MONITOR_STATS_ENGINE_H_
