#include "stats_engine.h"

#include <algorithm>

#include "common/config.h"

namespace Sonar {

void StatsEngine::Update(PeerEntry& entry, double latency_sample, double offset_sample) {
	int n = std::min(entry.sample_count + 1, kMaxSamples);
	entry.sample_count = n;
	entry.avg_latency = Fold(entry.avg_latency, latency_sample, n);
	entry.avg_clock_offset = Fold(entry.avg_clock_offset, offset_sample, n);
}

double StatsEngine::Fold(double avg, double sample, int n) {
	avg = avg - (avg / n);
	avg = avg + (sample / n);
	return avg;
}

} // namespace Sonar
