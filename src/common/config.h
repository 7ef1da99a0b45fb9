#ifndef SONAR_SRC_COMMON_CONFIG_H_
#define SONAR_SRC_COMMON_CONFIG_H_

#include <cstdint>

namespace Sonar {

/// Running averages stop growing their window after this many samples
constexpr int kMaxSamples = 5;

/// Total time to sweep every registered peer once
constexpr int64_t kDefaultTotalCycleMs = 1000;

/// Probe spacing used while no peer is registered
constexpr double kIdleIntervalSeconds = 1.0;

constexpr int kDefaultCoordinatorPort = 50061;
constexpr int kDefaultPeerClockPort = 50062;

} // namespace Sonar

#endif // SONAR_SRC_COMMON_CONFIG_H_
