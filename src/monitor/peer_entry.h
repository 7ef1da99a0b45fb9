#ifndef SONAR_SRC_MONITOR_PEER_ENTRY_H_
#define SONAR_SRC_MONITOR_PEER_ENTRY_H_

#include <cstdint>
#include <limits>
#include <string>

namespace Sonar {

/// Stable reference to a registry slot. The generation changes every time the
/// slot is released, so a handle to a removed peer never resolves to whoever
/// reuses the slot.
struct EntryHandle {
	static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

	uint32_t index = kInvalidIndex;
	uint32_t generation = 0;

	bool valid() const { return index != kInvalidIndex; }

	bool operator==(const EntryHandle& other) const {
		return index == other.index && generation == other.generation;
	}
	bool operator!=(const EntryHandle& other) const { return !(*this == other); }
};

/// Latency state kept for one monitored peer
struct PeerEntry {
	std::string id;
	/// Saturates at kMaxSamples
	int sample_count = 0;
	/// Seconds
	double avg_latency = 0.0;
	double avg_clock_offset = 0.0;

	/// Positional links inside the registry. Non-owning.
	EntryHandle prev;
	EntryHandle next;
};

} // namespace Sonar

#endif // SONAR_SRC_MONITOR_PEER_ENTRY_H_
