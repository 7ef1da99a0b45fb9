#ifndef SONAR_SRC_MONITOR_PEER_REGISTRY_H_
#define SONAR_SRC_MONITOR_PEER_REGISTRY_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "peer_entry.h"

namespace Sonar {

enum class RegistryStatus {
	kOk,
	kDuplicateEntry,
	kUnknownEntry
};

const char* ToString(RegistryStatus status);

/// Insertion-ordered set of monitored peers.
///
/// Entries live in an arena of slots and are chained head to tail through
/// EntryHandle links; the id table points at the same slots. Insertion order
/// is the round-robin probe order.
///
/// Not thread-safe. The owner serializes access.
class PeerRegistry {
	public:
		PeerRegistry() = default;

		/// Append a zeroed entry at the tail
		/// @param id Peer identifier
		/// @return kDuplicateEntry if id is already registered
		RegistryStatus Register(const std::string& id);

		/// Splice an entry out of the list and drop it from the id table
		/// @param id Peer identifier
		/// @param removed_next If not null, receives the successor the entry had
		/// @return kUnknownEntry if id is not registered
		RegistryStatus Unregister(const std::string& id, EntryHandle* removed_next = nullptr);

		/// O(1) lookup, nullptr when absent
		const PeerEntry* Lookup(const std::string& id) const;

		/// Handle for a registered id, invalid handle when absent
		EntryHandle HandleOf(const std::string& id) const;

		/// Resolve a handle; nullptr when the handle is invalid or stale
		PeerEntry* Get(EntryHandle handle);
		const PeerEntry* Get(EntryHandle handle) const;

		EntryHandle Head() const { return head_; }
		EntryHandle Tail() const { return tail_; }

		/// Successor of a live handle, invalid at the tail or for stale handles
		EntryHandle Next(EntryHandle handle) const;

		/// Ids from head to tail
		std::vector<std::string> Ids() const;

		/// Copies of every entry from head to tail
		std::vector<PeerEntry> Snapshot() const;

		size_t size() const { return index_.size(); }
		bool empty() const { return index_.empty(); }

	private:
		struct Slot {
			PeerEntry entry;
			uint32_t generation = 0;
			bool in_use = false;
		};

		EntryHandle Allocate();
		void Release(uint32_t index);

		std::vector<Slot> slots_;
		std::vector<uint32_t> free_slots_;
		absl::flat_hash_map<std::string, EntryHandle> index_;
		EntryHandle head_;
		EntryHandle tail_;
};

} // namespace Sonar

#endif // SONAR_SRC_MONITOR_PEER_REGISTRY_H_
