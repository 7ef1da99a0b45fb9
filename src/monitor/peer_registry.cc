#include "peer_registry.h"

namespace Sonar {

const char* ToString(RegistryStatus status) {
	switch (status) {
		case RegistryStatus::kOk:
			return "OK";
		case RegistryStatus::kDuplicateEntry:
			return "DuplicateEntry";
		case RegistryStatus::kUnknownEntry:
			return "UnknownEntry";
	}
	return "Unknown";
}

RegistryStatus PeerRegistry::Register(const std::string& id) {
	if (index_.contains(id)) {
		return RegistryStatus::kDuplicateEntry;
	}

	EntryHandle handle = Allocate();
	PeerEntry& entry = slots_[handle.index].entry;
	entry = PeerEntry{};
	entry.id = id;

	if (tail_.valid()) {
		slots_[tail_.index].entry.next = handle;
		entry.prev = tail_;
	} else {
		head_ = handle;
	}
	tail_ = handle;

	index_[id] = handle;
	return RegistryStatus::kOk;
}

RegistryStatus PeerRegistry::Unregister(const std::string& id, EntryHandle* removed_next) {
	auto it = index_.find(id);
	if (it == index_.end()) {
		return RegistryStatus::kUnknownEntry;
	}

	EntryHandle handle = it->second;
	PeerEntry& entry = slots_[handle.index].entry;

	if (head_ == handle) {
		head_ = entry.next;
	}
	if (tail_ == handle) {
		tail_ = entry.prev;
	}
	if (entry.prev.valid()) {
		slots_[entry.prev.index].entry.next = entry.next;
	}
	if (entry.next.valid()) {
		slots_[entry.next.index].entry.prev = entry.prev;
	}

	if (removed_next != nullptr) {
		*removed_next = entry.next;
	}

	index_.erase(it);
	Release(handle.index);
	return RegistryStatus::kOk;
}

const PeerEntry* PeerRegistry::Lookup(const std::string& id) const {
	auto it = index_.find(id);
	if (it == index_.end()) {
		return nullptr;
	}
	return &slots_[it->second.index].entry;
}

EntryHandle PeerRegistry::HandleOf(const std::string& id) const {
	auto it = index_.find(id);
	if (it == index_.end()) {
		return EntryHandle{};
	}
	return it->second;
}

PeerEntry* PeerRegistry::Get(EntryHandle handle) {
	if (!handle.valid() || handle.index >= slots_.size()) {
		return nullptr;
	}
	Slot& slot = slots_[handle.index];
	if (!slot.in_use || slot.generation != handle.generation) {
		return nullptr;
	}
	return &slot.entry;
}

const PeerEntry* PeerRegistry::Get(EntryHandle handle) const {
	return const_cast<PeerRegistry*>(this)->Get(handle);
}

EntryHandle PeerRegistry::Next(EntryHandle handle) const {
	const PeerEntry* entry = Get(handle);
	if (entry == nullptr) {
		return EntryHandle{};
	}
	return entry->next;
}

std::vector<std::string> PeerRegistry::Ids() const {
	std::vector<std::string> ids;
	ids.reserve(index_.size());
	for (EntryHandle h = head_; h.valid(); h = slots_[h.index].entry.next) {
		ids.push_back(slots_[h.index].entry.id);
	}
	return ids;
}

std::vector<PeerEntry> PeerRegistry::Snapshot() const {
	std::vector<PeerEntry> entries;
	entries.reserve(index_.size());
	for (EntryHandle h = head_; h.valid(); h = slots_[h.index].entry.next) {
		entries.push_back(slots_[h.index].entry);
	}
	return entries;
}

EntryHandle PeerRegistry::Allocate() {
	uint32_t index;
	if (!free_slots_.empty()) {
		index = free_slots_.back();
		free_slots_.pop_back();
	} else {
		index = static_cast<uint32_t>(slots_.size());
		slots_.emplace_back();
	}
	Slot& slot = slots_[index];
	slot.in_use = true;
	return EntryHandle{index, slot.generation};
}

void PeerRegistry::Release(uint32_t index) {
	Slot& slot = slots_[index];
	slot.in_use = false;
	slot.generation++;
	slot.entry = PeerEntry{};
	free_slots_.push_back(index);
}

} // namespace Sonar
