#include "peer_directory.h"

#include <glog/logging.h>

namespace Sonar {

bool PeerDirectory::Connect(const std::string& peer_id, const std::string& clock_address) {
	absl::MutexLock lock(&mutex_);
	auto [it, inserted] = peers_.try_emplace(peer_id,
			ConnectedPeer{clock_address, std::chrono::steady_clock::now()});
	if (!inserted) {
		VLOG(1) << "Peer " << peer_id << " already connected from " << it->second.clock_address;
		return false;
	}
	VLOG(2) << "Peer " << peer_id << " connected, clock at " << clock_address;
	return true;
}

std::optional<std::string> PeerDirectory::Disconnect(const std::string& peer_id) {
	absl::MutexLock lock(&mutex_);
	auto it = peers_.find(peer_id);
	if (it == peers_.end()) {
		return std::nullopt;
	}
	std::string address = it->second.clock_address;
	auto connected_for = std::chrono::duration_cast<std::chrono::seconds>(
			std::chrono::steady_clock::now() - it->second.connected_at);
	peers_.erase(it);
	VLOG(2) << "Peer " << peer_id << " disconnected after " << connected_for.count() << "s";
	return address;
}

std::optional<PeerHandle> PeerDirectory::ResolveLivePeer(const std::string& peer_id) {
	absl::MutexLock lock(&mutex_);
	auto it = peers_.find(peer_id);
	if (it == peers_.end()) {
		return std::nullopt;
	}
	return PeerHandle{peer_id, it->second.clock_address};
}

size_t PeerDirectory::size() const {
	absl::MutexLock lock(&mutex_);
	return peers_.size();
}

} // namespace Sonar
