#include "probe_scheduler.h"

#include <utility>

#include <glog/logging.h>

#include "stats_engine.h"

namespace Sonar {

const char* ToString(TickOutcome outcome) {
	switch (outcome) {
		case TickOutcome::kIdle:
			return "Idle";
		case TickOutcome::kSkippedStale:
			return "SkippedStale";
		case TickOutcome::kProbeFailed:
			return "ProbeFailed";
		case TickOutcome::kProbed:
			return "Probed";
		case TickOutcome::kDiscarded:
			return "Discarded";
	}
	return "Unknown";
}

ProbeScheduler::ProbeScheduler(int64_t total_cycle_ms, ProbeTransport* transport,
		PeerLocator* locator, ObservationSink* sink, ClockFn clock)
	: interval_(total_cycle_ms),
	  transport_(transport),
	  locator_(locator),
	  sink_(sink),
	  clock_(std::move(clock)) {
	CHECK(transport_ != nullptr) << "ProbeScheduler requires a transport";
	CHECK(locator_ != nullptr) << "ProbeScheduler requires a peer locator";
	CHECK(sink_ != nullptr) << "ProbeScheduler requires an observation sink";
	CHECK(clock_) << "ProbeScheduler requires a clock";
}

RegistryStatus ProbeScheduler::Register(const std::string& id) {
	absl::MutexLock lock(&mu_);
	RegistryStatus status = registry_.Register(id);
	if (status != RegistryStatus::kOk) {
		LOG(WARNING) << "Peer " << id << " already registered";
		return status;
	}
	interval_.Recompute(registry_.size());
	LOG(INFO) << "Monitoring peer " << id << "... (" << registry_.size()
		<< " peers, interval " << interval_.current_interval_seconds() << "s)";
	return status;
}

RegistryStatus ProbeScheduler::Unregister(const std::string& id) {
	absl::MutexLock lock(&mu_);
	EntryHandle removed = registry_.HandleOf(id);
	EntryHandle successor;
	RegistryStatus status = registry_.Unregister(id, &successor);
	if (status != RegistryStatus::kOk) {
		LOG(WARNING) << "Peer " << id << " is not registered";
		return status;
	}
	if (cursor_ == removed) {
		cursor_ = successor;
	}
	interval_.Recompute(registry_.size());
	LOG(INFO) << "Peer " << id << " removed from monitoring.";
	return status;
}

TickOutcome ProbeScheduler::Tick() {
	EntryHandle target;
	std::string peer_id;
	{
		absl::MutexLock lock(&mu_);
		if (!cursor_.valid() && !registry_.empty()) {
			// Start of a new cycle
			cursor_ = registry_.Head();
			interval_.Recompute(registry_.size());
			VLOG(2) << "Starting probe cycle over " << registry_.size() << " peers";
		}
		if (!cursor_.valid()) {
			return TickOutcome::kIdle;
		}
		target = cursor_;
		const PeerEntry* entry = registry_.Get(target);
		CHECK(entry != nullptr) << "Probe cursor references a released registry slot";
		peer_id = entry->id;
	}

	// The peer can drop before its leave notification reaches the registry
	std::optional<PeerHandle> peer = locator_->ResolveLivePeer(peer_id);
	if (!peer.has_value()) {
		VLOG(1) << "Peer " << peer_id << " is no longer connected, skipping";
		absl::MutexLock lock(&mu_);
		AdvancePast(target);
		return TickOutcome::kSkippedStale;
	}

	double send_ts = clock_();
	ProbeResult result = transport_->Probe(*peer);

	if (!result.ok) {
		sink_->OnProbeFailed(peer_id, result.error);
		absl::MutexLock lock(&mu_);
		AdvancePast(target);
		return TickOutcome::kProbeFailed;
	}

	double receive_ts = clock_();
	double latency = receive_ts - send_ts;
	double clock_offset = receive_ts - result.remote_timestamp;

	Observation observation;
	{
		absl::MutexLock lock(&mu_);
		PeerEntry* entry = registry_.Get(target);
		AdvancePast(target);
		if (entry == nullptr) {
			VLOG(1) << "Peer " << peer_id << " left while being probed, dropping sample";
			return TickOutcome::kDiscarded;
		}
		StatsEngine::Update(*entry, latency, clock_offset);

		observation.peer_id = peer_id;
		observation.send_timestamp = send_ts;
		observation.remote_timestamp = result.remote_timestamp;
		observation.receive_timestamp = receive_ts;
		observation.latency = latency;
		observation.avg_latency = entry->avg_latency;
		observation.clock_offset = clock_offset;
		observation.avg_clock_offset = entry->avg_clock_offset;
		observation.sample_count = entry->sample_count;
	}

	sink_->OnObservation(observation);
	return TickOutcome::kProbed;
}

void ProbeScheduler::AdvancePast(EntryHandle probed) {
	if (cursor_ == probed) {
		cursor_ = registry_.Next(probed);
	}
}

double ProbeScheduler::CurrentIntervalSeconds() const {
	absl::MutexLock lock(&mu_);
	return interval_.current_interval_seconds();
}

void ProbeScheduler::SetTotalCycleMs(int64_t total_cycle_ms) {
	absl::MutexLock lock(&mu_);
	interval_.set_total_cycle_ms(total_cycle_ms);
	interval_.Recompute(registry_.size());
}

std::optional<std::string> ProbeScheduler::CursorId() const {
	absl::MutexLock lock(&mu_);
	const PeerEntry* entry = registry_.Get(cursor_);
	if (entry == nullptr) {
		return std::nullopt;
	}
	return entry->id;
}

std::optional<PeerEntry> ProbeScheduler::Lookup(const std::string& id) const {
	absl::MutexLock lock(&mu_);
	const PeerEntry* entry = registry_.Lookup(id);
	if (entry == nullptr) {
		return std::nullopt;
	}
	return *entry;
}

std::vector<PeerEntry> ProbeScheduler::Snapshot() const {
	absl::MutexLock lock(&mu_);
	return registry_.Snapshot();
}

size_t ProbeScheduler::size() const {
	absl::MutexLock lock(&mu_);
	return registry_.size();
}

} // namespace Sonar
