#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace Sonar {

/// Address of a peer that is currently connected
struct PeerHandle {
	std::string peer_id;
	std::string address;
};

/// Outcome of one probe. On success remote_timestamp holds the peer's clock
/// reading in seconds.
struct ProbeResult {
	bool ok = false;
	double remote_timestamp = 0.0;
	std::string error;

	static ProbeResult Success(double remote_timestamp) {
		ProbeResult r;
		r.ok = true;
		r.remote_timestamp = remote_timestamp;
		return r;
	}

	static ProbeResult Failure(std::string error) {
		ProbeResult r;
		r.error = std::move(error);
		return r;
	}
};

/// One completed probe
struct Observation {
	std::string peer_id;
	double send_timestamp = 0.0;
	double remote_timestamp = 0.0;
	double receive_timestamp = 0.0;
	double latency = 0.0;
	double avg_latency = 0.0;
	double clock_offset = 0.0;
	double avg_clock_offset = 0.0;
	int sample_count = 0;
};

/**
 * Delivers a probe to a peer and returns its clock reading.
 * Called by at most one thread at a time.
 */
class ProbeTransport {
public:
	virtual ~ProbeTransport() = default;

	virtual ProbeResult Probe(const PeerHandle& peer) = 0;
};

/**
 * Tells whether a registered peer is still connected
 */
class PeerLocator {
public:
	virtual ~PeerLocator() = default;

	virtual std::optional<PeerHandle> ResolveLivePeer(const std::string& peer_id) = 0;
};

/**
 * Receives probe results
 */
class ObservationSink {
public:
	virtual ~ObservationSink() = default;

	virtual void OnObservation(const Observation& observation) = 0;
	virtual void OnProbeFailed(const std::string& peer_id, const std::string& error) = 0;
};

/// Seconds. Wall clock so that offsets against peer clocks are meaningful.
using ClockFn = std::function<double()>;

double WallClockSeconds();

} // namespace Sonar
