#include "peer_clock_service.h"

#include <utility>

#include <glog/logging.h>

namespace Sonar {

PeerClockServiceImpl::PeerClockServiceImpl(std::string peer_id, ClockFn clock)
	: peer_id_(std::move(peer_id)), clock_(std::move(clock)) {}

grpc::Status PeerClockServiceImpl::ReadClock(grpc::ServerContext* context,
		const sonar_rpc::ClockRequest* request,
		sonar_rpc::ClockReading* reply) {
	if (!request->peer_id().empty() && request->peer_id() != peer_id_) {
		LOG(WARNING) << "Clock probe for peer " << request->peer_id()
			<< " reached peer " << peer_id_;
		return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION,
				"this clock belongs to peer " + peer_id_);
	}
	reply->set_timestamp(clock_());
	reads_++;
	VLOG(3) << "Answered clock probe #" << reads_;
	return grpc::Status::OK;
}

} // namespace Sonar
