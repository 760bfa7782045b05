#pragma once

#include "ridedispatch/services/v1/dispatch_service.pb.h"
#include "service_context.hpp"

namespace ridedispatch::service {

class DispatchService {
 public:
  explicit DispatchService(ServiceContext ctx);

  ridedispatch::services::v1::RequestRideResponse RequestRide(const ridedispatch::services::v1::RequestRideRequest& req);

  ridedispatch::services::v1::BroadcastResponse Broadcast(const ridedispatch::services::v1::BroadcastRequest& req);

  // Every arbitration outcome is reported in the response, not as an error.
  ridedispatch::services::v1::AcceptResponse Accept(const ridedispatch::services::v1::AcceptRequest& req);

  ridedispatch::services::v1::RejectResponse Reject(const ridedispatch::services::v1::RejectRequest& req);

  ridedispatch::services::v1::ExpandResponse Expand(const ridedispatch::services::v1::ExpandRequest& req);

  ridedispatch::services::v1::GetBroadcastResponse GetBroadcast(
      const ridedispatch::services::v1::GetBroadcastRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace ridedispatch::service
