#pragma once

#include "ridedispatch/services/v1/ride_service.pb.h"
#include "service_context.hpp"

namespace ridedispatch::service {

/*
  Ride lifecycle RPCs. Lifecycle outcomes other than success surface as
  errors: NotFound, PermissionDenied for a non-participant, InvalidState for
  a forbidden transition and InvalidArgument for bad input.
*/
class RideService {
 public:
  explicit RideService(ServiceContext ctx);

  ridedispatch::services::v1::RideResponse GetRide(const ridedispatch::services::v1::GetRideRequest& req);
  ridedispatch::services::v1::RideResponse MarkArriving(const ridedispatch::services::v1::MarkArrivingRequest& req);
  ridedispatch::services::v1::RideResponse Start(const ridedispatch::services::v1::StartRideRequest& req);
  ridedispatch::services::v1::RideResponse Complete(const ridedispatch::services::v1::CompleteRideRequest& req);

  ridedispatch::services::v1::CancelRideResponse Cancel(const ridedispatch::services::v1::CancelRideRequest& req);

  ridedispatch::services::v1::DriverCancelResponse DriverCancel(
      const ridedispatch::services::v1::DriverCancelRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace ridedispatch::service
