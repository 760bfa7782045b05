#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/ride_service.hpp"
#include "ridedispatch/services/v1/ride_service.grpc.pb.h"

namespace ridedispatch::grpc {

class RideServer final : public ridedispatch::services::v1::RideService::Service {
 public:
  explicit RideServer(std::shared_ptr<ridedispatch::service::RideService> svc);

  ::grpc::Status GetRide(::grpc::ServerContext*, const ridedispatch::services::v1::GetRideRequest*,
                         ridedispatch::services::v1::RideResponse*) override;

  ::grpc::Status MarkArriving(::grpc::ServerContext*, const ridedispatch::services::v1::MarkArrivingRequest*,
                              ridedispatch::services::v1::RideResponse*) override;

  ::grpc::Status Start(::grpc::ServerContext*, const ridedispatch::services::v1::StartRideRequest*,
                       ridedispatch::services::v1::RideResponse*) override;

  ::grpc::Status Complete(::grpc::ServerContext*, const ridedispatch::services::v1::CompleteRideRequest*,
                          ridedispatch::services::v1::RideResponse*) override;

  ::grpc::Status Cancel(::grpc::ServerContext*, const ridedispatch::services::v1::CancelRideRequest*,
                        ridedispatch::services::v1::CancelRideResponse*) override;

  ::grpc::Status DriverCancel(::grpc::ServerContext*, const ridedispatch::services::v1::DriverCancelRequest*,
                              ridedispatch::services::v1::DriverCancelResponse*) override;

 private:
  std::shared_ptr<ridedispatch::service::RideService> service_;
};

} // namespace ridedispatch::grpc
