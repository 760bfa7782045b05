#pragma once

#include <chrono>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/driver_service.hpp"
#include "ridedispatch/services/v1/driver_service.grpc.pb.h"

namespace ridedispatch::grpc {

class DriverServer final : public ridedispatch::services::v1::DriverService::Service {
 public:
  explicit DriverServer(std::shared_ptr<ridedispatch::service::DriverService> svc,
                        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(250));

  ::grpc::Status SetAvailable(::grpc::ServerContext*, const ridedispatch::services::v1::SetAvailableRequest*,
                              ridedispatch::services::v1::DriverStatusResponse*) override;

  ::grpc::Status SetUnavailable(::grpc::ServerContext*, const ridedispatch::services::v1::DriverIdRequest*,
                                ridedispatch::services::v1::DriverStatusResponse*) override;

  ::grpc::Status SetBusy(::grpc::ServerContext*, const ridedispatch::services::v1::DriverIdRequest*,
                         ridedispatch::services::v1::DriverStatusResponse*) override;

  ::grpc::Status UpdateLocation(::grpc::ServerContext*, const ridedispatch::services::v1::UpdateLocationRequest*,
                                ridedispatch::services::v1::DriverStatusResponse*) override;

  ::grpc::Status GetDriverStatus(::grpc::ServerContext*, const ridedispatch::services::v1::DriverIdRequest*,
                                 ridedispatch::services::v1::DriverStatusResponse*) override;

  ::grpc::Status UpsertProfile(::grpc::ServerContext*, const ridedispatch::services::v1::UpsertProfileRequest*,
                               google::protobuf::Empty*) override;

  // Replays pending offers, then relays pushes until the client goes away
  // or the hub shuts down.
  ::grpc::Status SubscribeNotifications(::grpc::ServerContext*,
                                        const ridedispatch::services::v1::SubscribeNotificationsRequest*,
                                        ::grpc::ServerWriter<ridedispatch::v1::DispatchNotification>*) override;

 private:
  std::shared_ptr<ridedispatch::service::DriverService> service_;
  std::chrono::milliseconds                             poll_interval_;
};

} // namespace ridedispatch::grpc
