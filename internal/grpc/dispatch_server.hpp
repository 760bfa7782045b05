#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/dispatch_service.hpp"
#include "ridedispatch/services/v1/dispatch_service.grpc.pb.h"

namespace ridedispatch::grpc {

class DispatchServer final : public ridedispatch::services::v1::DispatchService::Service {
 public:
  explicit DispatchServer(std::shared_ptr<ridedispatch::service::DispatchService> svc);

  ::grpc::Status RequestRide(::grpc::ServerContext*, const ridedispatch::services::v1::RequestRideRequest*,
                             ridedispatch::services::v1::RequestRideResponse*) override;

  ::grpc::Status Broadcast(::grpc::ServerContext*, const ridedispatch::services::v1::BroadcastRequest*,
                           ridedispatch::services::v1::BroadcastResponse*) override;

  ::grpc::Status Accept(::grpc::ServerContext*, const ridedispatch::services::v1::AcceptRequest*,
                        ridedispatch::services::v1::AcceptResponse*) override;

  ::grpc::Status Reject(::grpc::ServerContext*, const ridedispatch::services::v1::RejectRequest*,
                        ridedispatch::services::v1::RejectResponse*) override;

  ::grpc::Status Expand(::grpc::ServerContext*, const ridedispatch::services::v1::ExpandRequest*,
                        ridedispatch::services::v1::ExpandResponse*) override;

  ::grpc::Status GetBroadcast(::grpc::ServerContext*, const ridedispatch::services::v1::GetBroadcastRequest*,
                              ridedispatch::services::v1::GetBroadcastResponse*) override;

 private:
  std::shared_ptr<ridedispatch::service::DispatchService> service_;
};

} // namespace ridedispatch::grpc
