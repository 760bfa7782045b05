#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "ridedispatch/services/v1/admin_service.grpc.pb.h"

namespace ridedispatch::grpc {

class AdminServer final : public ridedispatch::services::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<ridedispatch::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const ridedispatch::services::v1::StatsRequest*,
                       ridedispatch::services::v1::StatsResponse*) override;

  ::grpc::Status LiftSuspensions(::grpc::ServerContext*, const ridedispatch::services::v1::LiftSuspensionsRequest*,
                                 ridedispatch::services::v1::LiftSuspensionsResponse*) override;

 private:
  std::shared_ptr<ridedispatch::service::AdminService> service_;
};

} // namespace ridedispatch::grpc
