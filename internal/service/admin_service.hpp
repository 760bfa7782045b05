#pragma once

#include "ridedispatch/services/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace ridedispatch::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  ridedispatch::services::v1::StatsResponse Stats(const ridedispatch::services::v1::StatsRequest& req);

  ridedispatch::services::v1::LiftSuspensionsResponse LiftSuspensions(
      const ridedispatch::services::v1::LiftSuspensionsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace ridedispatch::service
