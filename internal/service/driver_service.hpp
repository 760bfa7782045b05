#pragma once

#include <memory>
#include <vector>

#include "internal/notify/subscription_hub.hpp"
#include "ridedispatch/services/v1/driver_service.pb.h"
#include "service_context.hpp"

namespace ridedispatch::service {

class DriverService {
 public:
  explicit DriverService(ServiceContext ctx);

  ridedispatch::services::v1::DriverStatusResponse SetAvailable(
      const ridedispatch::services::v1::SetAvailableRequest& req);

  ridedispatch::services::v1::DriverStatusResponse SetUnavailable(
      const ridedispatch::services::v1::DriverIdRequest& req);

  ridedispatch::services::v1::DriverStatusResponse SetBusy(const ridedispatch::services::v1::DriverIdRequest& req);

  ridedispatch::services::v1::DriverStatusResponse UpdateLocation(
      const ridedispatch::services::v1::UpdateLocationRequest& req);

  // found=false when the driver has no live availability record.
  ridedispatch::services::v1::DriverStatusResponse GetDriverStatus(
      const ridedispatch::services::v1::DriverIdRequest& req);

  void UpsertProfile(const ridedispatch::services::v1::UpsertProfileRequest& req);

  // Opens a push stream for a user. Offers still pending for a driver are
  // returned in `backlog` so the stream can replay them first.
  std::shared_ptr<notify::Subscription> Subscribe(const std::string&                                  user_id,
                                                  std::vector<ridedispatch::v1::DispatchNotification>* backlog);

  void Unsubscribe(const std::string& user_id, const std::shared_ptr<notify::Subscription>& subscription);

 private:
  ServiceContext ctx_;
};

} // namespace ridedispatch::service
