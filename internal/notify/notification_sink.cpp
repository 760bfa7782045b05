#include "notification_sink.hpp"

#include "internal/observability/logging.hpp"

namespace ridedispatch::notify {

bool LoggingSink::Push(const std::string& user_id, const ridedispatch::v1::DispatchNotification& payload) {
  RIDEDISPATCH_LOG_INFO("push", {observability::StringField("user_id", user_id),
                                 observability::StringField("type", payload.type()),
                                 observability::StringField("ride_id", payload.ride_id()),
                                 observability::IntField("round", payload.broadcast_round())});
  return true;
}

} // namespace ridedispatch::notify
