#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/broadcast_record.hpp"
#include "internal/db/model/notification_record.hpp"
#include "internal/db/model/ride_record.hpp"
#include "notification.hpp"

namespace ridedispatch::notify {

// Offer sent to a candidate driver for one broadcast round.
OutboundNotification MakeRideRequest(const db::model::BroadcastRecord& broadcast, const std::string& driver_id,
                                     double distance_to_pickup_km, uint64_t now_ms);

// Replays a stored offer, e.g. to a driver opening a new stream.
OutboundNotification MakeRideRequest(const db::model::NotificationRecord& offer);

// Sent to the rider once a driver wins arbitration.
OutboundNotification MakeRideMatched(const db::model::RideRecord& ride, double distance_to_pickup_km,
                                     uint32_t eta_minutes, uint64_t now_ms);

OutboundNotification MakeRideCancelled(const db::model::RideRecord& ride, const std::string& recipient,
                                       uint64_t now_ms);

} // namespace ridedispatch::notify
