#include "payloads.hpp"

#include "internal/util/time.hpp"

namespace ridedispatch::notify {

namespace {

void SetPoint(const ridedispatch::model::GeoPoint& in, ridedispatch::v1::GeoPoint* out) {
  out->set_latitude(in.latitude);
  out->set_longitude(in.longitude);
}

ridedispatch::v1::RequestClass ToProto(ridedispatch::model::RequestClass request_class) {
  return request_class == ridedispatch::model::RequestClass::kParcel ? ridedispatch::v1::REQUEST_CLASS_PARCEL
                                                                     : ridedispatch::v1::REQUEST_CLASS_RIDE;
}

} // namespace

OutboundNotification MakeRideRequest(const db::model::BroadcastRecord& broadcast, const std::string& driver_id,
                                     double distance_to_pickup_km, uint64_t now_ms) {
  OutboundNotification out;
  out.user_id = driver_id;

  auto& p = out.payload;
  p.set_type(kRideRequest);
  p.set_ride_id(broadcast.ride_id);
  SetPoint(broadcast.pickup, p.mutable_pickup());
  SetPoint(broadcast.destination, p.mutable_destination());
  p.set_estimated_fare(broadcast.estimated_fare);
  p.set_distance_to_pickup_km(distance_to_pickup_km);
  p.set_is_extended_area(broadcast.is_extended_area);
  p.set_broadcast_round(broadcast.broadcast_count);
  *p.mutable_broadcast_time() = util::MillisToProto(now_ms);
  p.set_request_class(ToProto(broadcast.request_class));
  return out;
}

OutboundNotification MakeRideRequest(const db::model::NotificationRecord& offer) {
  OutboundNotification out;
  out.user_id = offer.driver_id;

  auto& p = out.payload;
  p.set_type(kRideRequest);
  p.set_ride_id(offer.ride_id);
  SetPoint(offer.pickup, p.mutable_pickup());
  SetPoint(offer.destination, p.mutable_destination());
  p.set_estimated_fare(offer.estimated_fare);
  p.set_distance_to_pickup_km(offer.distance_to_pickup_km);
  p.set_is_extended_area(offer.is_extended_area);
  p.set_broadcast_round(offer.broadcast_round);
  *p.mutable_broadcast_time() = util::MillisToProto(offer.notified_at_ms);
  p.set_request_class(ToProto(offer.request_class));
  return out;
}

OutboundNotification MakeRideMatched(const db::model::RideRecord& ride, double distance_to_pickup_km,
                                     uint32_t eta_minutes, uint64_t now_ms) {
  OutboundNotification out;
  out.user_id = ride.rider_id;

  auto& p = out.payload;
  p.set_type(kRideMatched);
  p.set_ride_id(ride.ride_id);
  p.set_driver_id(ride.driver_id);
  SetPoint(ride.pickup, p.mutable_pickup());
  SetPoint(ride.destination, p.mutable_destination());
  p.set_estimated_fare(ride.estimated_fare);
  p.set_distance_to_pickup_km(distance_to_pickup_km);
  p.set_estimated_arrival_minutes(eta_minutes);
  *p.mutable_broadcast_time() = util::MillisToProto(now_ms);
  p.set_request_class(ToProto(ride.request_class));
  return out;
}

OutboundNotification MakeRideCancelled(const db::model::RideRecord& ride, const std::string& recipient,
                                       uint64_t now_ms) {
  OutboundNotification out;
  out.user_id = recipient;

  auto& p = out.payload;
  p.set_type(kRideCancelled);
  p.set_ride_id(ride.ride_id);
  p.set_driver_id(ride.driver_id);
  *p.mutable_broadcast_time() = util::MillisToProto(now_ms);
  p.set_request_class(ToProto(ride.request_class));
  return out;
}

} // namespace ridedispatch::notify
