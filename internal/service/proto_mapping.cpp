#include "proto_mapping.hpp"

#include "internal/util/time.hpp"

namespace ridedispatch::service {

namespace v1 = ridedispatch::v1;

v1::GeoPoint ToProto(const model::GeoPoint& point) {
  v1::GeoPoint out;
  out.set_latitude(point.latitude);
  out.set_longitude(point.longitude);
  return out;
}

model::GeoPoint FromProto(const v1::GeoPoint& point) {
  return {point.latitude(), point.longitude()};
}

v1::RideStatus ToProto(model::RideStatus status) {
  switch (status) {
    case model::RideStatus::kRequested:
      return v1::RIDE_STATUS_REQUESTED;
    case model::RideStatus::kMatched:
      return v1::RIDE_STATUS_MATCHED;
    case model::RideStatus::kDriverArriving:
      return v1::RIDE_STATUS_DRIVER_ARRIVING;
    case model::RideStatus::kInProgress:
      return v1::RIDE_STATUS_IN_PROGRESS;
    case model::RideStatus::kCompleted:
      return v1::RIDE_STATUS_COMPLETED;
    case model::RideStatus::kCancelled:
      return v1::RIDE_STATUS_CANCELLED;
  }
  return v1::RIDE_STATUS_UNSPECIFIED;
}

v1::DriverStatus ToProto(model::DriverStatus status) {
  switch (status) {
    case model::DriverStatus::kAvailable:
      return v1::DRIVER_STATUS_AVAILABLE;
    case model::DriverStatus::kBusy:
      return v1::DRIVER_STATUS_BUSY;
    case model::DriverStatus::kUnavailable:
      return v1::DRIVER_STATUS_UNAVAILABLE;
  }
  return v1::DRIVER_STATUS_UNSPECIFIED;
}

v1::RequestClass ToProto(model::RequestClass request_class) {
  return request_class == model::RequestClass::kParcel ? v1::REQUEST_CLASS_PARCEL : v1::REQUEST_CLASS_RIDE;
}

model::RequestClass FromProto(v1::RequestClass request_class) {
  return request_class == v1::REQUEST_CLASS_PARCEL ? model::RequestClass::kParcel : model::RequestClass::kRide;
}

v1::Ride ToProto(const db::model::RideRecord& ride) {
  v1::Ride out;
  out.set_ride_id(ride.ride_id);
  out.set_rider_id(ride.rider_id);
  out.set_driver_id(ride.driver_id);
  out.set_status(ToProto(ride.status));
  out.set_request_class(ToProto(ride.request_class));
  *out.mutable_pickup()      = ToProto(ride.pickup);
  *out.mutable_destination() = ToProto(ride.destination);
  out.set_estimated_fare(ride.estimated_fare);
  if (ride.final_fare) out.set_final_fare(*ride.final_fare);

  auto* fare = out.mutable_fare_breakdown();
  fare->set_base(ride.fare_breakdown.base);
  fare->set_per_km(ride.fare_breakdown.per_km);
  fare->set_distance_km(ride.fare_breakdown.distance_km);
  fare->set_surge(ride.fare_breakdown.surge);
  fare->set_final_total(ride.fare_breakdown.final_total);

  if (ride.requested_at_ms) *out.mutable_requested_at() = util::MillisToProto(ride.requested_at_ms);
  if (ride.matched_at_ms) *out.mutable_matched_at() = util::MillisToProto(ride.matched_at_ms);
  if (ride.pickup_time_ms) *out.mutable_pickup_time() = util::MillisToProto(ride.pickup_time_ms);
  if (ride.start_time_ms) *out.mutable_start_time() = util::MillisToProto(ride.start_time_ms);
  if (ride.completed_at_ms) *out.mutable_completed_at() = util::MillisToProto(ride.completed_at_ms);
  if (ride.cancellation_timestamp_ms) {
    *out.mutable_cancellation_timestamp() = util::MillisToProto(ride.cancellation_timestamp_ms);
  }

  out.set_cancelled_by(ride.cancelled_by);
  out.set_cancellation_reason(ride.cancellation_reason);
  out.set_cancellation_fee(ride.cancellation_fee);
  out.set_version(ride.version);
  return out;
}

v1::Broadcast ToProto(const db::model::BroadcastRecord& broadcast) {
  v1::Broadcast out;
  out.set_ride_id(broadcast.ride_id);
  out.set_request_class(ToProto(broadcast.request_class));
  *out.mutable_pickup()      = ToProto(broadcast.pickup);
  *out.mutable_destination() = ToProto(broadcast.destination);
  out.set_estimated_fare(broadcast.estimated_fare);
  out.set_radius_km(broadcast.radius_km);
  out.set_is_extended_area(broadcast.is_extended_area);
  for (const auto& id : broadcast.notified_driver_ids) out.add_notified_driver_ids(id);
  for (const auto& id : broadcast.excluded_driver_ids) out.add_excluded_driver_ids(id);
  out.set_status(broadcast.status == model::BroadcastStatus::kActive ? v1::BROADCAST_STATUS_ACTIVE
                                                                     : v1::BROADCAST_STATUS_CANCELLED);
  out.set_broadcast_count(broadcast.broadcast_count);
  *out.mutable_created_at() = util::MillisToProto(broadcast.created_at_ms);
  *out.mutable_expires_at() = util::MillisToProto(broadcast.expires_at_ms);
  return out;
}

v1::DriverAvailability ToProto(const db::model::DriverAvailabilityRecord& availability) {
  v1::DriverAvailability out;
  out.set_driver_id(availability.driver_id);
  out.set_status(ToProto(availability.status));
  if (availability.location) {
    *out.mutable_location() = ToProto(*availability.location);
  }
  *out.mutable_updated_at() = util::MillisToProto(availability.updated_at_ms);
  *out.mutable_expires_at() = util::MillisToProto(availability.expires_at_ms);
  return out;
}

v1::DriverProfile ToProto(const db::model::DriverProfileRecord& profile) {
  v1::DriverProfile out;
  out.set_driver_id(profile.driver_id);
  out.set_name(profile.name);

  auto* vehicle = out.mutable_vehicle();
  vehicle->set_registration_number(profile.vehicle_registration);
  vehicle->set_make(profile.vehicle_make);
  vehicle->set_model(profile.vehicle_model);
  vehicle->set_color(profile.vehicle_color);

  out.set_rating(profile.rating);
  out.set_total_rides(profile.total_rides);
  out.set_accept_extended_area(profile.accept_extended_area);
  out.set_accept_parcel_delivery(profile.accept_parcel_delivery);
  out.set_cancellation_count(profile.cancellation_count);
  out.set_is_suspended(profile.is_suspended);
  out.set_daily_availability_hours(profile.daily_availability_hours);
  return out;
}

db::model::DriverProfileRecord FromProto(const v1::DriverProfile& profile) {
  db::model::DriverProfileRecord out;
  out.driver_id              = profile.driver_id();
  out.name                   = profile.name();
  out.vehicle_registration   = profile.vehicle().registration_number();
  out.vehicle_make           = profile.vehicle().make();
  out.vehicle_model          = profile.vehicle().model();
  out.vehicle_color          = profile.vehicle().color();
  out.rating                 = profile.rating();
  out.total_rides            = profile.total_rides();
  out.accept_extended_area   = profile.accept_extended_area();
  out.accept_parcel_delivery = profile.accept_parcel_delivery();
  return out;
}

void AppendNotified(const std::vector<dispatch::NotifiedDriver>&     drivers,
                    google::protobuf::RepeatedPtrField<v1::NotifiedDriver>* out) {
  for (const auto& driver : drivers) {
    auto* item = out->Add();
    item->set_driver_id(driver.driver_id);
    item->set_distance_km(driver.distance_km);
  }
}

} // namespace ridedispatch::service
