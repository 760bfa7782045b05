#pragma once

#include <vector>

#include "internal/db/model/broadcast_record.hpp"
#include "internal/db/model/driver_availability_record.hpp"
#include "internal/db/model/driver_profile_record.hpp"
#include "internal/db/model/ride_record.hpp"
#include "internal/dispatch/candidate.hpp"
#include "ridedispatch/v1/types.pb.h"

namespace ridedispatch::service {

/*
  Record <-> wire conversion. Timestamps of 0 become unset fields.
*/

ridedispatch::v1::GeoPoint ToProto(const model::GeoPoint& point);
model::GeoPoint            FromProto(const ridedispatch::v1::GeoPoint& point);

ridedispatch::v1::RideStatus   ToProto(model::RideStatus status);
ridedispatch::v1::DriverStatus ToProto(model::DriverStatus status);
ridedispatch::v1::RequestClass ToProto(model::RequestClass request_class);
model::RequestClass            FromProto(ridedispatch::v1::RequestClass request_class);

ridedispatch::v1::Ride               ToProto(const db::model::RideRecord& ride);
ridedispatch::v1::Broadcast          ToProto(const db::model::BroadcastRecord& broadcast);
ridedispatch::v1::DriverAvailability ToProto(const db::model::DriverAvailabilityRecord& availability);
ridedispatch::v1::DriverProfile      ToProto(const db::model::DriverProfileRecord& profile);

db::model::DriverProfileRecord FromProto(const ridedispatch::v1::DriverProfile& profile);

void AppendNotified(const std::vector<dispatch::NotifiedDriver>&                 drivers,
                    google::protobuf::RepeatedPtrField<ridedispatch::v1::NotifiedDriver>* out);

} // namespace ridedispatch::service
