#include <grpcpp/grpcpp.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "ridedispatch/services/v1/admin_service.grpc.pb.h"
#include "ridedispatch/services/v1/dispatch_service.grpc.pb.h"
#include "ridedispatch/services/v1/driver_service.grpc.pb.h"
#include "ridedispatch/services/v1/ride_service.grpc.pb.h"
#include "ridedispatch/v1.hpp"

using namespace ridedispatch::services::v1;
using ridedispatch::v1::GeoPoint;

static void Usage() {
  std::cout << "Usage:\n"
            << "  dispatchctl <addr> request <rider_id> <pickup_lat> <pickup_lon> <dest_lat> <dest_lon> [surge] "
               "[ride|parcel]\n"
            << "  dispatchctl <addr> broadcast <ride_id> [radius_km]\n"
            << "  dispatchctl <addr> accept <ride_id> <driver_id> <rider_id>\n"
            << "  dispatchctl <addr> reject <ride_id> <driver_id>\n"
            << "  dispatchctl <addr> expand <ride_id> [increment_km]\n"
            << "  dispatchctl <addr> get-broadcast <ride_id>\n"
            << "  dispatchctl <addr> ride <ride_id>\n"
            << "  dispatchctl <addr> arriving <ride_id> <driver_id>\n"
            << "  dispatchctl <addr> start <ride_id> <driver_id>\n"
            << "  dispatchctl <addr> complete <ride_id> <driver_id> <distance_km>\n"
            << "  dispatchctl <addr> cancel <ride_id> <user_id> [reason]\n"
            << "  dispatchctl <addr> driver-cancel <ride_id> <driver_id> [reason]\n"
            << "  dispatchctl <addr> profile <driver_id> <name> [extended] [parcel]\n"
            << "  dispatchctl <addr> available <driver_id> <lat> <lon>\n"
            << "  dispatchctl <addr> offline <driver_id>\n"
            << "  dispatchctl <addr> status <driver_id>\n"
            << "  dispatchctl <addr> watch <user_id>\n"
            << "  dispatchctl <addr> stats\n"
            << "  dispatchctl <addr> lift-suspensions\n";
}

static GeoPoint MakePoint(const char* lat, const char* lon) {
  GeoPoint point;
  point.set_latitude(std::stod(lat));
  point.set_longitude(std::stod(lon));
  return point;
}

static std::optional<ridedispatch::v1::RequestClass> ParseRequestClass(const std::string& value) {
  if (value == "ride") return ridedispatch::v1::REQUEST_CLASS_RIDE;
  if (value == "parcel") return ridedispatch::v1::REQUEST_CLASS_PARCEL;
  return std::nullopt;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

static void PrintRide(const ridedispatch::v1::Ride& ride) {
  std::cout << "ride_id=" << ride.ride_id() << " status=" << ridedispatch::v1::RideStatus_Name(ride.status())
            << " rider=" << ride.rider_id() << " driver=" << ride.driver_id()
            << " estimated_fare=" << ride.estimated_fare() << " final_fare=" << ride.final_fare() << "\n";
}

static void PrintAvailability(const DriverStatusResponse& resp) {
  if (!resp.found()) {
    std::cout << "offline\n";
    return;
  }
  const auto& a = resp.availability();
  std::cout << "driver_id=" << a.driver_id() << " status=" << ridedispatch::v1::DriverStatus_Name(a.status());
  if (a.has_location()) std::cout << " lat=" << a.location().latitude() << " lon=" << a.location().longitude();
  std::cout << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto dispatch_stub = DispatchService::NewStub(channel);
  auto ride_stub     = RideService::NewStub(channel);
  auto driver_stub   = DriverService::NewStub(channel);
  auto admin_stub    = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "request") {
      if (argc < 8) return 1;

      RequestRideRequest req;
      req.set_rider_id(argv[3]);
      *req.mutable_pickup()      = MakePoint(argv[4], argv[5]);
      *req.mutable_destination() = MakePoint(argv[6], argv[7]);
      if (argc >= 9) req.set_surge_multiplier(std::stod(argv[8]));
      if (argc >= 10) {
        auto parsed = ParseRequestClass(argv[9]);
        if (!parsed) {
          std::cerr << "unsupported request class: " << argv[9] << "\n";
          return 1;
        }
        req.set_request_class(*parsed);
      }

      RequestRideResponse resp;
      auto                status = dispatch_stub->RequestRide(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintRide(resp.ride());
      std::cout << "radius_km=" << resp.radius_km() << " notified=" << resp.notified_drivers_size() << "\n";
      for (const auto& driver : resp.notified_drivers()) {
        std::cout << "  " << driver.driver_id() << " " << driver.distance_km() << "km\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "broadcast") {
      if (argc < 4) return 1;

      BroadcastRequest req;
      req.set_ride_id(argv[3]);
      if (argc >= 5) req.set_radius_km(std::stod(argv[4]));

      BroadcastResponse resp;
      auto              status = dispatch_stub->Broadcast(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "radius_km=" << resp.radius_km() << " extended=" << resp.is_extended_area()
                << " notified=" << resp.notified_drivers_size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "accept") {
      if (argc < 6) return 1;

      AcceptRequest req;
      req.set_ride_id(argv[3]);
      req.set_driver_id(argv[4]);
      req.set_rider_id(argv[5]);

      AcceptResponse resp;
      auto           status = dispatch_stub->Accept(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << AcceptOutcome_Name(resp.outcome()) << ": " << resp.message() << "\n";
      if (resp.outcome() == ACCEPT_OUTCOME_WON) {
        std::cout << "distance_km=" << resp.distance_to_pickup_km() << " eta_min=" << resp.estimated_arrival_minutes()
                  << "\n";
      }
      return resp.outcome() == ACCEPT_OUTCOME_WON ? 0 : 3;
    }

    // ------------------------------------------------------------

    if (cmd == "reject") {
      if (argc < 5) return 1;

      RejectRequest req;
      req.set_ride_id(argv[3]);
      req.set_driver_id(argv[4]);

      RejectResponse resp;
      auto           status = dispatch_stub->Reject(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << RejectOutcome_Name(resp.outcome()) << " rejections=" << resp.rejection_count()
                << " remaining=" << resp.remaining_drivers() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "expand") {
      if (argc < 4) return 1;

      ExpandRequest req;
      req.set_ride_id(argv[3]);
      if (argc >= 5) req.set_increment_km(std::stod(argv[4]));

      ExpandResponse resp;
      auto           status = dispatch_stub->Expand(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "radius " << resp.previous_radius_km() << " -> " << resp.new_radius_km()
                << " round=" << resp.broadcast_count() << " new=" << resp.newly_included_driver_ids_size()
                << " total=" << resp.total_notified_drivers() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "get-broadcast") {
      if (argc < 4) return 1;

      GetBroadcastRequest req;
      req.set_ride_id(argv[3]);

      GetBroadcastResponse resp;
      auto                 status = dispatch_stub->GetBroadcast(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      const auto& b = resp.broadcast();
      std::cout << "ride_id=" << b.ride_id() << " status=" << ridedispatch::v1::BroadcastStatus_Name(b.status())
                << " radius_km=" << b.radius_km() << " round=" << b.broadcast_count()
                << " notified=" << b.notified_driver_ids_size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "ride") {
      if (argc < 4) return 1;

      GetRideRequest req;
      req.set_ride_id(argv[3]);

      RideResponse resp;
      auto         status = ride_stub->GetRide(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintRide(resp.ride());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "arriving" || cmd == "start") {
      if (argc < 5) return 1;

      RideResponse resp;
      grpc::Status status;
      if (cmd == "arriving") {
        MarkArrivingRequest req;
        req.set_ride_id(argv[3]);
        req.set_driver_id(argv[4]);
        status = ride_stub->MarkArriving(&ctx, req, &resp);
      } else {
        StartRideRequest req;
        req.set_ride_id(argv[3]);
        req.set_driver_id(argv[4]);
        status = ride_stub->Start(&ctx, req, &resp);
      }
      if (!status.ok()) return Fail(status);

      PrintRide(resp.ride());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "complete") {
      if (argc < 6) return 1;

      CompleteRideRequest req;
      req.set_ride_id(argv[3]);
      req.set_driver_id(argv[4]);
      req.set_actual_distance_km(std::stod(argv[5]));

      RideResponse resp;
      auto         status = ride_stub->Complete(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintRide(resp.ride());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "cancel") {
      if (argc < 5) return 1;

      CancelRideRequest req;
      req.set_ride_id(argv[3]);
      req.set_user_id(argv[4]);
      if (argc >= 6) req.set_reason(argv[5]);

      CancelRideResponse resp;
      auto               status = ride_stub->Cancel(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintRide(resp.ride());
      std::cout << "fee=" << resp.cancellation_fee() << " re_dispatched=" << resp.re_dispatched()
                << " driver_suspended=" << resp.driver_suspended() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "driver-cancel") {
      if (argc < 5) return 1;

      DriverCancelRequest req;
      req.set_ride_id(argv[3]);
      req.set_driver_id(argv[4]);
      if (argc >= 6) req.set_reason(argv[5]);

      DriverCancelResponse resp;
      auto                 status = ride_stub->DriverCancel(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "cancellations=" << resp.cancellation_count() << " suspended=" << resp.suspended()
                << " re_notified=" << resp.notified_drivers_size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "profile") {
      if (argc < 5) return 1;

      UpsertProfileRequest req;
      auto*                profile = req.mutable_profile();
      profile->set_driver_id(argv[3]);
      profile->set_name(argv[4]);
      for (int i = 5; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "extended") {
          profile->set_accept_extended_area(true);
        } else if (flag == "parcel") {
          profile->set_accept_parcel_delivery(true);
        } else {
          std::cerr << "unknown profile flag: " << flag << "\n";
          return 1;
        }
      }

      google::protobuf::Empty resp;
      auto                    status = driver_stub->UpsertProfile(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "ok\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "available") {
      if (argc < 6) return 1;

      SetAvailableRequest req;
      req.set_driver_id(argv[3]);
      *req.mutable_location() = MakePoint(argv[4], argv[5]);

      DriverStatusResponse resp;
      auto                 status = driver_stub->SetAvailable(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintAvailability(resp);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "offline" || cmd == "status") {
      if (argc < 4) return 1;

      DriverIdRequest req;
      req.set_driver_id(argv[3]);

      DriverStatusResponse resp;
      auto status = cmd == "offline" ? driver_stub->SetUnavailable(&ctx, req, &resp)
                                     : driver_stub->GetDriverStatus(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintAvailability(resp);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "watch") {
      if (argc < 4) return 1;

      SubscribeNotificationsRequest req;
      req.set_user_id(argv[3]);

      auto reader = driver_stub->SubscribeNotifications(&ctx, req);

      ridedispatch::v1::DispatchNotification note;
      while (reader->Read(&note)) {
        std::cout << note.type() << " ride_id=" << note.ride_id() << " fare=" << note.estimated_fare()
                  << " distance_km=" << note.distance_to_pickup_km() << " round=" << note.broadcast_round() << "\n";
      }

      auto status = reader->Finish();
      if (!status.ok()) return Fail(status);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      StatsRequest  req;
      StatsResponse resp;

      auto status = admin_stub->Stats(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "rides_requested=" << resp.rides_requested() << "\n"
                << "rides_matched=" << resp.rides_matched() << "\n"
                << "rides_in_progress=" << resp.rides_in_progress() << "\n"
                << "active_broadcasts=" << resp.active_broadcasts() << "\n"
                << "available_drivers=" << resp.available_drivers() << "\n"
                << "suspended_drivers=" << resp.suspended_drivers() << "\n"
                << "notifications_delivered=" << resp.notifications_delivered() << "\n"
                << "notifications_failed=" << resp.notifications_failed() << "\n"
                << "notifications_pending=" << resp.notifications_pending() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "lift-suspensions") {
      LiftSuspensionsRequest  req;
      LiftSuspensionsResponse resp;

      auto status = admin_stub->LiftSuspensions(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& driver_id : resp.driver_ids()) std::cout << driver_id << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    // std::stod on malformed numbers
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
