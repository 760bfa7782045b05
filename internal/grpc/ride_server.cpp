#include "ride_server.hpp"

#include "grpc_error.hpp"

namespace ridedispatch::grpc {

using namespace ridedispatch::services::v1;

RideServer::RideServer(std::shared_ptr<ridedispatch::service::RideService> svc) : service_(std::move(svc)) {
}

::grpc::Status RideServer::GetRide(::grpc::ServerContext*, const GetRideRequest* req, RideResponse* resp) {
  try {
    *resp = service_->GetRide(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::MarkArriving(::grpc::ServerContext*, const MarkArrivingRequest* req, RideResponse* resp) {
  try {
    *resp = service_->MarkArriving(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::Start(::grpc::ServerContext*, const StartRideRequest* req, RideResponse* resp) {
  try {
    *resp = service_->Start(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::Complete(::grpc::ServerContext*, const CompleteRideRequest* req, RideResponse* resp) {
  try {
    *resp = service_->Complete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::Cancel(::grpc::ServerContext*, const CancelRideRequest* req, CancelRideResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RideServer::DriverCancel(::grpc::ServerContext*, const DriverCancelRequest* req,
                                        DriverCancelResponse* resp) {
  try {
    *resp = service_->DriverCancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace ridedispatch::grpc
