#include "dispatch_server.hpp"

#include "grpc_error.hpp"

namespace ridedispatch::grpc {

using namespace ridedispatch::services::v1;

DispatchServer::DispatchServer(std::shared_ptr<ridedispatch::service::DispatchService> svc)
    : service_(std::move(svc)) {
}

::grpc::Status DispatchServer::RequestRide(::grpc::ServerContext*, const RequestRideRequest* req,
                                           RequestRideResponse* resp) {
  try {
    *resp = service_->RequestRide(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::Broadcast(::grpc::ServerContext*, const BroadcastRequest* req,
                                         BroadcastResponse* resp) {
  try {
    *resp = service_->Broadcast(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::Accept(::grpc::ServerContext*, const AcceptRequest* req, AcceptResponse* resp) {
  try {
    *resp = service_->Accept(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::Reject(::grpc::ServerContext*, const RejectRequest* req, RejectResponse* resp) {
  try {
    *resp = service_->Reject(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::Expand(::grpc::ServerContext*, const ExpandRequest* req, ExpandResponse* resp) {
  try {
    *resp = service_->Expand(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::GetBroadcast(::grpc::ServerContext*, const GetBroadcastRequest* req,
                                            GetBroadcastResponse* resp) {
  try {
    *resp = service_->GetBroadcast(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace ridedispatch::grpc
