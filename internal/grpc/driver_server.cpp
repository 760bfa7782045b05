#include "driver_server.hpp"

#include "grpc_error.hpp"

namespace ridedispatch::grpc {

using namespace ridedispatch::services::v1;

DriverServer::DriverServer(std::shared_ptr<ridedispatch::service::DriverService> svc,
                           std::chrono::milliseconds                             poll_interval)
    : service_(std::move(svc)), poll_interval_(poll_interval) {
}

::grpc::Status DriverServer::SetAvailable(::grpc::ServerContext*, const SetAvailableRequest* req,
                                          DriverStatusResponse* resp) {
  try {
    *resp = service_->SetAvailable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::SetUnavailable(::grpc::ServerContext*, const DriverIdRequest* req,
                                            DriverStatusResponse* resp) {
  try {
    *resp = service_->SetUnavailable(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::SetBusy(::grpc::ServerContext*, const DriverIdRequest* req, DriverStatusResponse* resp) {
  try {
    *resp = service_->SetBusy(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::UpdateLocation(::grpc::ServerContext*, const UpdateLocationRequest* req,
                                            DriverStatusResponse* resp) {
  try {
    *resp = service_->UpdateLocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::GetDriverStatus(::grpc::ServerContext*, const DriverIdRequest* req,
                                             DriverStatusResponse* resp) {
  try {
    *resp = service_->GetDriverStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::UpsertProfile(::grpc::ServerContext*, const UpsertProfileRequest* req,
                                           google::protobuf::Empty*) {
  try {
    service_->UpsertProfile(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DriverServer::SubscribeNotifications(::grpc::ServerContext*                       context,
                                                    const SubscribeNotificationsRequest*         req,
                                                    ::grpc::ServerWriter<ridedispatch::v1::DispatchNotification>* writer) {
  std::shared_ptr<notify::Subscription> subscription;
  try {
    std::vector<ridedispatch::v1::DispatchNotification> backlog;
    subscription = service_->Subscribe(req->user_id(), &backlog);

    for (const auto& payload : backlog) {
      if (!writer->Write(payload)) {
        service_->Unsubscribe(req->user_id(), subscription);
        return ::grpc::Status::OK;
      }
    }

    while (!context->IsCancelled()) {
      auto next = subscription->Next(poll_interval_);
      if (!next) {
        if (subscription->Closed()) break;
        continue;
      }
      if (!writer->Write(*next)) break;
    }

    service_->Unsubscribe(req->user_id(), subscription);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    if (subscription) service_->Unsubscribe(req->user_id(), subscription);
    return ToStatus(e);
  }
}

} // namespace ridedispatch::grpc
