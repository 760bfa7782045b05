#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace ridedispatch::grpc {

using namespace ridedispatch::services::v1;

AdminServer::AdminServer(std::shared_ptr<ridedispatch::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::LiftSuspensions(::grpc::ServerContext*, const LiftSuspensionsRequest* req,
                                            LiftSuspensionsResponse* resp) {
  try {
    *resp = service_->LiftSuspensions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace ridedispatch::grpc
