#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace projsync::grpc {

AdminServer::AdminServer(std::shared_ptr<projsync::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const projsync::v1::StatsRequest* req, projsync::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Health(::grpc::ServerContext*, const projsync::v1::HealthRequest* req, projsync::v1::HealthResponse* resp) {
  try {
    *resp = service_->Health(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Sweep(::grpc::ServerContext*, const projsync::v1::SweepRequest* req, projsync::v1::SweepResponse* resp) {
  try {
    *resp = service_->Sweep(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListDrift(::grpc::ServerContext*, const projsync::v1::ListDriftRequest* req, projsync::v1::ListDriftResponse* resp) {
  try {
    *resp = service_->ListDrift(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace projsync::grpc
