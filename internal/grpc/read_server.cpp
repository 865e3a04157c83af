#include "read_server.hpp"

#include "grpc_error.hpp"

namespace projsync::grpc {

ReadServer::ReadServer(std::shared_ptr<projsync::service::ReadService> svc) : service_(std::move(svc)) {
}

::grpc::Status ReadServer::Get(::grpc::ServerContext*, const projsync::v1::GetRequest* req, projsync::v1::GetResponse* resp) {
  try {
    *resp = service_->Get(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ReadServer::Scan(::grpc::ServerContext*, const projsync::v1::ScanRequest* req, projsync::v1::ScanResponse* resp) {
  try {
    *resp = service_->Scan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace projsync::grpc
