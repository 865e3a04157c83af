#include "ingest_server.hpp"

#include "grpc_error.hpp"

namespace projsync::grpc {

IngestServer::IngestServer(std::shared_ptr<projsync::service::IngestService> svc) : service_(std::move(svc)) {
}

::grpc::Status IngestServer::ImportClusters(::grpc::ServerContext*, const projsync::v1::ImportRequest* req, projsync::v1::ImportResponse* resp) {
  try {
    *resp = service_->ImportClusters(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::DeleteCluster(::grpc::ServerContext*, const projsync::v1::DeleteClusterRequest* req,
                                           projsync::v1::DeleteClusterResponse* resp) {
  try {
    *resp = service_->DeleteCluster(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace projsync::grpc
