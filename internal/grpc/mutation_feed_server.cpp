#include "mutation_feed_server.hpp"

#include "grpc_error.hpp"

namespace projsync::grpc {

MutationFeedServer::MutationFeedServer(std::shared_ptr<projsync::service::MutationFeedService> svc) : service_(std::move(svc)) {
}

::grpc::Status MutationFeedServer::Apply(::grpc::ServerContext*, const projsync::v1::ApplyRequest* req, projsync::v1::ApplyResponse* resp) {
  try {
    *resp = service_->Apply(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace projsync::grpc
