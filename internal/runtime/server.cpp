#include "server.hpp"

#include <stdexcept>

#include "internal/factory.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/mutation_feed_server.hpp"
#include "internal/grpc/read_server.hpp"
#include "internal/observability/logging.hpp"

namespace projsync::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  PROJSYNC_LOG_INFO("projsync listening", {observability::StringField("bind_address", bind_address_),
                                           observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

std::vector<std::unique_ptr<::grpc::Service>> BuildGrpcServices(const projsync::factory::Application& app) {
  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<projsync::grpc::ReadServer>(app.read_service));
  services.push_back(std::make_unique<projsync::grpc::MutationFeedServer>(app.feed_service));
  services.push_back(std::make_unique<projsync::grpc::IngestServer>(app.ingest_service));
  services.push_back(std::make_unique<projsync::grpc::AdminServer>(app.admin_service));
  return services;
}

} // namespace projsync::runtime
