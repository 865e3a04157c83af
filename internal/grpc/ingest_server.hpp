#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "projsync/v1/services.grpc.pb.h"
#include "internal/service/ingest_service.hpp"

namespace projsync::grpc {

class IngestServer final : public projsync::v1::IngestService::Service {
public:
  explicit IngestServer(std::shared_ptr<projsync::service::IngestService> svc);

  ::grpc::Status ImportClusters(::grpc::ServerContext*,
                                const projsync::v1::ImportRequest*,
                                projsync::v1::ImportResponse*) override;

  ::grpc::Status DeleteCluster(::grpc::ServerContext*,
                               const projsync::v1::DeleteClusterRequest*,
                               projsync::v1::DeleteClusterResponse*) override;

private:
  std::shared_ptr<projsync::service::IngestService> service_;
};

}
