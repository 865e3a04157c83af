#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "projsync/v1/services.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace projsync::grpc {

class AdminServer final : public projsync::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<projsync::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const projsync::v1::StatsRequest*,
                       projsync::v1::StatsResponse*) override;

  ::grpc::Status Health(::grpc::ServerContext*,
                        const projsync::v1::HealthRequest*,
                        projsync::v1::HealthResponse*) override;

  ::grpc::Status Sweep(::grpc::ServerContext*,
                       const projsync::v1::SweepRequest*,
                       projsync::v1::SweepResponse*) override;

  ::grpc::Status ListDrift(::grpc::ServerContext*,
                           const projsync::v1::ListDriftRequest*,
                           projsync::v1::ListDriftResponse*) override;

private:
  std::shared_ptr<projsync::service::AdminService> service_;
};

}
