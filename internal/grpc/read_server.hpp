#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "projsync/v1/services.grpc.pb.h"
#include "internal/service/read_service.hpp"

namespace projsync::grpc {

class ReadServer final : public projsync::v1::ProjectionReadService::Service {
public:
  explicit ReadServer(std::shared_ptr<projsync::service::ReadService> svc);

  ::grpc::Status Get(::grpc::ServerContext*,
                     const projsync::v1::GetRequest*,
                     projsync::v1::GetResponse*) override;

  ::grpc::Status Scan(::grpc::ServerContext*,
                      const projsync::v1::ScanRequest*,
                      projsync::v1::ScanResponse*) override;

private:
  std::shared_ptr<projsync::service::ReadService> service_;
};

}
