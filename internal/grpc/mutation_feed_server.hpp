#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "projsync/v1/services.grpc.pb.h"
#include "internal/service/mutation_feed_service.hpp"

namespace projsync::grpc {

class MutationFeedServer final : public projsync::v1::MutationFeedService::Service {
public:
  explicit MutationFeedServer(std::shared_ptr<projsync::service::MutationFeedService> svc);

  ::grpc::Status Apply(::grpc::ServerContext*,
                       const projsync::v1::ApplyRequest*,
                       projsync::v1::ApplyResponse*) override;

private:
  std::shared_ptr<projsync::service::MutationFeedService> service_;
};

}
