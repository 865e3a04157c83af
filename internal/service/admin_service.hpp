#pragma once

#include <cstdint>

#include "projsync/v1/services.pb.h"
#include "service_context.hpp"

namespace projsync::service {

class AdminService {
public:
  static constexpr uint32_t kDefaultDriftLimit = 100;

  explicit AdminService(ServiceContext ctx);

  projsync::v1::StatsResponse
  Stats(const projsync::v1::StatsRequest& req);

  // Throws util::StoreUnavailable when the storage layer does not answer.
  projsync::v1::HealthResponse
  Health(const projsync::v1::HealthRequest& req);

  projsync::v1::SweepResponse
  Sweep(const projsync::v1::SweepRequest& req);

  projsync::v1::ListDriftResponse
  ListDrift(const projsync::v1::ListDriftRequest& req);

private:
  ServiceContext ctx_;
};

}
