#pragma once

#include <cstdint>

#include "projsync/v1/services.pb.h"
#include "service_context.hpp"

namespace projsync::service {

/*
  Point and range reads straight from the projection store. Reads see the
  last committed projection and never wait on synchronization.
*/
class ReadService {
public:
  static constexpr uint32_t kDefaultScanLimit = 100;
  static constexpr uint32_t kMaxScanLimit     = 1000;

  explicit ReadService(ServiceContext ctx);

  projsync::v1::GetResponse Get(const projsync::v1::GetRequest& req);
  projsync::v1::ScanResponse Scan(const projsync::v1::ScanRequest& req);

private:
  ServiceContext ctx_;
};

}
