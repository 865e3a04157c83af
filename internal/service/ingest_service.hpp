#pragma once

#include "projsync/v1/services.pb.h"
#include "service_context.hpp"

namespace projsync::service {

class IngestService {
public:
  explicit IngestService(ServiceContext ctx);

  projsync::v1::ImportResponse ImportClusters(const projsync::v1::ImportRequest& req);

  projsync::v1::DeleteClusterResponse DeleteCluster(const projsync::v1::DeleteClusterRequest& req);

private:
  ServiceContext ctx_;
};

}
