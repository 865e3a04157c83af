#include "ingest_service.hpp"

#include <string>
#include <vector>

#include "internal/core/cluster_importer.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace projsync::service {

using namespace projsync::v1;

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ImportResponse IngestService::ImportClusters(const ImportRequest& req) {
  return ObserveRpc("IngestService.ImportClusters", std::nullopt, [&] {
    if (req.clusters_size() == 0) {
      throw projsync::util::InvalidArgument("import: at least one cluster is required");
    }

    const std::vector<ClusterData> clusters(req.clusters().begin(), req.clusters().end());
    const auto                     result = ctx_.importer->Import(clusters);

    ImportResponse resp;
    resp.set_status("success");
    resp.set_message("Imported " + std::to_string(clusters.size()) + " clusters with their stats");
    for (auto id : result.cluster_ids) resp.add_cluster_ids(id);
    resp.set_stats_written(result.stats_written);
    return resp;
  });
}

DeleteClusterResponse IngestService::DeleteCluster(const DeleteClusterRequest& req) {
  return ObserveRpc("IngestService.DeleteCluster", std::nullopt, [&] {
    DeleteClusterResponse resp;
    resp.set_cluster_id(ctx_.importer->DeleteCluster(req.cluster_name()));
    return resp;
  });
}

} // namespace projsync::service
