#include <google/protobuf/util/time_util.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/projsync_client.h"

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  projsync::client::ProjsyncClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // One cluster with two stats; the newer one becomes the base row.
  projsync::v1::ImportRequest request;
  auto*                       cluster = request.add_clusters();
  cluster->mutable_properties()->set_cluster_name("example-cluster");
  cluster->mutable_properties()->set_environment("dev");
  cluster->mutable_properties()->set_region("eu-west-1");

  const auto now = google::protobuf::util::TimeUtil::GetCurrentTime();
  auto*      old_stat = cluster->add_stats();
  *old_stat->mutable_timestamp() = now - google::protobuf::util::TimeUtil::SecondsToDuration(60);
  old_stat->set_free_ghz(2.4);

  auto* new_stat = cluster->add_stats();
  *new_stat->mutable_timestamp() = now;
  new_stat->set_cpu_usage(41.5);
  new_stat->set_free_ghz(4.8);

  auto imported = client.ImportClusters(request);
  if (!imported.ok()) {
    std::cerr << "ImportClusters failed: " << imported.status().ToString() << '\n';
    return 1;
  }
  std::cout << imported->message() << '\n';

  const auto cluster_id = imported->cluster_ids(0);
  auto       row        = client.Get(cluster_id);
  if (!row.ok()) {
    std::cerr << "Get failed: " << row.status().ToString() << '\n';
    return 1;
  }
  if (!row->has_value()) {
    // Asynchronous modes may not have caught up yet.
    std::cout << "cluster " << cluster_id << " has no projection yet\n";
    return 0;
  }

  const auto& fields = (*row)->derived_attributes().fields();
  auto        cores  = fields.find("FreeCores");
  if (cores != fields.end()) {
    std::cout << "cluster " << cluster_id << " FreeCores=" << cores->second.number_value() << '\n';
  }

  // The whole projection as an Arrow table.
  auto table = client.ScanTable(std::nullopt, std::nullopt);
  if (!table.ok()) {
    std::cerr << "ScanTable failed: " << table.status().ToString() << '\n';
    return 1;
  }
  std::cout << (*table)->ToString() << '\n';

  return 0;
}
