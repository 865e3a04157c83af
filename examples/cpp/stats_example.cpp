#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/projsync_client.h"

int main(int argc, char** argv) {
  // Allow optional endpoint override for local/remote diagnostics.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";

  projsync::client::ProjsyncClient client(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));

  // Stats returns per-state key counts of the synchronizer.
  auto result = client.Stats();
  if (!result.ok()) {
    std::cerr << "Stats RPC failed: " << result.status().ToString() << '\n';
    return 1;
  }

  const auto& stats = result.ValueOrDie();
  std::cout << "projsync stats for " << target << " (mode " << stats.mode() << ")\n";
  std::cout << "keys: consistent=" << stats.keys_consistent() << ", pending=" << stats.keys_pending() << ", failed=" << stats.keys_failed()
            << ", absent=" << stats.keys_absent() << '\n';
  std::cout << "events: applied=" << stats.events_applied() << ", skipped=" << stats.events_skipped() << ", discarded=" << stats.events_discarded()
            << '\n';
  std::cout << "drift records: " << stats.drift_records() << '\n';

  return 0;
}
