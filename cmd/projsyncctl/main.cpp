#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "projsync/v1.hpp"

using namespace projsync::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  projsyncctl <addr> get <key>\n"
            << "  projsyncctl <addr> scan [start_key] [end_key] [limit]\n"
            << "  projsyncctl <addr> import <request.json>\n"
            << "  projsyncctl <addr> delete-cluster <cluster_name>\n"
            << "  projsyncctl <addr> stats\n"
            << "  projsyncctl <addr> health\n"
            << "  projsyncctl <addr> sweep [heal]\n"
            << "  projsyncctl <addr> drift [limit]\n";
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                                json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return json;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto read_stub   = ProjectionReadService::NewStub(channel);
  auto ingest_stub = IngestService::NewStub(channel);
  auto admin_stub  = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetRequest req;
    req.set_key(std::stoll(argv[3]));

    GetResponse resp;

    auto status = read_stub->Get(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.found()) {
      std::cout << "not found\n";
      return 3;
    }
    std::cout << ToJson(resp.row());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "scan") {
    ScanRequest req;
    if (argc >= 4) req.set_start_key(std::stoll(argv[3]));
    if (argc >= 5) req.set_end_key(std::stoll(argv[4]));
    if (argc >= 6) req.set_limit(static_cast<uint32_t>(std::stoul(argv[5])));

    ScanResponse resp;

    auto status = read_stub->Scan(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "import") {
    if (argc < 4) return 1;

    std::ifstream in(argv[3]);
    if (!in) {
      std::cerr << "cannot open " << argv[3] << "\n";
      return 1;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    ImportRequest req;
    auto          parsed = google::protobuf::util::JsonStringToMessage(buffer.str(), &req);
    if (!parsed.ok()) {
      std::cerr << "invalid import request: " << parsed.message() << "\n";
      return 1;
    }

    ImportResponse resp;

    auto status = ingest_stub->ImportClusters(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.message() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-cluster") {
    if (argc < 4) return 1;

    DeleteClusterRequest req;
    req.set_cluster_name(argv[3]);

    DeleteClusterResponse resp;

    auto status = ingest_stub->DeleteCluster(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted cluster_id=" << resp.cluster_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    HealthRequest  req;
    HealthResponse resp;

    auto status = admin_stub->Health(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.status() << " database=" << resp.database() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sweep") {
    SweepRequest req;
    if (argc >= 4 && std::string(argv[3]) == "heal") req.set_self_heal(true);

    SweepResponse resp;

    auto status = admin_stub->Sweep(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "drift") {
    ListDriftRequest req;
    if (argc >= 4) req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));

    ListDriftResponse resp;

    auto status = admin_stub->ListDrift(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << ToJson(resp);
    return 0;
  }

  Usage();
  return 1;
}
