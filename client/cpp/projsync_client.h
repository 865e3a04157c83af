#pragma once

#include <arrow/result.h>
#include <arrow/table.h>
#include <grpcpp/channel.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "projsync/v1.hpp"

namespace projsync::client {

class ProjsyncClient {
 public:
  explicit ProjsyncClient(std::shared_ptr<grpc::Channel> channel);

  // Empty when the key has no projection row.
  arrow::Result<std::optional<projsync::v1::DerivedRow>> Get(int64_t key) const;

  arrow::Result<projsync::v1::ScanResponse> Scan(const projsync::v1::ScanRequest& request) const;

  // Follows next_cursor until the range is exhausted.
  arrow::Result<std::vector<projsync::v1::DerivedRow>> ScanAll(std::optional<int64_t> start_key, std::optional<int64_t> end_key,
                                                               uint32_t page_size = 256) const;

  /*
    Range as a table: key, version, last_synced_at, then one column per
    derived attribute. Attribute columns are double, utf8 or bool by the
    first non-null value; a column whose values disagree on type is an
    error.
  */
  arrow::Result<std::shared_ptr<arrow::Table>> ScanTable(std::optional<int64_t> start_key, std::optional<int64_t> end_key,
                                                         uint32_t page_size = 256) const;

  arrow::Result<projsync::v1::ApplyResponse> Apply(const projsync::v1::ApplyRequest& request) const;

  arrow::Result<projsync::v1::ImportResponse> ImportClusters(const projsync::v1::ImportRequest& request) const;

  arrow::Result<int64_t> DeleteCluster(const std::string& cluster_name) const;

  arrow::Result<projsync::v1::StatsResponse> Stats() const;

  arrow::Status Health() const;

  arrow::Result<projsync::v1::SweepResponse> Sweep(std::optional<bool> self_heal = std::nullopt, uint32_t batch_size = 0) const;

  arrow::Result<projsync::v1::ListDriftResponse> ListDrift(uint32_t limit = 0) const;

  // Exposed for callers that already hold rows.
  static arrow::Result<std::shared_ptr<arrow::Table>> ToTable(const std::vector<projsync::v1::DerivedRow>& rows);

 private:
  std::unique_ptr<projsync::v1::ProjectionReadService::Stub> read_stub_;
  std::unique_ptr<projsync::v1::MutationFeedService::Stub>   feed_stub_;
  std::unique_ptr<projsync::v1::IngestService::Stub>         ingest_stub_;
  std::unique_ptr<projsync::v1::AdminService::Stub>          admin_stub_;
};

} // namespace projsync::client
