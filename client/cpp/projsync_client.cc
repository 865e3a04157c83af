#include "client/cpp/projsync_client.h"

#include <map>
#include <set>
#include <string_view>

#include <arrow/builder.h>
#include <arrow/status.h>
#include <arrow/type.h>
#include <google/protobuf/util/time_util.h>
#include <grpcpp/client_context.h>

namespace projsync::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }
  switch (status.error_code()) {
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

enum class AttributeType { kUnknown, kDouble, kString, kBool };

AttributeType TypeOf(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      return AttributeType::kDouble;
    case google::protobuf::Value::kStringValue:
      return AttributeType::kString;
    case google::protobuf::Value::kBoolValue:
      return AttributeType::kBool;
    default:
      return AttributeType::kUnknown;
  }
}

arrow::Result<std::shared_ptr<arrow::Array>> BuildAttributeColumn(const std::vector<projsync::v1::DerivedRow>& rows, const std::string& name,
                                                                  AttributeType type) {
  auto value_of = [&](const projsync::v1::DerivedRow& row) -> const google::protobuf::Value* {
    const auto& fields = row.derived_attributes().fields();
    auto        it     = fields.find(name);
    if (it == fields.end() || TypeOf(it->second) == AttributeType::kUnknown) return nullptr;
    return &it->second;
  };

  switch (type) {
    case AttributeType::kString: {
      arrow::StringBuilder builder;
      for (const auto& row : rows) {
        const auto* value = value_of(row);
        ARROW_RETURN_NOT_OK(value ? builder.Append(value->string_value()) : builder.AppendNull());
      }
      return builder.Finish();
    }
    case AttributeType::kBool: {
      arrow::BooleanBuilder builder;
      for (const auto& row : rows) {
        const auto* value = value_of(row);
        ARROW_RETURN_NOT_OK(value ? builder.Append(value->bool_value()) : builder.AppendNull());
      }
      return builder.Finish();
    }
    case AttributeType::kDouble:
    case AttributeType::kUnknown: {
      arrow::DoubleBuilder builder;
      for (const auto& row : rows) {
        const auto* value = value_of(row);
        ARROW_RETURN_NOT_OK(value ? builder.Append(value->number_value()) : builder.AppendNull());
      }
      return builder.Finish();
    }
  }
  return arrow::Status::Invalid("unknown attribute type for ", name);
}

} // namespace

ProjsyncClient::ProjsyncClient(std::shared_ptr<grpc::Channel> channel)
    : read_stub_(projsync::v1::ProjectionReadService::NewStub(channel)),
      feed_stub_(projsync::v1::MutationFeedService::NewStub(channel)),
      ingest_stub_(projsync::v1::IngestService::NewStub(channel)),
      admin_stub_(projsync::v1::AdminService::NewStub(channel)) {}

arrow::Result<std::optional<projsync::v1::DerivedRow>> ProjsyncClient::Get(int64_t key) const {
  projsync::v1::GetRequest request;
  request.set_key(key);

  grpc::ClientContext       ctx;
  projsync::v1::GetResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(read_stub_->Get(&ctx, request, &response), "Get"));

  if (!response.found()) return std::optional<projsync::v1::DerivedRow>{};
  return std::optional<projsync::v1::DerivedRow>{response.row()};
}

arrow::Result<projsync::v1::ScanResponse> ProjsyncClient::Scan(const projsync::v1::ScanRequest& request) const {
  if (request.has_start_key() && request.has_end_key() && request.start_key() > request.end_key()) {
    return arrow::Status::Invalid("Scan: start_key must not exceed end_key");
  }

  grpc::ClientContext        ctx;
  projsync::v1::ScanResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(read_stub_->Scan(&ctx, request, &response), "Scan"));
  return response;
}

arrow::Result<std::vector<projsync::v1::DerivedRow>> ProjsyncClient::ScanAll(std::optional<int64_t> start_key, std::optional<int64_t> end_key,
                                                                             uint32_t page_size) const {
  projsync::v1::ScanRequest request;
  if (start_key) request.set_start_key(*start_key);
  if (end_key) request.set_end_key(*end_key);
  request.set_limit(page_size);

  std::vector<projsync::v1::DerivedRow> rows;
  for (;;) {
    ARROW_ASSIGN_OR_RAISE(auto page, Scan(request));
    for (auto& row : *page.mutable_rows()) rows.push_back(std::move(row));
    if (!page.has_next_cursor()) break;
    request.set_cursor(page.next_cursor());
  }
  return rows;
}

arrow::Result<std::shared_ptr<arrow::Table>> ProjsyncClient::ScanTable(std::optional<int64_t> start_key, std::optional<int64_t> end_key,
                                                                       uint32_t page_size) const {
  ARROW_ASSIGN_OR_RAISE(auto rows, ScanAll(start_key, end_key, page_size));
  return ToTable(rows);
}

arrow::Result<std::shared_ptr<arrow::Table>> ProjsyncClient::ToTable(const std::vector<projsync::v1::DerivedRow>& rows) {
  std::map<std::string, AttributeType> attribute_types;
  for (const auto& row : rows) {
    for (const auto& [name, value] : row.derived_attributes().fields()) {
      const auto type = TypeOf(value);
      auto&      seen = attribute_types[name];
      if (type == AttributeType::kUnknown) continue;
      if (seen != AttributeType::kUnknown && seen != type) {
        return arrow::Status::TypeError("attribute '", name, "' mixes value types");
      }
      seen = type;
    }
  }

  arrow::Int64Builder     keys;
  arrow::UInt64Builder    versions;
  arrow::TimestampBuilder synced(arrow::timestamp(arrow::TimeUnit::MILLI), arrow::default_memory_pool());
  for (const auto& row : rows) {
    ARROW_RETURN_NOT_OK(keys.Append(row.key()));
    ARROW_RETURN_NOT_OK(versions.Append(row.version()));
    ARROW_RETURN_NOT_OK(synced.Append(google::protobuf::util::TimeUtil::TimestampToMilliseconds(row.last_synced_at())));
  }

  std::vector<std::shared_ptr<arrow::Field>> fields = {
      arrow::field("key", arrow::int64(), false),
      arrow::field("version", arrow::uint64(), false),
      arrow::field("last_synced_at", arrow::timestamp(arrow::TimeUnit::MILLI), false),
  };
  std::vector<std::shared_ptr<arrow::Array>> columns;
  ARROW_ASSIGN_OR_RAISE(auto key_array, keys.Finish());
  ARROW_ASSIGN_OR_RAISE(auto version_array, versions.Finish());
  ARROW_ASSIGN_OR_RAISE(auto synced_array, synced.Finish());
  columns.push_back(std::move(key_array));
  columns.push_back(std::move(version_array));
  columns.push_back(std::move(synced_array));

  for (const auto& [name, type] : attribute_types) {
    ARROW_ASSIGN_OR_RAISE(auto column, BuildAttributeColumn(rows, name, type));
    fields.push_back(arrow::field(name, column->type()));
    columns.push_back(std::move(column));
  }

  return arrow::Table::Make(arrow::schema(std::move(fields)), std::move(columns), static_cast<int64_t>(rows.size()));
}

arrow::Result<projsync::v1::ApplyResponse> ProjsyncClient::Apply(const projsync::v1::ApplyRequest& request) const {
  grpc::ClientContext         ctx;
  projsync::v1::ApplyResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(feed_stub_->Apply(&ctx, request, &response), "Apply"));
  return response;
}

arrow::Result<projsync::v1::ImportResponse> ProjsyncClient::ImportClusters(const projsync::v1::ImportRequest& request) const {
  grpc::ClientContext          ctx;
  projsync::v1::ImportResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->ImportClusters(&ctx, request, &response), "ImportClusters"));
  return response;
}

arrow::Result<int64_t> ProjsyncClient::DeleteCluster(const std::string& cluster_name) const {
  if (cluster_name.empty()) {
    return arrow::Status::Invalid("DeleteCluster: cluster_name is required");
  }

  projsync::v1::DeleteClusterRequest request;
  request.set_cluster_name(cluster_name);

  grpc::ClientContext                 ctx;
  projsync::v1::DeleteClusterResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(ingest_stub_->DeleteCluster(&ctx, request, &response), "DeleteCluster"));
  return response.cluster_id();
}

arrow::Result<projsync::v1::StatsResponse> ProjsyncClient::Stats() const {
  grpc::ClientContext         ctx;
  projsync::v1::StatsResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->Stats(&ctx, projsync::v1::StatsRequest{}, &response), "Stats"));
  return response;
}

arrow::Status ProjsyncClient::Health() const {
  grpc::ClientContext          ctx;
  projsync::v1::HealthResponse response;
  return GrpcToArrow(admin_stub_->Health(&ctx, projsync::v1::HealthRequest{}, &response), "Health");
}

arrow::Result<projsync::v1::SweepResponse> ProjsyncClient::Sweep(std::optional<bool> self_heal, uint32_t batch_size) const {
  projsync::v1::SweepRequest request;
  if (self_heal) request.set_self_heal(*self_heal);
  request.set_batch_size(batch_size);

  grpc::ClientContext         ctx;
  projsync::v1::SweepResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->Sweep(&ctx, request, &response), "Sweep"));
  return response;
}

arrow::Result<projsync::v1::ListDriftResponse> ProjsyncClient::ListDrift(uint32_t limit) const {
  projsync::v1::ListDriftRequest request;
  request.set_limit(limit);

  grpc::ClientContext             ctx;
  projsync::v1::ListDriftResponse response;
  ARROW_RETURN_NOT_OK(GrpcToArrow(admin_stub_->ListDrift(&ctx, request, &response), "ListDrift"));
  return response;
}

} // namespace projsync::client
