#include "client/cpp/projsync_client.h"

#include <arrow/array.h>
#include <arrow/chunked_array.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using projsync::client::ProjsyncClient;

projsync::v1::DerivedRow MakeRow(int64_t key, uint64_t version) {
  projsync::v1::DerivedRow row;
  row.set_key(key);
  row.set_version(version);
  row.mutable_last_synced_at()->set_seconds(1700000000);
  return row;
}

void TestToTableBuildsFixedAndAttributeColumns() {
  auto first = MakeRow(1, 3);
  (*first.mutable_derived_attributes()->mutable_fields())["FreeCores"].set_number_value(2.0);
  auto second = MakeRow(2, 5);
  (*second.mutable_derived_attributes()->mutable_fields())["FreeCores"].set_null_value(google::protobuf::NULL_VALUE);

  auto table = ProjsyncClient::ToTable({first, second});
  assert(table.ok());
  assert((*table)->num_rows() == 2);
  assert((*table)->num_columns() == 4);
  assert((*table)->schema()->field(0)->name() == "key");
  assert((*table)->schema()->field(1)->name() == "version");
  assert((*table)->schema()->field(2)->name() == "last_synced_at");

  auto free_cores = (*table)->GetColumnByName("FreeCores");
  assert(free_cores != nullptr);
  assert(free_cores->type()->id() == arrow::Type::DOUBLE);
  auto values = std::static_pointer_cast<arrow::DoubleArray>(free_cores->chunk(0));
  assert(values->Value(0) == 2.0);
  assert(values->IsNull(1));

  auto keys = std::static_pointer_cast<arrow::Int64Array>((*table)->column(0)->chunk(0));
  assert(keys->Value(1) == 2);
}

void TestToTableRejectsMixedAttributeTypes() {
  auto first = MakeRow(1, 1);
  (*first.mutable_derived_attributes()->mutable_fields())["FreeCores"].set_number_value(2.0);
  auto second = MakeRow(2, 1);
  (*second.mutable_derived_attributes()->mutable_fields())["FreeCores"].set_string_value("two");

  auto table = ProjsyncClient::ToTable({first, second});
  assert(!table.ok());
  assert(table.status().IsTypeError());
}

void TestToTableOfNoRowsHasOnlyFixedColumns() {
  auto table = ProjsyncClient::ToTable({});
  assert(table.ok());
  assert((*table)->num_rows() == 0);
  assert((*table)->num_columns() == 3);
}

void TestHelpersRejectInvalidInputBeforeGrpcCall() {
  auto           channel = grpc::CreateChannel("dns:///127.0.0.1:1", grpc::InsecureChannelCredentials());
  ProjsyncClient client(channel);

  const auto deleted = client.DeleteCluster("");
  assert(!deleted.ok());
  assert(deleted.status().IsInvalid());

  projsync::v1::ScanRequest inverted;
  inverted.set_start_key(10);
  inverted.set_end_key(2);
  const auto scan = client.Scan(inverted);
  assert(!scan.ok());
  assert(scan.status().IsInvalid());

  const auto table = client.ScanTable(10, 2);
  assert(!table.ok());
  assert(table.status().IsInvalid());
}

void TestUnreachableServerIsIOError() {
  auto           channel = grpc::CreateChannel("dns:///127.0.0.1:1", grpc::InsecureChannelCredentials());
  ProjsyncClient client(channel);

  const auto health = client.Health();
  assert(!health.ok());
  assert(health.IsIOError());
}

} // namespace

int main() {
  TestToTableBuildsFixedAndAttributeColumns();
  TestToTableRejectsMixedAttributeTypes();
  TestToTableOfNoRowsHasOnlyFixedColumns();
  TestHelpersRejectInvalidInputBeforeGrpcCall();
  TestUnreachableServerIsIOError();

  std::cout << "projsync_unit_client_projsync_client: pass\n";
  return 0;
}
