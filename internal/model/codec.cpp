#include "codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace projsync::model {

namespace {

google::protobuf::Value ToValue(const ColumnValue& value) {
  google::protobuf::Value out;
  if (const auto* number = std::get_if<double>(&value)) {
    out.set_number_value(*number);
  } else if (const auto* text = std::get_if<std::string>(&value)) {
    out.set_string_value(*text);
  } else if (const auto* flag = std::get_if<bool>(&value)) {
    out.set_bool_value(*flag);
  } else {
    out.set_null_value(google::protobuf::NULL_VALUE);
  }
  return out;
}

ColumnValue FromValue(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      return value.number_value();
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kBoolValue:
      return value.bool_value();
    case google::protobuf::Value::kStructValue:
    case google::protobuf::Value::kListValue:
      throw util::InvalidArgument("nested column values are not supported");
    default:
      return std::monostate{};
  }
}

} // namespace

google::protobuf::Struct ToStruct(const Columns& columns) {
  google::protobuf::Struct out;
  auto&                    fields = *out.mutable_fields();
  for (const auto& [name, value] : columns) {
    fields[name] = ToValue(value);
  }
  return out;
}

Columns FromStruct(const google::protobuf::Struct& value) {
  Columns columns;
  for (const auto& [name, field] : value.fields()) {
    columns.emplace(name, FromValue(field));
  }
  return columns;
}

std::string ColumnsToJson(const Columns& columns) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToStruct(columns), &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode columns: " + std::string(status.message()));
  }
  return json;
}

Columns ColumnsFromJson(const std::string& json) {
  google::protobuf::Struct value;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw std::runtime_error("Failed to decode columns: " + std::string(status.message()));
  }
  return FromStruct(value);
}

projsync::v1::BaseRow ToProto(const BaseRow& row) {
  projsync::v1::BaseRow out;
  out.set_key(row.key);
  *out.mutable_columns() = ToStruct(row.columns);
  return out;
}

BaseRow FromProto(const projsync::v1::BaseRow& row) {
  return BaseRow{row.key(), FromStruct(row.columns())};
}

projsync::v1::DerivedRow ToProto(const DerivedRow& row) {
  projsync::v1::DerivedRow out;
  out.set_key(row.key);
  *out.mutable_derived_attributes() = ToStruct(row.attributes);
  *out.mutable_last_synced_at()     = util::ToProto(row.last_synced_at);
  out.set_version(row.version);
  return out;
}

DerivedRow FromProto(const projsync::v1::DerivedRow& row) {
  DerivedRow out;
  out.key            = row.key();
  out.attributes     = FromStruct(row.derived_attributes());
  out.version        = row.version();
  out.last_synced_at = util::FromProto(row.last_synced_at());
  return out;
}

projsync::v1::MutationEvent ToProto(const MutationEvent& event) {
  projsync::v1::MutationEvent out;
  out.set_sequence(event.sequence);
  if (const auto* insert = std::get_if<InsertChange>(&event.change)) {
    *out.mutable_insert()->mutable_row() = ToProto(insert->row);
  } else if (const auto* update = std::get_if<UpdateChange>(&event.change)) {
    *out.mutable_update()->mutable_old_row() = ToProto(update->old_row);
    *out.mutable_update()->mutable_new_row() = ToProto(update->new_row);
  } else {
    out.mutable_deletion()->set_key(std::get<DeleteChange>(event.change).key);
  }
  return out;
}

MutationEvent FromProto(const projsync::v1::MutationEvent& event) {
  switch (event.change_case()) {
    case projsync::v1::MutationEvent::kInsert:
      return MutationEvent::Insert(event.sequence(), FromProto(event.insert().row()));
    case projsync::v1::MutationEvent::kUpdate: {
      auto old_row = FromProto(event.update().old_row());
      auto new_row = FromProto(event.update().new_row());
      if (old_row.key != new_row.key) {
        throw util::InvalidArgument("update event changes the primary key");
      }
      return MutationEvent::Update(event.sequence(), std::move(old_row), std::move(new_row));
    }
    case projsync::v1::MutationEvent::kDeletion:
      return MutationEvent::Delete(event.sequence(), event.deletion().key());
    default:
      throw util::InvalidArgument("mutation event carries no change");
  }
}

projsync::v1::DriftRecord ToProto(const DriftRecord& record) {
  projsync::v1::DriftRecord out;
  out.set_key(record.key);
  if (record.expected) {
    *out.mutable_expected() = ToStruct(*record.expected);
  }
  if (record.actual) {
    *out.mutable_actual() = ToStruct(*record.actual);
  }
  *out.mutable_detected_at() = util::ToProto(record.detected_at);
  out.set_detail(record.detail);

  switch (record.kind) {
    case DriftKind::kMismatch:
      out.set_kind(projsync::v1::DRIFT_KIND_MISMATCH);
      break;
    case DriftKind::kMissing:
      out.set_kind(projsync::v1::DRIFT_KIND_MISSING);
      break;
    case DriftKind::kOrphan:
      out.set_kind(projsync::v1::DRIFT_KIND_ORPHAN);
      break;
    case DriftKind::kSyncFailed:
      out.set_kind(projsync::v1::DRIFT_KIND_SYNC_FAILED);
      break;
    case DriftKind::kStalenessExceeded:
      out.set_kind(projsync::v1::DRIFT_KIND_STALENESS_EXCEEDED);
      break;
  }
  return out;
}

projsync::v1::SyncState ToProto(SyncState state) {
  switch (state) {
    case SyncState::kAbsent:
      return projsync::v1::SYNC_STATE_ABSENT;
    case SyncState::kPending:
      return projsync::v1::SYNC_STATE_PENDING;
    case SyncState::kConsistent:
      return projsync::v1::SYNC_STATE_CONSISTENT;
    case SyncState::kFailed:
      return projsync::v1::SYNC_STATE_FAILED;
  }
  return projsync::v1::SYNC_STATE_UNSPECIFIED;
}

} // namespace projsync::model
