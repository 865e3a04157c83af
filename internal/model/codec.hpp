#pragma once

#include <string>

#include "google/protobuf/struct.pb.h"
#include "internal/model/drift_record.hpp"
#include "internal/model/mutation_event.hpp"
#include "internal/model/row.hpp"
#include "internal/model/sync_state.hpp"
#include "projsync/v1/types.pb.h"

namespace projsync::model {

/*
  Conversions between the engine's row types and their protobuf forms.

  Columns are stored as JSON text of a google.protobuf.Struct so every
  backend keeps the same encoding.
*/

google::protobuf::Struct ToStruct(const Columns& columns);
Columns                  FromStruct(const google::protobuf::Struct& value);

std::string ColumnsToJson(const Columns& columns);
// Throws std::runtime_error on malformed JSON.
Columns ColumnsFromJson(const std::string& json);

projsync::v1::BaseRow ToProto(const BaseRow& row);
BaseRow               FromProto(const projsync::v1::BaseRow& row);

projsync::v1::DerivedRow ToProto(const DerivedRow& row);
DerivedRow               FromProto(const projsync::v1::DerivedRow& row);

projsync::v1::MutationEvent ToProto(const MutationEvent& event);
// Throws util::InvalidArgument when no change is set.
MutationEvent FromProto(const projsync::v1::MutationEvent& event);

projsync::v1::DriftRecord ToProto(const DriftRecord& record);

projsync::v1::SyncState ToProto(SyncState state);

} // namespace projsync::model
