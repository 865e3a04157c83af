#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace projsync::model {

using RowKey    = std::int64_t;
using TimePoint = std::chrono::system_clock::time_point;

/*
  Column value of a base or derived row.

  monostate is SQL NULL. Integers travel as doubles, matching the
  protobuf Struct encoding used on the wire and in storage.
*/
using ColumnValue = std::variant<std::monostate, double, std::string, bool>;

using Columns           = std::map<std::string, ColumnValue>;
using DerivedAttributes = Columns;

struct BaseRow {
  RowKey  key = 0;
  Columns columns;

  bool operator==(const BaseRow&) const = default;
};

struct DerivedRow {
  RowKey            key = 0;
  DerivedAttributes attributes;
  // Sequence number of the mutation this row was derived from.
  std::uint64_t version = 0;
  TimePoint     last_synced_at{};
};

/*
  Half-open key interval [begin, end). Unset bounds are unbounded.
*/
struct KeyRange {
  std::optional<RowKey> begin;
  std::optional<RowKey> end;

  bool Contains(RowKey key) const {
    if (begin && key < *begin) return false;
    if (end && key >= *end) return false;
    return true;
  }
};

inline bool IsNull(const ColumnValue& value) {
  return std::holds_alternative<std::monostate>(value);
}

std::optional<double> NumberColumn(const Columns& columns, const std::string& name);

// Numbers compare with a relative tolerance so values that went through a
// text encoding still match.
bool ValuesEqual(const ColumnValue& lhs, const ColumnValue& rhs);
bool AttributesEqual(const DerivedAttributes& lhs, const DerivedAttributes& rhs);

std::string ToString(const ColumnValue& value);
std::string ToString(const Columns& columns);

} // namespace projsync::model
