#pragma once

#include <cstdint>
#include <variant>

#include "row.hpp"

namespace projsync::model {

struct InsertChange {
  BaseRow row;
};

struct UpdateChange {
  BaseRow old_row;
  BaseRow new_row;
};

struct DeleteChange {
  RowKey key = 0;
};

/*
  One atomic change to the base relation.

  sequence is the commit order of the change. It is strictly increasing
  for a given key; nothing is promised across keys.
*/
struct MutationEvent {
  std::uint64_t                                          sequence = 0;
  std::variant<InsertChange, UpdateChange, DeleteChange> change;

  static MutationEvent Insert(std::uint64_t sequence, BaseRow row);
  static MutationEvent Update(std::uint64_t sequence, BaseRow old_row, BaseRow new_row);
  static MutationEvent Delete(std::uint64_t sequence, RowKey key);

  RowKey Key() const;

  bool IsInsert() const {
    return std::holds_alternative<InsertChange>(change);
  }
  bool IsUpdate() const {
    return std::holds_alternative<UpdateChange>(change);
  }
  bool IsDelete() const {
    return std::holds_alternative<DeleteChange>(change);
  }

  // Row the change leaves behind; null for deletes.
  const BaseRow* CurrentRow() const;

  const char* KindName() const;
};

} // namespace projsync::model
