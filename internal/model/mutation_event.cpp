#include "mutation_event.hpp"

#include <utility>

namespace projsync::model {

MutationEvent MutationEvent::Insert(std::uint64_t sequence, BaseRow row) {
  return MutationEvent{sequence, InsertChange{std::move(row)}};
}

MutationEvent MutationEvent::Update(std::uint64_t sequence, BaseRow old_row, BaseRow new_row) {
  return MutationEvent{sequence, UpdateChange{std::move(old_row), std::move(new_row)}};
}

MutationEvent MutationEvent::Delete(std::uint64_t sequence, RowKey key) {
  return MutationEvent{sequence, DeleteChange{key}};
}

RowKey MutationEvent::Key() const {
  if (const auto* insert = std::get_if<InsertChange>(&change)) return insert->row.key;
  if (const auto* update = std::get_if<UpdateChange>(&change)) return update->new_row.key;
  return std::get<DeleteChange>(change).key;
}

const BaseRow* MutationEvent::CurrentRow() const {
  if (const auto* insert = std::get_if<InsertChange>(&change)) return &insert->row;
  if (const auto* update = std::get_if<UpdateChange>(&change)) return &update->new_row;
  return nullptr;
}

const char* MutationEvent::KindName() const {
  if (IsInsert()) return "insert";
  if (IsUpdate()) return "update";
  return "delete";
}

} // namespace projsync::model
