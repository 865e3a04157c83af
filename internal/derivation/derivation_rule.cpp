#include "derivation_rule.hpp"

namespace projsync::derivation {

std::set<std::string> ChangedColumns(const model::BaseRow& old_row, const model::BaseRow& new_row) {
  std::set<std::string> changed;

  for (const auto& [name, value] : old_row.columns) {
    auto it = new_row.columns.find(name);
    if (it == new_row.columns.end() || !model::ValuesEqual(value, it->second)) {
      changed.insert(name);
    }
  }
  for (const auto& [name, value] : new_row.columns) {
    if (!old_row.columns.contains(name)) {
      changed.insert(name);
    }
  }
  return changed;
}

bool InputsChanged(const DerivationRule& rule, const model::BaseRow& old_row, const model::BaseRow& new_row) {
  const auto changed = ChangedColumns(old_row, new_row);
  for (const auto& column : rule.InputColumns()) {
    if (changed.contains(column)) {
      return true;
    }
  }
  return false;
}

} // namespace projsync::derivation
