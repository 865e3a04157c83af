#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "internal/model/row.hpp"

namespace projsync::derivation {

/*
  Pure mapping from a base row to its derived attributes.

  Implementations must be deterministic over InputColumns() and must not
  perform I/O. An out-of-domain input throws util::DomainError.
*/
class DerivationRule {
 public:
  virtual ~DerivationRule() = default;

  virtual std::string              Name() const         = 0;
  virtual std::vector<std::string> InputColumns() const = 0;

  virtual model::DerivedAttributes Derive(const model::BaseRow& row) const = 0;
};

using DerivationRulePtr = std::shared_ptr<const DerivationRule>;

// Columns whose value differs between the two rows, including added and
// dropped ones.
std::set<std::string> ChangedColumns(const model::BaseRow& old_row, const model::BaseRow& new_row);

bool InputsChanged(const DerivationRule& rule, const model::BaseRow& old_row, const model::BaseRow& new_row);

} // namespace projsync::derivation
