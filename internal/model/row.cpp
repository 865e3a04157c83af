#include "row.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace projsync::model {

std::optional<double> NumberColumn(const Columns& columns, const std::string& name) {
  auto it = columns.find(name);
  if (it == columns.end()) return std::nullopt;
  if (const auto* number = std::get_if<double>(&it->second)) return *number;
  return std::nullopt;
}

bool ValuesEqual(const ColumnValue& lhs, const ColumnValue& rhs) {
  if (lhs.index() != rhs.index()) return false;

  if (const auto* a = std::get_if<double>(&lhs)) {
    const double b = std::get<double>(rhs);
    if (*a == b) return true;
    if (std::isnan(*a) || std::isnan(b)) return false;
    const double scale = std::max(std::fabs(*a), std::fabs(b));
    return std::fabs(*a - b) <= 1e-9 * std::max(scale, 1.0);
  }
  return lhs == rhs;
}

bool AttributesEqual(const DerivedAttributes& lhs, const DerivedAttributes& rhs) {
  if (lhs.size() != rhs.size()) return false;

  auto left  = lhs.begin();
  auto right = rhs.begin();
  for (; left != lhs.end(); ++left, ++right) {
    if (left->first != right->first) return false;
    if (!ValuesEqual(left->second, right->second)) return false;
  }
  return true;
}

std::string ToString(const ColumnValue& value) {
  if (std::holds_alternative<std::monostate>(value)) return "null";
  if (const auto* number = std::get_if<double>(&value)) {
    std::ostringstream out;
    out << *number;
    return out.str();
  }
  if (const auto* text = std::get_if<std::string>(&value)) return "\"" + *text + "\"";
  return std::get<bool>(value) ? "true" : "false";
}

std::string ToString(const Columns& columns) {
  std::ostringstream out;
  out << '{';
  bool first = true;
  for (const auto& [name, value] : columns) {
    if (!first) out << ", ";
    first = false;
    out << name << '=' << ToString(value);
  }
  out << '}';
  return out.str();
}

} // namespace projsync::model
