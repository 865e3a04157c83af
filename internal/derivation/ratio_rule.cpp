#include "ratio_rule.hpp"

#include <cmath>

#include "internal/util/errors.hpp"

namespace projsync::derivation {

RatioRule::RatioRule(std::string input_column, std::string output_column, double divisor)
    : input_column_(std::move(input_column)), output_column_(std::move(output_column)), divisor_(divisor) {
  if (input_column_.empty() || output_column_.empty()) {
    throw util::InvalidArgument("ratio rule requires input and output column names");
  }
  if (!std::isfinite(divisor_) || divisor_ <= 0.0) {
    throw util::InvalidArgument("ratio rule divisor must be a positive finite number");
  }
}

std::string RatioRule::Name() const {
  return output_column_ + " = " + input_column_ + " / " + std::to_string(divisor_);
}

std::vector<std::string> RatioRule::InputColumns() const {
  return {input_column_};
}

model::DerivedAttributes RatioRule::Derive(const model::BaseRow& row) const {
  model::DerivedAttributes out;

  auto it = row.columns.find(input_column_);
  if (it == row.columns.end() || model::IsNull(it->second)) {
    out[output_column_] = std::monostate{};
    return out;
  }

  const auto* value = std::get_if<double>(&it->second);
  if (!value) {
    throw util::DomainError(row.key, input_column_, "value is not numeric");
  }
  if (!std::isfinite(*value)) {
    throw util::DomainError(row.key, input_column_, "value is not finite");
  }
  if (*value < 0.0) {
    throw util::DomainError(row.key, input_column_, "value is negative");
  }

  out[output_column_] = *value / divisor_;
  return out;
}

} // namespace projsync::derivation
