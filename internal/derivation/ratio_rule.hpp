#pragma once

#include <string>

#include "derivation_rule.hpp"

namespace projsync::derivation {

/*
  output = input / divisor.

  FreeCores = FreeGHz / 2.4 is the shipped configuration. A null or absent
  input yields a null output.
*/
class RatioRule final : public DerivationRule {
 public:
  RatioRule(std::string input_column, std::string output_column, double divisor);

  std::string              Name() const override;
  std::vector<std::string> InputColumns() const override;

  model::DerivedAttributes Derive(const model::BaseRow& row) const override;

 private:
  std::string input_column_;
  std::string output_column_;
  double      divisor_;
};

} // namespace projsync::derivation
