#include "rule_factory.hpp"

#include "ratio_rule.hpp"

namespace projsync::derivation {

namespace {

constexpr const char* kDefaultInput   = "FreeGHz";
constexpr const char* kDefaultOutput  = "FreeCores";
constexpr double      kDefaultDivisor = 2.4;

} // namespace

DerivationRulePtr MakeRule(const projsync::runtime::config::DerivationConfig& config) {
  const std::string input  = config.input_column().empty() ? kDefaultInput : config.input_column();
  const std::string output = config.output_column().empty() ? kDefaultOutput : config.output_column();
  const double      divisor = config.divisor() == 0.0 ? kDefaultDivisor : config.divisor();

  return std::make_shared<RatioRule>(input, output, divisor);
}

} // namespace projsync::derivation
