#pragma once

#include "config/config.pb.h"
#include "derivation_rule.hpp"

namespace projsync::derivation {

// Unset fields fall back to FreeGHz / 2.4 -> FreeCores.
DerivationRulePtr MakeRule(const projsync::runtime::config::DerivationConfig& config);

} // namespace projsync::derivation
