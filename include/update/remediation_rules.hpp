#pragma once

#include "update/remediation_engine.hpp"

#include <expected>
#include <string>
#include <vector>

namespace genup {

// Built-in rules, one per failure class ClassifyBuildFailure can produce except
// "unknown". Each rule is named after the class it handles.
std::vector<RemediationEngine::RulePtr> CreateDefaultRemediationRules();

// Picks built-in rules by name, in the given order. Unknown names are an error.
std::expected<std::vector<RemediationEngine::RulePtr>, std::string>
SelectRemediationRules(const std::vector<std::string>& names);

} // namespace genup
