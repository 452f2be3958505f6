#pragma once

#include "store/target_registry.hpp"
#include "update/collaborators.hpp"
#include "update/remediation_engine.hpp"
#include "update/update_orchestrator.hpp"
#include "util/config.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace genup {

// Production collaborators built from the configuration file.
struct Runtime {
    std::unique_ptr<TargetRegistry> targets;
    std::unique_ptr<IConfigurationSource> source;
    std::unique_ptr<IBuilder> builder;
    std::unique_ptr<IIssueRegistry> issue_registry;
    std::unique_ptr<IGenerationCheck> validator;
    std::unique_ptr<IGenerationCheck> health_check;
    std::unique_ptr<INotifier> notifier;
    std::vector<RemediationEngine::RulePtr> rules;
    UpdatePolicy policy;

    UpdateOrchestrator::Collaborators Wiring() const;
};

std::expected<std::unique_ptr<Runtime>, std::string> BuildRuntime(const config::OrchestratorConfig& cfg);

} // namespace genup
