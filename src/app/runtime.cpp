#include "app/runtime.hpp"

#include "adapters/command_adapters.hpp"
#include "adapters/file_configuration_source.hpp"
#include "adapters/issue_registries.hpp"
#include "adapters/notifiers.hpp"
#include "update/remediation_rules.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <climits>

namespace genup {

UpdateOrchestrator::Collaborators Runtime::Wiring() const {
    UpdateOrchestrator::Collaborators c;
    c.source = source.get();
    c.builder = builder.get();
    c.notifier = notifier.get();
    c.issue_registry = issue_registry.get();
    c.validator = validator.get();
    c.health_check = health_check.get();
    return c;
}

std::expected<std::unique_ptr<Runtime>, std::string> BuildRuntime(const config::OrchestratorConfig& cfg) {
    auto rt = std::make_unique<Runtime>();

    rt->targets = std::make_unique<TargetRegistry>(cfg.state_dir);
    rt->source = std::make_unique<FileConfigurationSource>(cfg.revision_source);
    rt->builder = std::make_unique<CommandBuilder>(cfg.build_command);

    if (!cfg.issue_database.empty()) {
        rt->issue_registry = std::make_unique<FileIssueRegistry>(cfg.issue_database);
    } else if (!cfg.issue_command.empty()) {
        rt->issue_registry = std::make_unique<CommandIssueRegistry>(cfg.issue_command);
    } else {
        LogInfo("No issue registry configured; risk assessment will be skipped");
    }

    if (!cfg.validate_command.empty())
        rt->validator = std::make_unique<CommandGenerationCheck>("validate", cfg.validate_command);
    if (!cfg.health_check_command.empty())
        rt->health_check = std::make_unique<CommandGenerationCheck>("health-check", cfg.health_check_command);

    std::vector<std::unique_ptr<INotifier>> channels;
    channels.push_back(std::make_unique<LogNotifier>());
    if (!cfg.notify_file.empty())
        channels.push_back(std::make_unique<FileNotifier>(cfg.notify_file));
    if (!cfg.notify_command.empty())
        channels.push_back(std::make_unique<CommandNotifier>(cfg.notify_command));
    rt->notifier = std::make_unique<FanoutNotifier>(std::move(channels));

    if (cfg.remediation_rules) {
        auto rules = SelectRemediationRules(*cfg.remediation_rules);
        if (!rules)
            return std::unexpected(rules.error());
        rt->rules = std::move(*rules);
    } else {
        rt->rules = CreateDefaultRemediationRules();
    }

    if (cfg.max_remediation_attempts) {
        if (*cfg.max_remediation_attempts > INT_MAX)
            return std::unexpected(std::string("MaxRemediationAttempts is too large"));
        rt->policy.max_remediation_attempts = static_cast<int>(*cfg.max_remediation_attempts);
    }
    if (cfg.auto_proceed_on_critical)
        rt->policy.auto_proceed_on_critical = *cfg.auto_proceed_on_critical;
    if (cfg.timeout_seconds)
        rt->policy.timeout = std::chrono::seconds(*cfg.timeout_seconds);

    return rt;
}

} // namespace genup
