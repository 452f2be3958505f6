#include "util/config.hpp"

#include "util/json_utils.hpp"
#include "util/logger.hpp"

#include <cstdlib>

namespace genup::config {

namespace {

using json_utils::GetBoolIfPresent;
using json_utils::GetStringArrayIfPresent;
using json_utils::GetStringIfPresent;
using json_utils::GetU64IfPresent;
using json_utils::HasWrongType;
using nlohmann::json;

struct StringKey {
    const char* key;
    std::string OrchestratorConfig::*field;
    bool required;
};

constexpr StringKey kStringKeys[] = {
    {"StateDir", &OrchestratorConfig::state_dir, true},
    {"RevisionSource", &OrchestratorConfig::revision_source, true},
    {"BuildCommand", &OrchestratorConfig::build_command, true},
    {"ValidateCommand", &OrchestratorConfig::validate_command, false},
    {"HealthCheckCommand", &OrchestratorConfig::health_check_command, false},
    {"IssueDatabase", &OrchestratorConfig::issue_database, false},
    {"IssueCommand", &OrchestratorConfig::issue_command, false},
    {"NotifyCommand", &OrchestratorConfig::notify_command, false},
    {"NotifyFile", &OrchestratorConfig::notify_file, false},
};

} // namespace

void OrchestratorConfig::Reset() {
    *this = OrchestratorConfig{};
}

bool OrchestratorConfig::LoadFile(const std::string& path, std::string& err) {
    Reset();

    json j;
    if (!json_utils::LoadJsonObjectFromFile(path, j, err))
        return false;
    if (!LoadJson(j, err)) {
        err += " in " + path;
        return false;
    }
    LogDebug("Config loaded from %s", path.c_str());
    return true;
}

bool OrchestratorConfig::LoadJson(const json& j, std::string& err) {
    Reset();

    for (const auto& k : kStringKeys) {
        if (HasWrongType(j, k.key, json::value_t::string)) {
            err = std::string(k.key) + " must be a string";
            return false;
        }
        (void)GetStringIfPresent(j, k.key, this->*k.field);
        if (k.required && (this->*k.field).empty()) {
            err = std::string("missing ") + k.key;
            return false;
        }
    }
    if (!issue_database.empty() && !issue_command.empty()) {
        err = "IssueDatabase and IssueCommand are mutually exclusive";
        return false;
    }

    struct U64Key {
        const char* key;
        std::optional<std::uint64_t>& out;
    };
    for (U64Key k : {U64Key{"MaxRemediationAttempts", max_remediation_attempts},
                     U64Key{"TimeoutSeconds", timeout_seconds}}) {
        if (!j.contains(k.key))
            continue;
        std::uint64_t v{};
        if (!GetU64IfPresent(j, k.key, v)) {
            err = std::string(k.key) + " must be a non-negative integer";
            return false;
        }
        k.out = v;
    }

    if (j.contains("AutoProceedOnCritical")) {
        bool b{};
        if (!GetBoolIfPresent(j, "AutoProceedOnCritical", b)) {
            err = "AutoProceedOnCritical must be a boolean";
            return false;
        }
        auto_proceed_on_critical = b;
    }

    if (j.contains("RemediationRules")) {
        std::vector<std::string> rules;
        if (!GetStringArrayIfPresent(j, "RemediationRules", rules)) {
            err = "RemediationRules must be an array of strings";
            return false;
        }
        remediation_rules = std::move(rules);
    }

    if (j.contains("LogLevel")) {
        std::string s;
        LogLevel lvl{};
        if (!GetStringIfPresent(j, "LogLevel", s) || !ParseLogLevel(s, lvl)) {
            err = "LogLevel must be one of debug, info, warn, error, none";
            return false;
        }
        log_level = s;
    }
    return true;
}

std::string ResolveConfigPath(const std::string& cli_path) {
    if (!cli_path.empty())
        return cli_path;
    const char* env = std::getenv("GENUP_CONFIG_PATH");
    if (env && *env)
        return env;
    return kDefaultConfigPath;
}

} // namespace genup::config
