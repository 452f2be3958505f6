#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace genup::config {

inline constexpr const char* kDefaultConfigPath = "/etc/genup/genup.conf";

class OrchestratorConfig {
public:
    std::string state_dir;
    std::string revision_source;  // "{target}" is replaced by the target id
    std::string build_command;

    std::string validate_command;
    std::string health_check_command;
    std::string issue_database;
    std::string issue_command;
    std::string notify_command;
    std::string notify_file;

    std::optional<std::uint64_t> max_remediation_attempts;
    std::optional<bool> auto_proceed_on_critical;
    std::optional<std::uint64_t> timeout_seconds;
    std::optional<std::vector<std::string>> remediation_rules;
    std::optional<std::string> log_level;

    bool LoadFile(const std::string& path, std::string& err);
    bool LoadJson(const nlohmann::json& j, std::string& err);

    void Reset();
};

// -c wins, then $GENUP_CONFIG_PATH, then kDefaultConfigPath.
std::string ResolveConfigPath(const std::string& cli_path);

} // namespace genup::config
