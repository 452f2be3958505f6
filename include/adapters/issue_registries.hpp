#pragma once

#include "update/collaborators.hpp"

#include <expected>
#include <string>
#include <vector>

namespace genup {

// {"issues": [{"component": "...", "severity": "critical", "summary": "...",
//              "recommendation": "abort"}, ...]}
// Malformed entries are skipped; a malformed document is an error.
std::expected<std::vector<IssueReport>, std::string> ParseIssueDatabase(const std::string& text);

class FileIssueRegistry final : public IIssueRegistry {
public:
    explicit FileIssueRegistry(std::string path);

    std::expected<std::vector<IssueReport>, std::string>
    QueryIssues(const std::vector<std::string>& components, const CancelToken& cancel) override;

private:
    std::string path_;
};

// Runs IssueCommand with GENUP_COMPONENTS and parses its stdout.
class CommandIssueRegistry final : public IIssueRegistry {
public:
    explicit CommandIssueRegistry(std::string command);

    std::expected<std::vector<IssueReport>, std::string>
    QueryIssues(const std::vector<std::string>& components, const CancelToken& cancel) override;

private:
    std::string command_;
};

} // namespace genup
