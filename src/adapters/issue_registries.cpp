#include "adapters/issue_registries.hpp"

#include "adapters/command_adapters.hpp"
#include "io/file_reader.hpp"
#include "model/model_json.hpp"
#include "system/process.hpp"
#include "util/json_utils.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <utility>

namespace genup {

namespace {

std::vector<IssueReport> KeepRequested(std::vector<IssueReport> reports, const std::vector<std::string>& components) {
    std::erase_if(reports, [&](const IssueReport& r) {
        return std::find(components.begin(), components.end(), r.component) == components.end();
    });
    return reports;
}

} // namespace

std::expected<std::vector<IssueReport>, std::string> ParseIssueDatabase(const std::string& text) {
    nlohmann::json doc;
    std::string err;
    if (!json_utils::ParseJsonObject(text, doc, err))
        return std::unexpected(err);

    auto it = doc.find("issues");
    if (it == doc.end() || !it->is_array())
        return std::unexpected(std::string("issue database needs an \"issues\" array"));

    std::vector<IssueReport> out;
    out.reserve(it->size());
    for (const auto& entry : *it) {
        auto report = IssueReportFromJson(entry);
        if (!report) {
            LogWarn("Skipping issue entry: %s", report.error().c_str());
            continue;
        }
        out.push_back(std::move(*report));
    }
    return out;
}

FileIssueRegistry::FileIssueRegistry(std::string path) : path_(std::move(path)) {}

std::expected<std::vector<IssueReport>, std::string>
FileIssueRegistry::QueryIssues(const std::vector<std::string>& components, const CancelToken& cancel) {
    if (cancel.IsCancelled())
        return std::unexpected(std::string("issue query cancelled"));

    std::string text;
    Result r = ReadFileToString(path_, text);
    if (!r.ok)
        return std::unexpected("issue database " + path_ + " unreachable: " + r.msg);

    auto reports = ParseIssueDatabase(text);
    if (!reports)
        return std::unexpected("issue database " + path_ + " unreadable: " + reports.error());
    return KeepRequested(std::move(*reports), components);
}

CommandIssueRegistry::CommandIssueRegistry(std::string command) : command_(std::move(command)) {}

std::expected<std::vector<IssueReport>, std::string>
CommandIssueRegistry::QueryIssues(const std::vector<std::string>& components, const CancelToken& cancel) {
    ProcessSpec spec;
    spec.command = command_;
    spec.env = {{"GENUP_COMPONENTS", JoinComponents(components)}};

    ProcessResult pr;
    Result r = RunProcess(spec, cancel, pr);
    if (!r.ok)
        return std::unexpected("issue command cannot start: " + r.msg);
    if (!pr.Succeeded())
        return std::unexpected("issue command " + pr.Describe());
    if (pr.output_truncated)
        return std::unexpected(std::string("issue command output exceeds the capture limit"));

    auto reports = ParseIssueDatabase(pr.output);
    if (!reports)
        return std::unexpected("issue command output unreadable: " + reports.error());
    return KeepRequested(std::move(*reports), components);
}

} // namespace genup
