#pragma once

#include "model/generation.hpp"
#include "model/issue.hpp"
#include "model/revision.hpp"
#include "model/session.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>

namespace genup {

nlohmann::json ToJson(const Revision& r);
nlohmann::json ToJson(const IssueReport& r);
nlohmann::json ToJson(const StepResult& s);
nlohmann::json ToJson(const RemediationAttempt& a);
nlohmann::json ToJson(const UpdateSession& s);

// Generation records omit the status; that lives in the store's pointer record.
nlohmann::json GenerationRecordToJson(const Generation& g);

std::expected<Revision, std::string> RevisionFromJson(const nlohmann::json& j);
std::expected<IssueReport, std::string> IssueReportFromJson(const nlohmann::json& j);
std::expected<Generation, std::string> GenerationRecordFromJson(const nlohmann::json& j);
std::expected<UpdateSession, std::string> SessionFromJson(const nlohmann::json& j);

} // namespace genup
