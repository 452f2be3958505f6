#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace genup {

// Ordered from least to most severe.
enum class Severity { Low, Medium, High, Critical };

enum class Recommendation { Proceed, Caution, Delay, Abort };

struct IssueReport {
    std::string component;
    Severity severity = Severity::Low;
    std::string summary;
    Recommendation recommendation = Recommendation::Proceed;
};

const char* ToString(Severity s);
const char* ToString(Recommendation r);
std::optional<Severity> ParseSeverity(std::string_view s);
std::optional<Recommendation> ParseRecommendation(std::string_view s);

inline bool IsCriticalAbort(const IssueReport& r) {
    return r.severity == Severity::Critical && r.recommendation == Recommendation::Abort;
}

} // namespace genup
