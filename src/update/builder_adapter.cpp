#include "update/builder_adapter.hpp"

#include "system/process.hpp"
#include "util/logger.hpp"
#include "util/time_utils.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <regex>
#include <sstream>
#include <string_view>
#include <utility>

namespace genup {

namespace {

struct Signature {
    const char* failure_class;
    std::regex pattern;
    // Capture group names, in order; empty entries are ignored.
    std::array<const char*, 2> hint_keys;
};

const std::vector<Signature>& Signatures() {
    static const std::vector<Signature> kSignatures = [] {
        const auto flags = std::regex::ECMAScript | std::regex::icase;
        std::vector<Signature> v;
        v.push_back({kFailureMissingDependency,
                     std::regex(R"(missing dependency:?\s+['"`]?([A-Za-z0-9_.+-]+))", flags),
                     {"dependency", ""}});
        v.push_back({kFailureMissingDependency,
                     std::regex(R"(dependency ['"`]([A-Za-z0-9_.+-]+)['"`] (?:was )?not found)", flags),
                     {"dependency", ""}});
        v.push_back({kFailureMissingDependency,
                     std::regex(R"(undefined variable ['"`]([A-Za-z0-9_.+-]+)['"`])", flags),
                     {"dependency", ""}});
        v.push_back({kFailureObsoleteOption,
                     std::regex(R"(option ['"`]([A-Za-z0-9_.-]+)['"`] (?:does not exist|has been removed|is obsolete))",
                                flags),
                     {"option", ""}});
        v.push_back({kFailureNoSpace, std::regex(R"(no space left on device)", flags), {"", ""}});
        return v;
    }();
    return kSignatures;
}

// Lines are clipped before matching; libstdc++ regex recursion grows with input length.
constexpr size_t kMaxClassifiedLine = 2048;

std::string Lowered(std::string_view s) {
    std::string out(s);
    for (char& c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

// Whitespace-delimited token following `label` at or after `from`, empty when absent.
std::string TokenAfter(const std::string& text, const std::string& lowered, std::string_view label,
                       size_t& from) {
    const size_t at = lowered.find(label, from);
    if (at == std::string::npos)
        return {};
    size_t begin = at + label.size();
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    size_t end = begin;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end])))
        ++end;
    from = end;
    return text.substr(begin, end - begin);
}

// Hash mismatch reports usually spread specified/got over the following lines.
std::string JoinWindow(const std::vector<std::string>& lines, size_t from, size_t count) {
    std::string out;
    for (size_t i = from; i < lines.size() && i < from + count; ++i) {
        if (!out.empty()) out += ' ';
        out += lines[i];
    }
    return out;
}

} // namespace

std::string BuildError::Summary() const {
    std::string s;
    if (cancelled) {
        s = "build cancelled";
    } else if (exit_signal != 0) {
        s = "builder killed by signal " + std::to_string(exit_signal);
    } else {
        s = "builder exited with code " + std::to_string(exit_code);
    }
    if (!failure_class.empty())
        s += " [" + failure_class + "]";
    for (const auto& [k, v] : hints)
        s += " " + k + "=" + v;
    const std::string last = LastNonEmptyLine(log);
    if (!last.empty())
        s += ": " + last;
    return s;
}

void ClassifyBuildFailure(BuildError& error) {
    if (!error.failure_class.empty())
        return;

    std::vector<std::string> lines;
    {
        std::istringstream in(error.log);
        std::string line;
        while (std::getline(in, line)) {
            if (line.size() > kMaxClassifiedLine)
                line.resize(kMaxClassifiedLine);
            lines.push_back(std::move(line));
        }
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        if (Lowered(lines[i]).find("hash mismatch") == std::string::npos)
            continue;
        error.failure_class = kFailureHashMismatch;
        const std::string window = JoinWindow(lines, i, 3);
        const std::string lowered = Lowered(window);
        size_t pos = lowered.find("hash mismatch");
        std::string specified = TokenAfter(window, lowered, "specified:", pos);
        std::string got = specified.empty() ? std::string() : TokenAfter(window, lowered, "got:", pos);
        if (!specified.empty() && !got.empty()) {
            error.hints["specified"] = std::move(specified);
            error.hints["got"] = std::move(got);
        }
        return;
    }

    for (const auto& sig : Signatures()) {
        for (size_t i = 0; i < lines.size(); ++i) {
            const std::string window = JoinWindow(lines, i, 3);
            std::smatch m;
            if (!std::regex_search(window, m, sig.pattern))
                continue;
            error.failure_class = sig.failure_class;
            for (size_t g = 0; g < sig.hint_keys.size(); ++g) {
                if (sig.hint_keys[g][0] != '\0' && m.size() > g + 1 && m[g + 1].matched)
                    error.hints[sig.hint_keys[g]] = m[g + 1].str();
            }
            return;
        }
    }
    error.failure_class = kFailureUnknown;
}

BuilderAdapter::BuilderAdapter(IBuilder& builder) : builder_(builder) {}

std::expected<std::string, BuildError> BuilderAdapter::Build(const Revision& revision,
                                                             const CancelToken& cancel) {
    LogInfo("Building revision %s (%zu components)", revision.id.c_str(), revision.components.size());
    const auto started = std::chrono::steady_clock::now();

    auto result = builder_.Build(revision, cancel);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (result) {
        LogInfo("Build of %s succeeded in %s: %s",
                revision.id.c_str(), FormatDuration(elapsed).c_str(), result->c_str());
        return result;
    }

    BuildError err = std::move(result.error());
    if (cancel.IsCancelled())
        err.cancelled = true;
    if (!err.cancelled)
        ClassifyBuildFailure(err);
    LogWarn("Build of %s failed after %s: %s",
            revision.id.c_str(), FormatDuration(elapsed).c_str(), err.Summary().c_str());
    return std::unexpected(std::move(err));
}

} // namespace genup
