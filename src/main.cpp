#include "app/runtime.hpp"
#include "io/atomic_file.hpp"
#include "model/session.hpp"
#include "system/cancel_token.hpp"
#include "system/signals.hpp"
#include "system/target_lock.hpp"
#include "update/reporter.hpp"
#include "update/update_orchestrator.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"
#include "util/time_utils.hpp"

#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <optional>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitSetup = 1;
constexpr int kExitUsage = 2;
constexpr int kExitRolledBack = 3;
constexpr int kExitAborted = 4;

enum LongOnly {
    kOptMaxAttempts = 1000,
    kOptAutoProceed,
    kOptTimeout,
};

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s <command> [options]\n"
        "\n"
        "Commands:\n"
        "  run -t <target>            Fetch, check, build and activate the latest revision\n"
        "      --max-attempts N       Remediation attempts before giving up (default 3)\n"
        "      --auto-proceed-on-critical\n"
        "                             Do not block on critical issues recommending abort\n"
        "      --timeout SECONDS      Cancel the session after SECONDS (0 = none)\n"
        "  history -t <target> [-n N] Last N sessions (default 10)\n"
        "  generations -t <target>    All generations and their status\n"
        "  rollback -t <target>       Re-activate the previous generation\n"
        "  export-audit -t <target> -o <file.tar.gz>\n"
        "                             Write the session archive as a tar.gz bundle\n"
        "\n"
        "Options:\n"
        "  -c, --config   Config file (default $GENUP_CONFIG_PATH or %s)\n"
        "  -v, --verbose  Debug logging\n"
        "  -q, --quiet    Warnings and errors only\n"
        "  -h, --help     Show this help\n",
        argv0, genup::config::kDefaultConfigPath);
}

bool ParseUnsigned(const char* s, unsigned long long& out) {
    if (!s || *s == '\0' || *s == '-')
        return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtoull(s, &end, 10);
    return errno == 0 && end && *end == '\0';
}

struct CliOptions {
    std::string command;
    std::string target;
    std::string config_path;
    std::string output;
    unsigned long long history_limit = 10;
    std::optional<unsigned long long> max_attempts;
    bool auto_proceed_on_critical = false;
    std::optional<unsigned long long> timeout_seconds;
    std::optional<genup::LogLevel> log_level;
};

int ExitCodeFor(genup::SessionOutcome outcome) {
    switch (outcome) {
        case genup::SessionOutcome::Success: return kExitOk;
        case genup::SessionOutcome::RolledBack: return kExitRolledBack;
        default: return kExitAborted;
    }
}

// Locks <StateDir>/<target>/.lock, creating the directory first.
bool LockTarget(const genup::TargetRegistry& targets, const std::string& target, genup::TargetLock& lock) {
    const std::string dir = targets.TargetDir(target);
    if (auto r = genup::EnsureDirectory(dir); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return false;
    }
    if (auto r = genup::TargetLock::Acquire(dir + "/.lock", lock); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return false;
    }
    return true;
}

int CmdRun(genup::Runtime& rt, const CliOptions& opt) {
    genup::TargetLock lock;
    if (!LockTarget(*rt.targets, opt.target, lock))
        return kExitSetup;

    genup::UpdatePolicy policy = rt.policy;
    if (opt.max_attempts)
        policy.max_remediation_attempts = static_cast<int>(*opt.max_attempts);
    if (opt.auto_proceed_on_critical)
        policy.auto_proceed_on_critical = true;
    if (opt.timeout_seconds)
        policy.timeout = std::chrono::seconds(*opt.timeout_seconds);

    genup::UpdateOrchestrator orchestrator(*rt.targets, rt.Wiring(), rt.rules);
    const genup::CancelToken cancel = genup::CancelToken::LinkedTo(&genup::g_cancel);
    const genup::UpdateSession session = orchestrator.RunUpdate(opt.target, policy, cancel);
    if (const int sig = genup::g_cancel_signal.load(); sig != 0)
        LogWarn("session %s interrupted by %s", session.session_id.c_str(), ::strsignal(sig));

    std::fputs(genup::Reporter::FormatSummary(session).c_str(), stdout);
    return ExitCodeFor(session.outcome);
}

int CmdHistory(genup::Runtime& rt, const CliOptions& opt) {
    auto target = rt.targets->Get(opt.target);
    if (!target) {
        std::fprintf(stderr, "ERROR: %s\n", target.error().c_str());
        return kExitSetup;
    }
    auto sessions = (*target)->archive.ListRecent(static_cast<size_t>(opt.history_limit));
    if (!sessions) {
        std::fprintf(stderr, "ERROR: %s\n", sessions.error().c_str());
        return kExitSetup;
    }
    for (const auto& s : *sessions) {
        std::printf("%s  %s\n", genup::FormatLocalTime(s.started_at).c_str(),
                    genup::Reporter::FormatOneLine(s).c_str());
    }
    return kExitOk;
}

int CmdGenerations(genup::Runtime& rt, const CliOptions& opt) {
    auto target = rt.targets->Get(opt.target);
    if (!target) {
        std::fprintf(stderr, "ERROR: %s\n", target.error().c_str());
        return kExitSetup;
    }
    for (const auto& g : (*target)->store.List()) {
        std::printf("%c %4llu  %-11s %s  revision=%s  artifact=%s\n",
                    g.status == genup::GenerationStatus::Active ? '*' : ' ',
                    static_cast<unsigned long long>(g.id),
                    genup::ToString(g.status),
                    genup::FormatLocalTime(g.created_at).c_str(),
                    g.revision.id.c_str(),
                    g.artifact_ref.c_str());
    }
    return kExitOk;
}

int CmdRollback(genup::Runtime& rt, const CliOptions& opt) {
    genup::TargetLock lock;
    if (!LockTarget(*rt.targets, opt.target, lock))
        return kExitSetup;

    auto target = rt.targets->Get(opt.target);
    if (!target) {
        std::fprintf(stderr, "ERROR: %s\n", target.error().c_str());
        return kExitSetup;
    }
    if (auto r = (*target)->store.Rollback(); !r.ok) {
        std::fprintf(stderr, "ERROR: rollback failed: %s\n", r.msg.c_str());
        return kExitSetup;
    }
    const auto current = (*target)->store.Current();
    std::printf("%s: generation %s is active\n", opt.target.c_str(),
                current ? std::to_string(current->id).c_str() : "none");
    return kExitOk;
}

int CmdExportAudit(genup::Runtime& rt, const CliOptions& opt) {
    auto target = rt.targets->Get(opt.target);
    if (!target) {
        std::fprintf(stderr, "ERROR: %s\n", target.error().c_str());
        return kExitSetup;
    }
    if (auto r = (*target)->archive.ExportBundle(opt.output); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitSetup;
    }
    std::printf("%s\n", opt.output.c_str());
    return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
    if (auto r = genup::InstallSignalHandlers(); !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return kExitSetup;
    }

    if (argc < 2) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        PrintUsage(argv[0]);
        return kExitOk;
    }

    CliOptions opt;
    opt.command = argv[1];

    static option long_opts[] = {
        {"target", required_argument, nullptr, 't'},
        {"count", required_argument, nullptr, 'n'},
        {"output", required_argument, nullptr, 'o'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {"max-attempts", required_argument, nullptr, kOptMaxAttempts},
        {"auto-proceed-on-critical", no_argument, nullptr, kOptAutoProceed},
        {"timeout", required_argument, nullptr, kOptTimeout},
        {nullptr, 0, nullptr, 0},
    };

    // getopt_long sees the arguments after the command word.
    int sub_argc = argc - 1;
    char** sub_argv = argv + 1;
    int idx = 0;
    int c;
    while ((c = getopt_long(sub_argc, sub_argv, "ht:n:o:c:vq", long_opts, &idx)) != -1) {
        unsigned long long v = 0;
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 't':
                opt.target = optarg;
                break;
            case 'n':
                if (!ParseUnsigned(optarg, v) || v == 0) {
                    std::fprintf(stderr, "Invalid -n: %s\n", optarg);
                    return kExitUsage;
                }
                opt.history_limit = v;
                break;
            case 'o':
                opt.output = optarg;
                break;
            case 'c':
                opt.config_path = optarg;
                break;
            case 'v':
                opt.log_level = genup::LogLevel::Debug;
                break;
            case 'q':
                opt.log_level = genup::LogLevel::Warn;
                break;
            case kOptMaxAttempts:
                if (!ParseUnsigned(optarg, v) || v > INT_MAX) {
                    std::fprintf(stderr, "Invalid --max-attempts: %s\n", optarg);
                    return kExitUsage;
                }
                opt.max_attempts = v;
                break;
            case kOptAutoProceed:
                opt.auto_proceed_on_critical = true;
                break;
            case kOptTimeout:
                if (!ParseUnsigned(optarg, v)) {
                    std::fprintf(stderr, "Invalid --timeout: %s\n", optarg);
                    return kExitUsage;
                }
                opt.timeout_seconds = v;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    using Handler = int (*)(genup::Runtime&, const CliOptions&);
    Handler handler = nullptr;
    if (opt.command == "run") handler = CmdRun;
    else if (opt.command == "history") handler = CmdHistory;
    else if (opt.command == "generations") handler = CmdGenerations;
    else if (opt.command == "rollback") handler = CmdRollback;
    else if (opt.command == "export-audit") handler = CmdExportAudit;

    if (!handler) {
        std::fprintf(stderr, "Unknown command: %s\n", opt.command.c_str());
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    if (opt.target.empty()) {
        std::fprintf(stderr, "%s: -t <target> is required\n", opt.command.c_str());
        return kExitUsage;
    }
    if (!genup::TargetRegistry::IsValidTargetId(opt.target)) {
        std::fprintf(stderr, "Invalid target id: %s\n", opt.target.c_str());
        return kExitUsage;
    }
    if (opt.command == "export-audit" && opt.output.empty()) {
        std::fprintf(stderr, "export-audit: -o <file.tar.gz> is required\n");
        return kExitUsage;
    }

    const std::string config_path = genup::config::ResolveConfigPath(opt.config_path);
    genup::config::OrchestratorConfig cfg;
    std::string err;
    if (!cfg.LoadFile(config_path, err)) {
        std::fprintf(stderr, "ERROR: cannot load config: %s\n", err.c_str());
        return kExitSetup;
    }

    genup::LogLevel level = genup::LogLevel::Info;
    if (cfg.log_level)
        (void)genup::ParseLogLevel(*cfg.log_level, level);
    if (opt.log_level)
        level = *opt.log_level;
    genup::Logger::Instance().SetLevel(level);

    auto rt = genup::BuildRuntime(cfg);
    if (!rt) {
        std::fprintf(stderr, "ERROR: %s\n", rt.error().c_str());
        return kExitSetup;
    }

    return handler(**rt, opt);
}
