#include "system/process.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace {

using genup::CancelToken;
using genup::ProcessResult;
using genup::ProcessSpec;

ProcessResult Run(const ProcessSpec& spec, const CancelToken& cancel = CancelToken()) {
    ProcessResult out;
    auto r = genup::RunProcess(spec, cancel, out);
    EXPECT_TRUE(r.ok) << r.msg;
    return out;
}

TEST(ProcessTests, CapturesStdoutAndStderr) {
    ProcessSpec spec;
    spec.command = "echo out; echo err >&2";
    const ProcessResult res = ::Run(spec);
    EXPECT_TRUE(res.Succeeded());
    EXPECT_NE(res.output.find("out"), std::string::npos);
    EXPECT_NE(res.output.find("err"), std::string::npos);
}

TEST(ProcessTests, ReportsExitCode) {
    ProcessSpec spec;
    spec.command = "exit 7";
    const ProcessResult res = ::Run(spec);
    EXPECT_FALSE(res.Succeeded());
    EXPECT_EQ(res.exit_code, 7);
    EXPECT_EQ(res.Describe(), "exit code 7");
}

TEST(ProcessTests, ReportsTerminatingSignal) {
    ProcessSpec spec;
    spec.command = "kill -9 $$";
    const ProcessResult res = ::Run(spec);
    EXPECT_FALSE(res.Succeeded());
    EXPECT_EQ(res.term_signal, 9);
    EXPECT_EQ(res.Describe(), "killed by signal 9");
}

TEST(ProcessTests, PassesEnvironment) {
    ProcessSpec spec;
    spec.command = "printf '%s' \"$GENUP_TARGET\"";
    spec.env = {{"GENUP_TARGET", "web-01"}};
    EXPECT_EQ(::Run(spec).output, "web-01");
}

TEST(ProcessTests, EnvironmentOverridesInheritedVariable) {
    ASSERT_EQ(::setenv("GENUP_PROCESS_TEST", "parent", 1), 0);
    ProcessSpec spec;
    spec.command = "env | grep -c '^GENUP_PROCESS_TEST='; printf '%s' \"$GENUP_PROCESS_TEST\"";
    spec.env = {{"GENUP_PROCESS_TEST", "child"}};
    const ProcessResult res = ::Run(spec);
    EXPECT_TRUE(res.Succeeded()) << res.output;
    EXPECT_EQ(res.output, "1\nchild");
    EXPECT_STREQ(::getenv("GENUP_PROCESS_TEST"), "parent");
    ::unsetenv("GENUP_PROCESS_TEST");
}

TEST(ProcessTests, ConcurrentRunsWithEnvironmentComplete) {
    std::vector<std::thread> threads;
    std::atomic<int> succeeded{0};
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&succeeded, t] {
            for (int i = 0; i < 10; ++i) {
                ProcessSpec spec;
                spec.command = "printf '%s' \"$GENUP_WORKER\"";
                spec.env = {{"GENUP_WORKER", std::to_string(t)}};
                ProcessResult out;
                auto r = genup::RunProcess(spec, CancelToken().WithTimeout(std::chrono::seconds(10)), out);
                if (r.ok && out.Succeeded() && out.output == std::to_string(t))
                    ++succeeded;
            }
        });
    }
    for (auto& th : threads)
        th.join();
    EXPECT_EQ(succeeded.load(), 40);
}

TEST(ProcessTests, UnwaitableChildIsAnError) {
    struct sigaction ignore {};
    struct sigaction previous {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ASSERT_EQ(::sigaction(SIGCHLD, &ignore, &previous), 0);

    ProcessSpec spec;
    spec.command = "true";
    ProcessResult out;
    auto r = genup::RunProcess(spec, CancelToken().WithTimeout(std::chrono::seconds(10)), out);

    ASSERT_EQ(::sigaction(SIGCHLD, &previous, nullptr), 0);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ECHILD);
    EXPECT_FALSE(out.cancelled);
}

TEST(ProcessTests, FeedsStdin) {
    ProcessSpec spec;
    spec.command = "cat";
    spec.stdin_data = std::string(200 * 1024, 'z');
    const ProcessResult res = ::Run(spec);
    EXPECT_TRUE(res.Succeeded());
    EXPECT_EQ(res.output, spec.stdin_data);
}

TEST(ProcessTests, KeepsTailWhenOutputExceedsLimit) {
    ProcessSpec spec;
    spec.command = "i=0; while [ $i -lt 200 ]; do echo line$i; i=$((i+1)); done";
    spec.output_limit = 64;
    const ProcessResult res = ::Run(spec);
    EXPECT_TRUE(res.output_truncated);
    EXPECT_LE(res.output.size(), 64u);
    EXPECT_EQ(genup::LastNonEmptyLine(res.output), "line199");
}

TEST(ProcessTests, CancelKillsChild) {
    ProcessSpec spec;
    spec.command = "sleep 30";
    spec.kill_grace = std::chrono::milliseconds(200);
    CancelToken cancel;
    const CancelToken timed = cancel.WithTimeout(std::chrono::milliseconds(100));

    const auto start = std::chrono::steady_clock::now();
    const ProcessResult res = ::Run(spec, timed);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(res.cancelled);
    EXPECT_FALSE(res.Succeeded());
    EXPECT_EQ(res.Describe(), "cancelled");
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(ProcessTests, EmptyCommandIsRejected) {
    ProcessSpec spec;
    ProcessResult out;
    EXPECT_FALSE(genup::RunProcess(spec, CancelToken(), out).ok);
}

TEST(ProcessTests, LastNonEmptyLineSkipsTrailingBlankLines) {
    EXPECT_EQ(genup::LastNonEmptyLine("a\n  /nix/store/xyz  \n\n \n"), "/nix/store/xyz");
    EXPECT_EQ(genup::LastNonEmptyLine("single"), "single");
    EXPECT_EQ(genup::LastNonEmptyLine("\n\n"), "");
}

} // namespace
