#include "testing.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <string>
#include <sys/wait.h>

namespace {

struct CliRun {
    int exit_code = -1;
    std::string out;
};

CliRun RunGenup(const std::string& args) {
    const std::string cmd = std::string(GENUP_BIN) + " " + args + " 2>/dev/null";
    CliRun res;
    FILE* p = ::popen(cmd.c_str(), "r");
    if (!p)
        return res;
    std::array<char, 4096> buf{};
    size_t n;
    while ((n = std::fread(buf.data(), 1, buf.size(), p)) > 0)
        res.out.append(buf.data(), n);
    const int status = ::pclose(p);
    if (status != -1 && WIFEXITED(status))
        res.exit_code = WEXITSTATUS(status);
    return res;
}

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

class CliTests : public ::testing::Test {
  protected:
    void SetUp() override {
        ASSERT_EQ(::mkdir(tmp.Join("revisions").c_str(), 0755), 0);
        nlohmann::json cfg = {
            {"StateDir", tmp.Join("state")},
            {"RevisionSource", tmp.Join("revisions/{target}.json")},
            // A payload mentioning "broken" fails with an unrecognised error.
            {"BuildCommand", "if grep -q broken \"$GENUP_REVISION_FILE\"; then echo 'linker crashed' >&2; exit 1; fi; "
                             "echo \"/store/$GENUP_REVISION_ID\""},
            {"NotifyFile", tmp.Join("reports.log")},
            {"LogLevel", "error"},
        };
        testutil::WriteFile(tmp.Join("genup.conf"), cfg.dump(2));
    }

    void Publish(const std::string& target, const std::string& payload) {
        testutil::WriteFile(tmp.Join("revisions/" + target + ".json"),
                            R"({"components": ["nginx"], "payload": )" + payload + "}");
    }

    CliRun Genup(const std::string& args) { return RunGenup(args + " -c '" + tmp.Join("genup.conf") + "'"); }

    testutil::TemporaryDirectory tmp;
};

TEST_F(CliTests, RunActivatesAndListsGeneration) {
    Publish("web", R"({"port": 80})");

    const CliRun run = Genup("run -t web");
    EXPECT_EQ(run.exit_code, 0) << run.out;
    EXPECT_TRUE(Contains(run.out, "web SUCCESS"));

    const CliRun gens = Genup("generations -t web");
    EXPECT_EQ(gens.exit_code, 0);
    EXPECT_TRUE(Contains(gens.out, "*    1  active"));
    EXPECT_TRUE(Contains(gens.out, "artifact=/store/"));

    EXPECT_TRUE(Contains(testutil::ReadFile(tmp.Join("reports.log")), "web SUCCESS"));
}

TEST_F(CliTests, BrokenUpdateRollsBackThenHistoryShowsBoth) {
    Publish("web", R"({"port": 80})");
    ASSERT_EQ(Genup("run -t web").exit_code, 0);

    Publish("web", R"({"broken": true})");
    const CliRun run = Genup("run -t web");
    EXPECT_EQ(run.exit_code, 3) << run.out;
    EXPECT_TRUE(Contains(run.out, "ROLLED BACK"));
    EXPECT_TRUE(Contains(run.out, "remediation-exhausted"));

    const CliRun history = Genup("history -t web");
    EXPECT_EQ(history.exit_code, 0);
    EXPECT_TRUE(Contains(history.out, ": rolled-back"));
    EXPECT_TRUE(Contains(history.out, ": success"));

    const CliRun limited = Genup("history -t web -n 1");
    EXPECT_TRUE(Contains(limited.out, ": rolled-back"));
    EXPECT_FALSE(Contains(limited.out, ": success"));
}

TEST_F(CliTests, FirstBrokenUpdateAborts) {
    Publish("db", R"({"broken": true})");
    const CliRun run = Genup("run -t db");
    EXPECT_EQ(run.exit_code, 4) << run.out;
    EXPECT_TRUE(Contains(run.out, "ABORTED"));
}

TEST_F(CliTests, ManualRollbackRestoresPreviousGeneration) {
    Publish("web", R"({"port": 80})");
    ASSERT_EQ(Genup("run -t web").exit_code, 0);
    Publish("web", R"({"port": 81})");
    ASSERT_EQ(Genup("run -t web").exit_code, 0);

    const CliRun rb = Genup("rollback -t web");
    EXPECT_EQ(rb.exit_code, 0);
    EXPECT_TRUE(Contains(rb.out, "web: generation 1 is active"));

    const CliRun gens = Genup("generations -t web");
    EXPECT_TRUE(Contains(gens.out, "*    1  active"));
    EXPECT_TRUE(Contains(gens.out, "     2  rolled-back"));
}

TEST_F(CliTests, ExportAuditWritesTarball) {
    Publish("web", R"({"port": 80})");
    ASSERT_EQ(Genup("run -t web").exit_code, 0);
    Publish("web", R"({"port": 81})");
    ASSERT_EQ(Genup("run -t web").exit_code, 0);

    const std::string bundle = tmp.Join("audit.tar.gz");
    const CliRun ex = Genup("export-audit -t web -o '" + bundle + "'");
    ASSERT_EQ(ex.exit_code, 0);

    const auto entries = testutil::ReadTar(bundle);
    ASSERT_EQ(entries.size(), 2u);
    for (const auto& e : entries) {
        EXPECT_EQ(e.path.rfind("sessions/", 0), 0u);
        EXPECT_TRUE(nlohmann::json::parse(e.contents).contains("session_id"));
    }
}

TEST_F(CliTests, UsageErrors) {
    EXPECT_EQ(RunGenup("").exit_code, 2);
    EXPECT_EQ(Genup("run").exit_code, 2);
    EXPECT_EQ(Genup("explode -t web").exit_code, 2);
    EXPECT_EQ(Genup("run -t ../etc").exit_code, 2);
    EXPECT_EQ(Genup("run -t web --max-attempts lots").exit_code, 2);
    EXPECT_EQ(Genup("history -t web -n 0").exit_code, 2);
    EXPECT_EQ(Genup("export-audit -t web").exit_code, 2);
    EXPECT_EQ(RunGenup("--help").exit_code, 0);
}

TEST_F(CliTests, MissingConfigIsSetupError) {
    EXPECT_EQ(RunGenup("run -t web -c '" + tmp.Join("absent.conf") + "'").exit_code, 1);
}

} // namespace
