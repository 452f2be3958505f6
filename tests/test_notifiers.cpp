#include "fakes.hpp"
#include "testing.hpp"

#include "adapters/notifiers.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace {

TEST(FileNotifierTests, AppendsMessagesWithSeparator) {
    testutil::TemporaryDirectory tmp;
    genup::FileNotifier notifier(tmp.Join("reports.log"));

    ASSERT_TRUE(notifier.Send("first report\n").ok);
    ASSERT_TRUE(notifier.Send("second report").ok);
    EXPECT_EQ(testutil::ReadFile(tmp.Join("reports.log")), "first report\n----\nsecond report\n----\n");
}

TEST(FileNotifierTests, UnwritablePathFails) {
    testutil::TemporaryDirectory tmp;
    genup::FileNotifier notifier(tmp.Join("no/such/dir/reports.log"));
    EXPECT_FALSE(notifier.Send("x").ok);
}

TEST(CommandNotifierTests, MessageArrivesOnStdin) {
    testutil::TemporaryDirectory tmp;
    genup::CommandNotifier notifier("cat > '" + tmp.Join("mail.txt") + "'");
    ASSERT_TRUE(notifier.Send("update finished\n").ok);
    EXPECT_EQ(testutil::ReadFile(tmp.Join("mail.txt")), "update finished\n");
}

TEST(CommandNotifierTests, FailingCommandFails) {
    genup::CommandNotifier notifier("cat > /dev/null; exit 3");
    auto r = notifier.Send("hello");
    ASSERT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("exit code 3"), std::string::npos);
}

TEST(LogNotifierTests, AlwaysSucceeds) {
    genup::LogNotifier notifier;
    EXPECT_TRUE(notifier.Send("line one\nline two\n").ok);
}

TEST(FanoutNotifierTests, DeliversToEveryChannelDespiteFailures) {
    auto first = std::make_unique<testutil::RecordingNotifier>();
    auto broken = std::make_unique<testutil::RecordingNotifier>();
    auto last = std::make_unique<testutil::RecordingNotifier>();
    broken->fail = true;
    testutil::RecordingNotifier* first_raw = first.get();
    testutil::RecordingNotifier* last_raw = last.get();

    std::vector<std::unique_ptr<genup::INotifier>> channels;
    channels.push_back(std::move(first));
    channels.push_back(std::move(broken));
    channels.push_back(std::move(last));
    genup::FanoutNotifier fanout(std::move(channels));
    EXPECT_EQ(fanout.Size(), 3u);

    auto r = fanout.Send("report");
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.msg, "notifier down");
    EXPECT_EQ(first_raw->messages, std::vector<std::string>{"report"});
    EXPECT_EQ(last_raw->messages, std::vector<std::string>{"report"});
}

TEST(FanoutNotifierTests, AllChannelsHealthy) {
    std::vector<std::unique_ptr<genup::INotifier>> channels;
    channels.push_back(std::make_unique<testutil::RecordingNotifier>());
    channels.push_back(std::make_unique<genup::LogNotifier>());
    genup::FanoutNotifier fanout(std::move(channels));
    EXPECT_TRUE(fanout.Send("report").ok);
}

} // namespace
