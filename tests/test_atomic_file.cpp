#include "testing.hpp"

#include "io/atomic_file.hpp"
#include "io/temp_file.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

TEST(AtomicFileTests, WritesAndReplaces) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Join("current.json");

    ASSERT_TRUE(genup::AtomicFile::Write(path, "first").ok);
    EXPECT_EQ(testutil::ReadFile(path), "first");

    ASSERT_TRUE(genup::AtomicFile::Write(path, "second").ok);
    EXPECT_EQ(testutil::ReadFile(path), "second");
    EXPECT_FALSE(testutil::FileExists(path + ".tmp"));
}

TEST(AtomicFileTests, FailsWhenDirectoryIsMissing) {
    testutil::TemporaryDirectory tmp;
    EXPECT_FALSE(genup::AtomicFile::Write(tmp.Join("missing/current.json"), "x").ok);
}

TEST(AtomicFileTests, EnsureDirectoryCreatesParents) {
    testutil::TemporaryDirectory tmp;
    ASSERT_TRUE(genup::EnsureDirectory(tmp.Join("a/b/c")).ok);
    EXPECT_TRUE(testutil::FileExists(tmp.Join("a/b/c")));
    EXPECT_TRUE(genup::EnsureDirectory(tmp.Join("a/b/c")).ok);
}

TEST(TempFileTests, RemovedOnDestruction) {
    testutil::TemporaryDirectory tmp;
    std::string path;
    {
        genup::TempFile t;
        ASSERT_TRUE(genup::TempFile::Create(tmp.Join("payload"), t).ok);
        path = t.Path();
        ASSERT_TRUE(t.WriteAndClose("{\"a\":1}").ok);
        EXPECT_EQ(testutil::ReadFile(path), "{\"a\":1}");
    }
    EXPECT_FALSE(testutil::FileExists(path));
}

} // namespace
