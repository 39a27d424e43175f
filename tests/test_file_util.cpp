#include <gtest/gtest.h>
#include "file_util.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>

using namespace continuity;

namespace fs = std::filesystem;

class FileUtilTest : public ::testing::Test {
protected:
    continuity_test::ScopedTempDir dir;
};

TEST_F(FileUtilTest, WriteCreatesParentDirectories) {
    const auto path = dir.Sub("a/b/c.txt");
    std::string err;
    ASSERT_TRUE(WriteFileAtomic(path, "hello", "", &err)) << err;
    EXPECT_EQ(continuity_test::ReadAll(path), "hello");
}

TEST_F(FileUtilTest, WriteReplacesAndLeavesNoTempFiles) {
    const auto path = dir.Sub("state.json");
    std::string err;
    ASSERT_TRUE(WriteFileAtomic(path, "one", "", &err)) << err;
    ASSERT_TRUE(WriteFileAtomic(path, "two", "", &err)) << err;
    EXPECT_EQ(continuity_test::ReadAll(path), "two");

    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(dir.path())) {
        (void)e;
        entries++;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(FileUtilTest, WriteThroughScratchDir) {
    const auto path = dir.Sub("out/log.jsonl");
    const auto scratch = dir.Sub("scratch");
    std::string err;
    ASSERT_TRUE(WriteFileAtomic(path, "line\n", scratch, &err)) << err;
    EXPECT_EQ(continuity_test::ReadAll(path), "line\n");
    EXPECT_TRUE(fs::is_empty(scratch));
}

TEST_F(FileUtilTest, WriteKeepsPermissions) {
    const auto path = dir.Sub("private.json");
    std::string err;
    ASSERT_TRUE(WriteFileAtomic(path, "{}", "", &err)) << err;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);

    ASSERT_TRUE(WriteFileAtomic(path, "{\"a\":1}", "", &err)) << err;
    EXPECT_EQ(fs::status(path).permissions() & fs::perms::mask, fs::perms::owner_read | fs::perms::owner_write);
}

TEST_F(FileUtilTest, WriteFailsWhenParentIsAFile) {
    continuity_test::WriteAll(dir.Sub("blocker"), "x");
    std::string err;
    EXPECT_FALSE(WriteFileAtomic(dir.Sub("blocker/child.json"), "{}", "", &err));
    EXPECT_FALSE(err.empty());
}

TEST_F(FileUtilTest, ReadMissingFileIsNotAnError) {
    std::string err;
    EXPECT_FALSE(ReadFileToString(dir.Sub("missing.txt"), &err).has_value());
    EXPECT_TRUE(err.empty());
    EXPECT_FALSE(ReadJsonFile(dir.Sub("missing.json"), &err).has_value());
    EXPECT_TRUE(err.empty());
}

TEST_F(FileUtilTest, ReadInvalidJsonReportsError) {
    continuity_test::WriteAll(dir.Sub("broken.json"), "{not json");
    std::string err;
    EXPECT_FALSE(ReadJsonFile(dir.Sub("broken.json"), &err).has_value());
    EXPECT_FALSE(err.empty());
}

TEST_F(FileUtilTest, JsonRoundTrip) {
    const auto path = dir.Sub("doc.json");
    std::string err;
    ASSERT_TRUE(WriteJsonFileAtomic(path, {{"k", "v"}, {"n", 2}}, &err)) << err;
    auto j = ReadJsonFile(path, &err);
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ((*j)["k"], "v");
    EXPECT_EQ((*j)["n"], 2);
}

TEST(SafeFileNameTest, RejectsPathsAndTraversal) {
    EXPECT_TRUE(IsSafeFileName("e-1.v2"));
    EXPECT_FALSE(IsSafeFileName(""));
    EXPECT_FALSE(IsSafeFileName(".."));
    EXPECT_FALSE(IsSafeFileName("../x"));
    EXPECT_FALSE(IsSafeFileName("a..b"));
    EXPECT_FALSE(IsSafeFileName("/etc/passwd"));
    EXPECT_FALSE(IsSafeFileName("a/b"));
    EXPECT_FALSE(IsSafeFileName("a\\b"));
    EXPECT_FALSE(IsSafeFileName(std::string("a\0b", 3)));
}

TEST(RandomHexTest, LengthAndAlphabet) {
    auto h = RandomHex(6);
    EXPECT_EQ(h.size(), 12u);
    EXPECT_EQ(h.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(RandomHex(8), RandomHex(8));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
