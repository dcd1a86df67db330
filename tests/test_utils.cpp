/**
 * @file test_utils.cpp
 * @brief StringUtils path helpers and /proc parsing
 */

#include "sentrybox/utils/procfs.hpp"
#include "sentrybox/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

using sentrybox::utils::ProcFs;
using sentrybox::utils::StringUtils;

TEST(StringUtilsTest, NormalizePathCollapsesDotSegments) {
    EXPECT_EQ(StringUtils::NormalizePath("/tmp/./a/../b"), "/tmp/b");
    EXPECT_EQ(StringUtils::NormalizePath("/../etc"), "/etc");
    EXPECT_EQ(StringUtils::NormalizePath("/"), "/");
}

TEST(StringUtilsTest, PathBeneathRespectsSeparators) {
    EXPECT_TRUE(StringUtils::IsPathBeneath("/data/shared/file.csv", "/data/shared"));
    EXPECT_TRUE(StringUtils::IsPathBeneath("/data/shared", "/data/shared/"));
    EXPECT_FALSE(StringUtils::IsPathBeneath("/data/sharedother", "/data/shared"));
    EXPECT_FALSE(StringUtils::IsPathBeneath("/data/shared/../secret", "/data/shared"));
    EXPECT_TRUE(StringUtils::IsPathBeneath("/anything", "/"));
}

TEST(StringUtilsTest, LineOfOffsetIsOneBased) {
    const std::string text = "a\nbb\nccc";
    EXPECT_EQ(StringUtils::LineOfOffset(text, 0), 1);
    EXPECT_EQ(StringUtils::LineOfOffset(text, 2), 2);
    EXPECT_EQ(StringUtils::LineOfOffset(text, 5), 3);
    EXPECT_EQ(StringUtils::LineOfOffset(text, 1000), 3);
}

TEST(StringUtilsTest, EntropyOfUniformAndRandomLookingText) {
    EXPECT_DOUBLE_EQ(StringUtils::ShannonEntropy(""), 0.0);
    EXPECT_DOUBLE_EQ(StringUtils::ShannonEntropy("aaaaaaaa"), 0.0);
    EXPECT_GT(StringUtils::ShannonEntropy("aZ3$kP9!qW2@mX7#"), 3.5);
}

TEST(StringUtilsTest, TruncateKeepsSuffixWithinLimit) {
    EXPECT_EQ(StringUtils::Truncate("abcdefghij", 6), "abc...");
    EXPECT_EQ(StringUtils::Truncate("abc", 6), "abc");
}

TEST(StringUtilsTest, Utf8ValidationRejectsMalformedSequences) {
    EXPECT_TRUE(StringUtils::IsValidUtf8(""));
    EXPECT_TRUE(StringUtils::IsValidUtf8("plain ascii\n"));
    EXPECT_TRUE(StringUtils::IsValidUtf8("caf\xc3\xa9 \xf0\x9f\x98\x80"));

    EXPECT_FALSE(StringUtils::IsValidUtf8("ok\xff\xfe"));
    EXPECT_FALSE(StringUtils::IsValidUtf8("\xc3"));              // truncated
    EXPECT_FALSE(StringUtils::IsValidUtf8("\xc0\xaf"));          // overlong
    EXPECT_FALSE(StringUtils::IsValidUtf8("\xed\xa0\x80"));      // surrogate
    EXPECT_FALSE(StringUtils::IsValidUtf8("\xf4\x90\x80\x80"));  // above U+10FFFF
}

TEST(ProcFsTest, ParseStatHandlesSpacesInCommand) {
    const std::string line =
        "4242 (python3 main) S 1 4242 4242 0 -1 4194560 1000 0 0 0 "
        "150 25 0 0 20 0 3 0 12345 104857600 2048 18446744073709551615";
    auto stat = ProcFs::ParseStat(line);
    ASSERT_TRUE(stat.has_value());
    EXPECT_EQ(stat->state, 'S');
    EXPECT_EQ(stat->utime_ticks, 150u);
    EXPECT_EQ(stat->stime_ticks, 25u);
    EXPECT_EQ(stat->num_threads, 3);
    EXPECT_EQ(stat->rss_pages, 2048u);
}

TEST(ProcFsTest, ParseStatRejectsTruncatedInput) {
    EXPECT_FALSE(ProcFs::ParseStat("12 (x) R 1 2 3").has_value());
    EXPECT_FALSE(ProcFs::ParseStat("garbage").has_value());
}

TEST(ProcFsTest, ReadsOwnProcess) {
    const pid_t self = ::getpid();
    EXPECT_TRUE(ProcFs::IsAlive(self));

    auto stat = ProcFs::ReadStat(self);
    ASSERT_TRUE(stat.has_value());
    EXPECT_GE(stat->num_threads, 1);

    auto fds = ProcFs::CountFds(self);
    ASSERT_TRUE(fds.has_value());
    EXPECT_GE(fds->open_files, 3);

    EXPECT_GT(ProcFs::TotalMemoryBytes(), 0u);
    EXPECT_GT(ProcFs::ClockTicksPerSecond(), 0);
}
