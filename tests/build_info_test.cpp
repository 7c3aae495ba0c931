#include <gtest/gtest.h>

#include <git_info.hpp>

TEST(BuildInfoTest, GitMetadataAvailable)
{
    EXPECT_FALSE(rfetch::build_info::git_commit.empty());
    EXPECT_FALSE(rfetch::build_info::git_commit_short.empty());
    // "unknown" вне git-репозитория тоже 7 символов
    EXPECT_EQ(rfetch::build_info::git_commit_short.size(), 7);
}

TEST(BuildInfoTest, GitInfoMirrorsConstants)
{
    constexpr auto info = rfetch::build_info::get_git_info();
    EXPECT_EQ(info.commit, rfetch::build_info::git_commit);
    EXPECT_EQ(info.dirty, rfetch::build_info::git_dirty);
    EXPECT_FALSE(info.timestamp.empty());
}
