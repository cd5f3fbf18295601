#include <gtest/gtest.h>

#include "mlat_track/blacklist.hpp"
#include "test_helpers.hpp"

using namespace mlat_track;
using namespace mlat_test;

TEST(Blacklist, MissingFileIsEmpty)
{
    Blacklist blacklist(::testing::TempDir()+"mlat_no_such_blacklist.txt");
    EXPECT_EQ(blacklist.reload(), 0u);
    EXPECT_FALSE(blacklist.contains(""));
}

TEST(Blacklist, FirstLineTrimmed)
{
    std::string path = ::testing::TempDir()+"mlat_blacklist_first.txt";
    write_file(path, "  mallory \t\nsecond-line-ignored\n");

    Blacklist blacklist(path);
    EXPECT_EQ(blacklist.reload(), 1u);
    EXPECT_TRUE(blacklist.contains("mallory"));
    EXPECT_FALSE(blacklist.contains("second-line-ignored"));
}

TEST(Blacklist, EmptyLineIsEmpty)
{
    std::string path = ::testing::TempDir()+"mlat_blacklist_blank.txt";
    write_file(path, "   \n");
    Blacklist blacklist(path);
    EXPECT_EQ(blacklist.reload(), 0u);
}

TEST(Blacklist, ReloadUnchangedIsIdentical)
{
    std::string path = ::testing::TempDir()+"mlat_blacklist_reload.txt";
    write_file(path, "mallory\n");
    Blacklist blacklist(path);
    blacklist.reload();
    std::set<std::string> before = blacklist.entries();
    blacklist.reload();
    EXPECT_EQ(blacklist.entries(), before);

    write_file(path, "trudy\n");
    blacklist.reload();
    EXPECT_FALSE(blacklist.contains("mallory"));
    EXPECT_TRUE(blacklist.contains("trudy"));
}
