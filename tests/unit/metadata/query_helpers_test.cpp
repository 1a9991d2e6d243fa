#include <gtest/gtest.h>
#include <memex/metadata/query_helpers.h>

using namespace memex::metadata;

TEST(QueryHelpersTest, EscapeLikeEscapesWildcardsAndBackslash) {
    EXPECT_EQ(sql::escapeLike("plain"), "plain");
    EXPECT_EQ(sql::escapeLike("50%_off"), "50\\%\\_off");
    EXPECT_EQ(sql::escapeLike("a\\b"), "a\\\\b");
}

TEST(QueryHelpersTest, PlaceholdersMatchCount) {
    EXPECT_EQ(sql::placeholders(0), "");
    EXPECT_EQ(sql::placeholders(1), "?");
    EXPECT_EQ(sql::placeholders(3), "?,?,?");
}

TEST(QueryHelpersTest, PatternsWrapEscapedText) {
    EXPECT_EQ(sql::prefixPattern("/home/u_1"), "/home/u\\_1%");
    EXPECT_EQ(sql::containsPattern("100%"), "%100\\%%");
}
