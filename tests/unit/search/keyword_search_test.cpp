#include <gtest/gtest.h>
#include <memex/metadata/database.h>
#include <memex/metadata/migration.h>
#include <memex/search/keyword_search.h>

using namespace memex;
using namespace memex::search;
using memex::knowledge::EntityType;

class KeywordSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(metadata::openAndMigrate(db_, ":memory:"));
        auto fts5 = db_.hasFTS5();
        if (!fts5 || !fts5.value()) {
            GTEST_SKIP() << "SQLite built without FTS5";
        }
    }

    void insert(OwnerId owner, const std::string& type, const std::string& content,
                const std::string& metadata = "{}", double confidence = 1.0) {
        auto stmt = db_.prepare("INSERT INTO knowledge (owner_id, entity_type, content, metadata, "
                                "confidence) VALUES (?, ?, ?, ?, ?)");
        ASSERT_TRUE(stmt);
        ASSERT_TRUE(stmt.value().bindAll(static_cast<int64_t>(owner), type, content, metadata,
                                         confidence));
        ASSERT_TRUE(stmt.value().execute());
    }

    metadata::Database db_;
};

TEST(FtsSanitizerTest, QuotesTokensAndDropsNegations) {
    EXPECT_EQ(sanitizeFtsQuery("dark mode"), "\"dark\" OR \"mode\"");
    EXPECT_EQ(sanitizeFtsQuery("  tea  -coffee "), "\"tea\"");
    EXPECT_EQ(sanitizeFtsQuery("say \"hi\""), "\"say\" OR \"\"\"hi\"\"\"");
    EXPECT_EQ(sanitizeFtsQuery("AND OR NEAR("), "\"AND\" OR \"OR\" OR \"NEAR(\"");
}

TEST(FtsSanitizerTest, NothingLeftGivesEmpty) {
    EXPECT_EQ(sanitizeFtsQuery(""), "");
    EXPECT_EQ(sanitizeFtsQuery("   "), "");
    EXPECT_EQ(sanitizeFtsQuery("-a -b"), "");
}

TEST_F(KeywordSearchTest, RanksByRelevance) {
    insert(1, "fact", "User prefers dark mode in the editor and dark themes in the terminal");
    insert(1, "fact", "User drinks green tea");
    insert(1, "fact", "Mode of transport is a bicycle");

    KeywordSearch ks(db_);
    ASSERT_TRUE(ks.available());
    auto hits = ks.searchFacts(1, "dark mode", 5);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_NE(hits[0].content.find("dark mode"), std::string::npos);
    EXPECT_LE(hits[0].score, hits[1].score);
}

TEST_F(KeywordSearchTest, ScopedToOwnerAndType) {
    insert(1, "fact", "likes espresso");
    insert(2, "fact", "likes espresso");
    insert(1, "goal", "drink less espresso");

    KeywordSearch ks(db_);
    EXPECT_EQ(ks.searchFacts(1, "espresso").size(), 1u);
    EXPECT_EQ(ks.searchGoals(1, "espresso").size(), 1u);
    EXPECT_TRUE(ks.searchFacts(3, "espresso").empty());
}

TEST_F(KeywordSearchTest, GoalsAreActiveOnly) {
    insert(1, "goal", "learn rust", R"({"status":"completed"})");
    insert(1, "goal", "learn piano", R"({"status":"active"})");
    insert(1, "goal", "learn go");

    KeywordSearch ks(db_);
    auto hits = ks.searchGoals(1, "learn", 10);
    ASSERT_EQ(hits.size(), 2u);
    for (const auto& h : hits) {
        EXPECT_EQ(h.content.find("rust"), std::string::npos);
    }
}

TEST_F(KeywordSearchTest, MinConfidenceFilters) {
    insert(1, "fact", "maybe likes jazz", "{}", 0.3);
    insert(1, "fact", "definitely likes jazz", "{}", 0.9);

    KeywordSearch ks(db_);
    auto hits = ks.searchKnowledge(1, EntityType::Fact, "jazz", 10, 0.5);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].content, "definitely likes jazz");
}

TEST_F(KeywordSearchTest, SyntaxHeavyQueryDoesNotThrow) {
    insert(1, "fact", "uses vim");
    KeywordSearch ks(db_);
    EXPECT_NO_THROW({
        auto hits = ks.searchFacts(1, "\"unbalanced ( * ^ OR", 5);
        EXPECT_TRUE(hits.empty());
    });
    EXPECT_TRUE(ks.searchFacts(1, "-vim", 5).empty());
    EXPECT_TRUE(ks.searchFacts(1, "vim", 0).empty());
}

TEST_F(KeywordSearchTest, ContentUpdatesAreReindexed) {
    insert(1, "fact", "lives in Berlin");
    ASSERT_TRUE(db_.execute("UPDATE knowledge SET content = 'lives in Lisbon' WHERE id = 1"));
    KeywordSearch ks(db_);
    EXPECT_TRUE(ks.searchFacts(1, "Berlin").empty());
    EXPECT_EQ(ks.searchFacts(1, "Lisbon").size(), 1u);

    ASSERT_TRUE(db_.execute("DELETE FROM knowledge WHERE id = 1"));
    EXPECT_TRUE(ks.searchFacts(1, "Lisbon").empty());
}

TEST(KeywordSearchUnavailableTest, MissingFtsTableYieldsEmpty) {
    metadata::Database db;
    ASSERT_TRUE(db.open(":memory:", metadata::ConnectionMode::Memory));
    ASSERT_TRUE(db.execute("CREATE TABLE knowledge (id INTEGER PRIMARY KEY, owner_id INTEGER, "
                           "entity_type TEXT, content TEXT, metadata TEXT, confidence REAL)"));
    KeywordSearch ks(db);
    EXPECT_FALSE(ks.available());
    EXPECT_TRUE(ks.searchFacts(1, "anything").empty());
}
