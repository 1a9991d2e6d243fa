#include <gtest/gtest.h>
#include <memex/knowledge/knowledge_store.h>

#include "../../support/memex_test_stack.hpp"

#include <thread>

using namespace memex;
using namespace memex::knowledge;
using memex::test_support::TestStack;

class KnowledgeStoreTest : public ::testing::Test {
protected:
    void SetUp() override { makeStore(true); }

    void makeStore(bool withVectorIndex) {
        store_.reset();
        stack_ = std::make_unique<TestStack>(withVectorIndex);
        store_ = std::make_unique<KnowledgeStore>(stack_->db, stack_->embeddings.get(),
                                                  KnowledgeStoreConfig{}, &stack_->background);
    }

    void TearDown() override {
        if (store_) {
            store_->waitForPendingEmbeddings();
        }
        store_.reset();
        stack_.reset();
    }

    std::unique_ptr<TestStack> stack_;
    std::unique_ptr<KnowledgeStore> store_;
};

TEST_F(KnowledgeStoreTest, AddAndGet) {
    auto id = store_->addItem(1, EntityType::Fact, "  Prefers dark mode  ");
    ASSERT_TRUE(id) << id.error().message;

    auto item = store_->get(1, id.value());
    ASSERT_TRUE(item);
    ASSERT_TRUE(item.value().has_value());
    EXPECT_EQ(item.value()->content, "Prefers dark mode");
    EXPECT_EQ(item.value()->type, EntityType::Fact);
    EXPECT_DOUBLE_EQ(item.value()->confidence, 1.0);
    EXPECT_FALSE(item.value()->createdAt.empty());
}

TEST_F(KnowledgeStoreTest, ValidatesInput) {
    EXPECT_EQ(store_->addItem(0, EntityType::Fact, "x").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->addItem(-4, EntityType::Fact, "x").error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->addItem(1, EntityType::Fact, "   ").error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->addItem(1, EntityType::Fact, "x", std::nullopt, 1.5).error().code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->addItem(1, EntityType::Fact, "x",
                              KnowledgeMetadata::defaultFor(EntityType::Goal))
                  .error()
                  .code,
              ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->getByType(0, EntityType::Fact).error().code, ErrorCode::InvalidArgument);
}

TEST_F(KnowledgeStoreTest, ExactDuplicatesAreRejectedCaseInsensitively) {
    ASSERT_TRUE(store_->addItem(1, EntityType::Fact, "Lives in Berlin"));
    auto dup = store_->addItem(1, EntityType::Fact, "lives in berlin ");
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::AlreadyExists);

    // Same text under another owner or type is not a duplicate
    EXPECT_TRUE(store_->addItem(2, EntityType::Fact, "Lives in Berlin"));
    EXPECT_TRUE(store_->addItem(1, EntityType::Goal, "Lives in Berlin"));
}

TEST_F(KnowledgeStoreTest, GoalSubstringDuplicates) {
    ASSERT_TRUE(store_->addItem(1, EntityType::Goal, "Learn Japanese"));
    EXPECT_FALSE(store_->addItem(1, EntityType::Goal, "learn japanese this year"));
    EXPECT_FALSE(store_->addItem(1, EntityType::Goal, "Japanese"));
    EXPECT_TRUE(store_->addItem(1, EntityType::Goal, "Run a marathon"));

    // Facts only dedupe exact matches
    ASSERT_TRUE(store_->addItem(1, EntityType::Fact, "Has a cat"));
    EXPECT_TRUE(store_->addItem(1, EntityType::Fact, "Has a cat named Miso"));
}

TEST_F(KnowledgeStoreTest, FinishedGoalsDoNotBlockSimilarNewOnes) {
    auto id = store_->addItem(1, EntityType::Goal, "Read more books");
    ASSERT_TRUE(id);
    ASSERT_TRUE(store_->setGoalStatus(1, id.value(), "completed").value());
    EXPECT_TRUE(store_->addItem(1, EntityType::Goal, "Read more books in 2027"));
}

TEST_F(KnowledgeStoreTest, UpsertReportsDuplicates) {
    std::vector<KnowledgeItem> batch{KnowledgeItem::make(EntityType::Fact, "a"),
                                     KnowledgeItem::make(EntityType::Fact, "b"),
                                     KnowledgeItem::make(EntityType::Fact, "A")};
    auto report = store_->upsert(1, batch);
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().inserted.size(), 2u);
    EXPECT_EQ(report.value().duplicates, 1u);
    EXPECT_EQ(store_->count(1).value(), 2);
}

TEST_F(KnowledgeStoreTest, OwnersAreIsolated) {
    auto id = store_->addItem(1, EntityType::Fact, "secret hobby");
    ASSERT_TRUE(id);

    EXPECT_FALSE(store_->get(2, id.value()).value().has_value());
    EXPECT_FALSE(store_->update(2, id.value(), std::string("hijacked")).value());
    EXPECT_FALSE(store_->deleteItem(2, id.value()).value());
    EXPECT_TRUE(store_->getByType(2, EntityType::Fact).value().empty());

    store_->waitForPendingEmbeddings();
    EXPECT_TRUE(store_->search(2, EntityType::Fact, "secret hobby", 5).value().empty());
    EXPECT_EQ(store_->get(1, id.value()).value()->content, "secret hobby");
}

TEST_F(KnowledgeStoreTest, EmbeddingIsAttachedInBackground) {
    auto id = store_->addItem(1, EntityType::Fact, "Allergic to peanuts");
    ASSERT_TRUE(id);
    store_->waitForPendingEmbeddings();
    EXPECT_EQ(store_->pendingEmbeddings(), 0u);

    auto item = store_->get(1, id.value()).value();
    ASSERT_TRUE(item->embeddingId.has_value());
    auto rec = stack_->embeddings->get(*item->embeddingId).value();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->sourceType, "knowledge_fact");
    EXPECT_EQ(rec->sourceId, id.value());
}

TEST_F(KnowledgeStoreTest, EmbeddingFailureKeepsItem) {
    stack_->scripted->failAll = true;
    auto id = store_->addItem(1, EntityType::Fact, "Speaks Portuguese");
    ASSERT_TRUE(id);
    store_->waitForPendingEmbeddings();

    auto item = store_->get(1, id.value()).value();
    ASSERT_TRUE(item.has_value());
    EXPECT_FALSE(item->embeddingId.has_value());
    EXPECT_EQ(store_->embeddingFailures(), 1u);
}

TEST_F(KnowledgeStoreTest, UpdateReembedsContent) {
    auto id = store_->addItem(1, EntityType::Fact, "Works at Acme");
    ASSERT_TRUE(id);
    store_->waitForPendingEmbeddings();
    auto before = store_->get(1, id.value()).value()->embeddingId;
    ASSERT_TRUE(before.has_value());

    auto updated = store_->update(1, id.value(), std::string("Works at Globex"));
    ASSERT_TRUE(updated);
    EXPECT_TRUE(updated.value());
    store_->waitForPendingEmbeddings();

    auto after = store_->get(1, id.value()).value();
    EXPECT_EQ(after->content, "Works at Globex");
    ASSERT_TRUE(after->embeddingId.has_value());
    EXPECT_NE(*after->embeddingId, *before);

    auto hits = store_->search(1, EntityType::Fact, "Globex", 3);
    ASSERT_TRUE(hits);
    ASSERT_FALSE(hits.value().empty());
    EXPECT_EQ(hits.value()[0].id, id.value());
}

TEST_F(KnowledgeStoreTest, UpdateMetadataOnly) {
    auto id = store_->addItem(1, EntityType::ListItem, "oat milk");
    ASSERT_TRUE(id);
    auto meta = KnowledgeMetadata::defaultFor(EntityType::ListItem);
    std::get<ListItemMetadata>(meta.typed).done = true;

    ASSERT_TRUE(store_->update(1, id.value(), std::nullopt, meta).value());
    auto item = store_->get(1, id.value()).value();
    EXPECT_TRUE(std::get<ListItemMetadata>(item->metadata.typed).done);

    EXPECT_FALSE(store_->update(1, id.value(), std::nullopt, std::nullopt).value());
    EXPECT_EQ(store_->update(1, id.value(), std::nullopt,
                             KnowledgeMetadata::defaultFor(EntityType::Fact))
                  .error()
                  .code,
              ErrorCode::InvalidArgument);
}

TEST_F(KnowledgeStoreTest, DeleteRemovesItem) {
    auto id = store_->addItem(1, EntityType::Fact, "temporary");
    ASSERT_TRUE(id);
    EXPECT_TRUE(store_->deleteItem(1, id.value()).value());
    EXPECT_FALSE(store_->deleteItem(1, id.value()).value());
    EXPECT_FALSE(store_->get(1, id.value()).value().has_value());
}

TEST_F(KnowledgeStoreTest, GetByTypeNewestFirstWithConfidenceFloor) {
    ASSERT_TRUE(store_->addItem(1, EntityType::Fact, "first", std::nullopt, 0.9));
    ASSERT_TRUE(store_->addItem(1, EntityType::Fact, "second", std::nullopt, 0.2));
    ASSERT_TRUE(store_->addItem(1, EntityType::Fact, "third", std::nullopt, 0.8));
    ASSERT_TRUE(store_->addItem(1, EntityType::Goal, "a goal"));

    auto all = store_->getByType(1, EntityType::Fact);
    ASSERT_TRUE(all);
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[0].content, "third");
    EXPECT_EQ(all.value()[2].content, "first");

    auto confident = store_->getByType(1, EntityType::Fact, 50, 0.5);
    ASSERT_EQ(confident.value().size(), 2u);

    auto limited = store_->getByType(1, EntityType::Fact, 1);
    ASSERT_EQ(limited.value().size(), 1u);
    EXPECT_EQ(limited.value()[0].content, "third");
}

TEST_F(KnowledgeStoreTest, FactsByCategory) {
    auto project = KnowledgeMetadata::defaultFor(EntityType::Fact);
    std::get<FactMetadata>(project.typed).category = "project";
    ASSERT_TRUE(store_->addItem(1, EntityType::Fact, "/home/u/src/memex", project));
    ASSERT_TRUE(store_->addItem(1, EntityType::Fact, "likes tea"));

    auto facts = store_->getFactsByCategory(1, "project");
    ASSERT_TRUE(facts);
    ASSERT_EQ(facts.value().size(), 1u);
    EXPECT_EQ(facts.value()[0].metadata.category(), std::optional<std::string>("project"));
}

TEST_F(KnowledgeStoreTest, MarkReferencedSetsTimestamp) {
    auto id = store_->addItem(1, EntityType::Fact, "referenced later");
    ASSERT_TRUE(id);
    EXPECT_FALSE(store_->get(1, id.value()).value()->lastReferencedAt.has_value());
    ASSERT_TRUE(store_->markReferenced(1, {id.value()}));
    EXPECT_TRUE(store_->get(1, id.value()).value()->lastReferencedAt.has_value());
    EXPECT_TRUE(store_->markReferenced(1, {}));
}

TEST_F(KnowledgeStoreTest, SearchFallsBackToKeywordsWithoutVectorIndex) {
    makeStore(false);
    auto fts5 = stack_->db.hasFTS5();
    if (!fts5 || !fts5.value()) {
        GTEST_SKIP() << "SQLite built without FTS5";
    }
    ASSERT_TRUE(store_->addItem(1, EntityType::Fact, "Prefers dark mode in every app"));
    ASSERT_TRUE(store_->addItem(1, EntityType::Fact, "Drinks oolong tea"));
    store_->waitForPendingEmbeddings();

    auto hits = store_->search(1, EntityType::Fact, "dark mode", 5);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_EQ(hits.value()[0].content, "Prefers dark mode in every app");

    EXPECT_TRUE(store_->search(1, EntityType::Fact, "zeppelin", 5).value().empty());
}

TEST_F(KnowledgeStoreTest, ConcurrentWritersKeepEveryRow) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([this, t]() {
            for (int i = 0; i < 10; ++i) {
                auto r = store_->addItem(1, EntityType::Fact,
                                         "fact " + std::to_string(t) + "-" + std::to_string(i));
                EXPECT_TRUE(r);
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    store_->waitForPendingEmbeddings();
    EXPECT_EQ(store_->count(1, EntityType::Fact).value(), 40);
    EXPECT_EQ(stack_->embeddings->count(1).value(), 40);
}
