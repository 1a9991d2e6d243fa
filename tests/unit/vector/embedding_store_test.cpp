#include <gtest/gtest.h>
#include <memex/vector/embedding_store.h>

#include "../../support/memex_test_stack.hpp"

using namespace memex;
using namespace memex::vector;
using memex::test_support::TestStack;

namespace {

int64_t countRows(metadata::Database& db, const std::string& sql) {
    auto stmt = db.prepare(sql);
    if (!stmt || !stmt.value().step().value_or(false)) {
        return -1;
    }
    return stmt.value().getInt64(0);
}

} // namespace

TEST(EmbeddingStoreTest, UpsertWritesRowAndIndex) {
    TestStack stack;
    auto id = stack.embeddings->upsertEmbedding(1, "knowledge_fact", 10, "likes tea");
    ASSERT_TRUE(id) << id.error().message;
    EXPECT_EQ(stack.index->size(), 1u);

    auto rec = stack.embeddings->get(id.value());
    ASSERT_TRUE(rec);
    ASSERT_TRUE(rec.value().has_value());
    EXPECT_EQ(rec.value()->owner, 1);
    EXPECT_EQ(rec.value()->sourceType, "knowledge_fact");
    EXPECT_EQ(rec.value()->sourceId, 10);
    EXPECT_EQ(rec.value()->contentText, "likes tea");
    EXPECT_EQ(rec.value()->modelName, "test-hashing");
}

TEST(EmbeddingStoreTest, IndexFailureDoesNotFailUpsert) {
    TestStack stack;
    stack.index->failWrites = true;
    auto id = stack.embeddings->upsertEmbedding(1, "knowledge_fact", 1, "still stored");
    ASSERT_TRUE(id);
    EXPECT_EQ(stack.embeddings->indexWriteFailures(), 1u);
    EXPECT_EQ(stack.index->size(), 0u);
    EXPECT_EQ(stack.embeddings->count(1).value(), 1);

    // The stored vector lets a later rebuild repopulate the index
    stack.index->failWrites = false;
    auto rebuilt = stack.embeddings->rebuildIndex();
    ASSERT_TRUE(rebuilt);
    EXPECT_EQ(rebuilt.value(), 1u);
    EXPECT_EQ(stack.index->size(), 1u);
}

TEST(EmbeddingStoreTest, EncoderFailureWritesNothing) {
    TestStack stack;
    stack.scripted->failAll = true;
    auto id = stack.embeddings->upsertEmbedding(1, "knowledge_fact", 1, "x");
    EXPECT_FALSE(id);
    EXPECT_EQ(stack.embeddings->count().value(), 0);
}

TEST(EmbeddingStoreTest, RejectsNegativeOwnerAndWrongDimension) {
    TestStack stack(true, 32);
    auto neg = stack.embeddings->upsertEmbedding(-1, "knowledge_fact", 1, "x");
    ASSERT_FALSE(neg);
    EXPECT_EQ(neg.error().code, ErrorCode::InvalidArgument);

    auto dim = stack.embeddings->storeEmbedding(1, "knowledge_fact", 1, "x",
                                                std::vector<float>(31, 0.1f));
    ASSERT_FALSE(dim);
    EXPECT_EQ(dim.error().code, ErrorCode::InvalidData);
}

TEST(EmbeddingStoreTest, SearchIsScopedToOwnerAndType) {
    TestStack stack;
    ASSERT_TRUE(stack.embeddings->upsertEmbedding(1, "knowledge_fact", 1, "dark mode editor"));
    ASSERT_TRUE(stack.embeddings->upsertEmbedding(1, "knowledge_goal", 2, "dark mode everywhere"));
    ASSERT_TRUE(stack.embeddings->upsertEmbedding(2, "knowledge_fact", 3, "dark mode editor"));

    auto all = stack.embeddings->searchSimilar(1, "dark mode", 10);
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value().size(), 2u);

    auto facts = stack.embeddings->searchSimilarForType(1, "dark mode", "knowledge_fact", 10);
    ASSERT_TRUE(facts);
    ASSERT_EQ(facts.value().size(), 1u);
    EXPECT_EQ(facts.value()[0].sourceId, 1);

    auto other = stack.embeddings->searchSimilar(3, "dark mode", 10);
    ASSERT_TRUE(other);
    EXPECT_TRUE(other.value().empty());
}

TEST(EmbeddingStoreTest, ResultsOrderedByDistanceAndLimited) {
    TestStack stack;
    ASSERT_TRUE(stack.embeddings->upsertEmbedding(1, "knowledge_fact", 1, "grocery list bananas"));
    ASSERT_TRUE(stack.embeddings->upsertEmbedding(1, "knowledge_fact", 2, "espresso machine"));
    ASSERT_TRUE(stack.embeddings->upsertEmbedding(1, "knowledge_fact", 3, "espresso beans"));

    auto hits = stack.embeddings->searchSimilar(1, "espresso beans", 2);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(hits.value()[0].sourceId, 3);
    EXPECT_LE(hits.value()[0].distance, hits.value()[1].distance);
}

TEST(EmbeddingStoreTest, NoIndexMeansEmptySearch) {
    TestStack stack(false);
    EXPECT_FALSE(stack.embeddings->vectorSearchAvailable());
    ASSERT_TRUE(stack.embeddings->upsertEmbedding(1, "knowledge_fact", 1, "stored anyway"));
    auto hits = stack.embeddings->searchSimilar(1, "stored anyway", 5);
    ASSERT_TRUE(hits);
    EXPECT_TRUE(hits.value().empty());

    auto rebuilt = stack.embeddings->rebuildIndex();
    ASSERT_FALSE(rebuilt);
    EXPECT_EQ(rebuilt.error().code, ErrorCode::NotSupported);
}

TEST(EmbeddingStoreTest, WithoutEncoderEmbedAsyncIsNotInitialized) {
    TestStack stack;
    EmbeddingStore store(stack.db, nullptr);
    EXPECT_FALSE(store.canEmbed());
    auto r = store.embedAsync("text").get();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotInitialized);
}

TEST(EmbeddingStoreTest, RecencyFactorBands) {
    EXPECT_DOUBLE_EQ(recencyFactor(std::nullopt), 1.0);
    EXPECT_DOUBLE_EQ(recencyFactor(0.0), 0.8);
    EXPECT_DOUBLE_EQ(recencyFactor(30.0), 0.8);
    EXPECT_DOUBLE_EQ(recencyFactor(31.0), 1.0);
    EXPECT_DOUBLE_EQ(recencyFactor(90.0), 1.0);
    EXPECT_DOUBLE_EQ(recencyFactor(91.0), 1.2);
}

TEST(EmbeddingStoreTest, RecencyBoostPromotesRecentlyReferenced) {
    TestStack stack;
    ASSERT_TRUE(stack.db.execute(
        "INSERT INTO knowledge (id, owner_id, entity_type, content, last_referenced_at, updated_at) "
        "VALUES (1, 1, 'fact', 'old', datetime('now', '-200 days'), datetime('now', '-200 days')),"
        "       (2, 1, 'fact', 'new', datetime('now'), datetime('now'))"));
    // Same text gives equal raw distances; only the boost separates them
    ASSERT_TRUE(stack.embeddings->upsertEmbedding(1, "knowledge_fact", 1, "coffee order"));
    ASSERT_TRUE(stack.embeddings->upsertEmbedding(1, "knowledge_fact", 2, "coffee order"));

    auto hits = stack.embeddings->searchSimilarForType(1, "coffee order", "knowledge_fact", 2, true);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(hits.value()[0].sourceId, 2);
}

TEST(EmbeddingStoreTest, CollectOrphansHonoursGraceAndReferences) {
    TestStack stack;
    auto referenced = stack.embeddings->upsertEmbedding(1, "knowledge_fact", 1, "kept");
    auto orphan = stack.embeddings->upsertEmbedding(1, "knowledge_fact", 2, "dropped");
    ASSERT_TRUE(referenced);
    ASSERT_TRUE(orphan);
    ASSERT_TRUE(stack.db.execute(
        "INSERT INTO knowledge (id, owner_id, entity_type, content, embedding_id) VALUES (1, 1, "
        "'fact', 'kept', " + std::to_string(referenced.value()) + ")"));

    auto young = stack.embeddings->collectOrphans(3600);
    ASSERT_TRUE(young);
    EXPECT_EQ(young.value(), 0u);

    auto swept = stack.embeddings->collectOrphans(0);
    ASSERT_TRUE(swept);
    EXPECT_EQ(swept.value(), 1u);
    EXPECT_EQ(countRows(stack.db, "SELECT COUNT(*) FROM embeddings"), 1);
    EXPECT_EQ(stack.index->size(), 1u);
    EXPECT_FALSE(stack.embeddings->get(orphan.value()).value().has_value());
}
