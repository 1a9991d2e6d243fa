#include <gtest/gtest.h>
#include <memex/indexing/file_chunk_store.h>
#include <memex/metadata/database.h>
#include <memex/metadata/migration.h>

using namespace memex;
using namespace memex::indexing;

class FileChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(metadata::openAndMigrate(db_, ":memory:")); }

    metadata::Database db_;
};

TEST_F(FileChunkStoreTest, SaveIsUpsertOnPathAndIndex) {
    FileChunkStore store(db_);
    auto first = store.saveChunk("/p/a.md", 0, "old text", std::nullopt, 100.0);
    ASSERT_TRUE(first);
    auto again = store.saveChunk("/p/a.md", 0, "new text", std::nullopt, 200.0);
    ASSERT_TRUE(again);
    EXPECT_EQ(first.value(), again.value());

    auto chunks = store.chunksFor("/p/a.md");
    ASSERT_TRUE(chunks);
    ASSERT_EQ(chunks.value().size(), 1u);
    EXPECT_EQ(chunks.value()[0].contentText, "new text");
    EXPECT_DOUBLE_EQ(chunks.value()[0].fileMtime, 200.0);
}

TEST_F(FileChunkStoreTest, DeleteAboveTrimsTail) {
    FileChunkStore store(db_);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(store.saveChunk("/p/a.md", i, "c" + std::to_string(i), std::nullopt, 1.0));
    }
    ASSERT_TRUE(store.saveChunk("/p/b.md", 0, "other", std::nullopt, 1.0));

    auto removed = store.deleteChunksAbove("/p/a.md", 1);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value(), 3);
    EXPECT_EQ(store.chunksFor("/p/a.md").value().size(), 2u);

    auto all = store.deleteChunksForFile("/p/a.md");
    ASSERT_TRUE(all);
    EXPECT_EQ(all.value(), 2);
    EXPECT_EQ(store.chunksFor("/p/b.md").value().size(), 1u);
}

TEST_F(FileChunkStoreTest, IndexedPathsReportMtime) {
    FileChunkStore store(db_);
    ASSERT_TRUE(store.saveChunk("/p/a.md", 0, "x", std::nullopt, 10.5));
    ASSERT_TRUE(store.saveChunk("/p/a.md", 1, "y", std::nullopt, 10.5));
    ASSERT_TRUE(store.saveChunk("/p/b.md", 0, "z", std::nullopt, 20.0));

    auto paths = store.indexedPaths();
    ASSERT_TRUE(paths);
    ASSERT_EQ(paths.value().size(), 2u);
    EXPECT_DOUBLE_EQ(paths.value().at("/p/a.md"), 10.5);
    EXPECT_DOUBLE_EQ(paths.value().at("/p/b.md"), 20.0);
}

TEST_F(FileChunkStoreTest, SearchTextIsCaseInsensitiveAndLiteral) {
    FileChunkStore store(db_);
    ASSERT_TRUE(store.saveChunk("/p/a.md", 0, "Deploy with Kubernetes", std::nullopt, 1.0));
    ASSERT_TRUE(store.saveChunk("/q/b.md", 0, "kubernetes 100% uptime", std::nullopt, 1.0));
    ASSERT_TRUE(store.saveChunk("/q/c.md", 0, "nothing here", std::nullopt, 1.0));

    auto hits = store.searchText("KUBERNETES", 10, std::nullopt);
    ASSERT_TRUE(hits);
    EXPECT_EQ(hits.value().size(), 2u);

    auto scoped = store.searchText("kubernetes", 10, std::string("/q/"));
    ASSERT_TRUE(scoped);
    ASSERT_EQ(scoped.value().size(), 1u);
    EXPECT_EQ(scoped.value()[0].path, "/q/b.md");

    // % is matched literally
    auto literal = store.searchText("0% up", 10, std::nullopt);
    ASSERT_TRUE(literal);
    EXPECT_EQ(literal.value().size(), 1u);
    EXPECT_TRUE(store.searchText("%", 10, std::string("/p/")).value().empty());
}

TEST_F(FileChunkStoreTest, EmbeddingLinksAndStats) {
    FileChunkStore store(db_);
    auto a = store.saveChunk("/p/a.md", 0, "x", std::nullopt, 1.0);
    auto b = store.saveChunk("/p/a.md", 1, "y", std::nullopt, 1.0);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    ASSERT_TRUE(store.attachEmbedding(b.value(), 77));
    ASSERT_TRUE(store.attachEmbedding(a.value(), 42));

    auto byEmbedding = store.getByEmbeddingIds({77, 42, 5});
    ASSERT_TRUE(byEmbedding);
    ASSERT_EQ(byEmbedding.value().size(), 2u);
    EXPECT_EQ(byEmbedding.value()[0].chunkIndex, 1);
    EXPECT_EQ(byEmbedding.value()[1].chunkIndex, 0);

    auto stats = store.stats();
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().files, 1);
    EXPECT_EQ(stats.value().chunks, 2);
    EXPECT_EQ(stats.value().embedded, 2);
    EXPECT_TRUE(stats.value().lastIndexedAt.has_value());
}
