#pragma once

#include <memex/core/types.h>
#include <memex/knowledge/knowledge_item.h>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace memex::core {
class WorkerPool;
}
namespace memex::metadata {
class Database;
class Statement;
} // namespace memex::metadata
namespace memex::vector {
class EmbeddingStore;
}
namespace memex::search {
class KeywordSearch;
class FallbackSearch;
} // namespace memex::search

namespace memex::knowledge {

struct UpsertReport {
    std::vector<RowId> inserted;
    size_t duplicates = 0;
};

struct KnowledgeStoreConfig {
    /// Apply recency weighting when ranking vector matches
    bool recencyBoost = true;
};

/**
 * @brief CRUD and deduplication for facts, goals and list items.
 *
 * Every call is scoped to one owner id; ids owned by someone else behave as
 * if they did not exist. Inserts and content updates schedule an embedding
 * on the background pool. The item row is committed first and embedding
 * failures only leave embedding_id unset.
 */
class KnowledgeStore {
public:
    KnowledgeStore(metadata::Database& db, vector::EmbeddingStore* embeddings,
                   KnowledgeStoreConfig config = {}, core::WorkerPool* background = nullptr);
    ~KnowledgeStore();

    KnowledgeStore(const KnowledgeStore&) = delete;
    KnowledgeStore& operator=(const KnowledgeStore&) = delete;

    /**
     * @brief Insert items, skipping ones that duplicate stored content.
     */
    Result<UpsertReport> upsert(OwnerId owner, const std::vector<KnowledgeItem>& items);

    /**
     * @brief Insert one item.
     * @return the new id, or AlreadyExists if it duplicates a stored item
     */
    Result<RowId> addItem(OwnerId owner, EntityType type, const std::string& content,
                          std::optional<KnowledgeMetadata> metadata = std::nullopt,
                          double confidence = 1.0);

    /**
     * @brief Change content and/or metadata. A content change triggers re-embedding.
     * @return false when the item does not exist for this owner or nothing was given
     */
    Result<bool> update(OwnerId owner, RowId id, std::optional<std::string> content,
                        std::optional<KnowledgeMetadata> metadata = std::nullopt);

    Result<bool> deleteItem(OwnerId owner, RowId id);

    /**
     * @brief Most recently created items of a type at or above minConfidence.
     */
    Result<std::vector<KnowledgeItem>> getByType(OwnerId owner, EntityType type, size_t limit = 50,
                                                 double minConfidence = 0.0);

    /**
     * @brief Facts whose metadata category equals `category`, newest first.
     */
    Result<std::vector<KnowledgeItem>> getFactsByCategory(OwnerId owner,
                                                          const std::string& category,
                                                          size_t limit = 50,
                                                          double minConfidence = 0.0);

    /**
     * @brief Fetch items by id, keeping the order of `ids`.
     */
    Result<std::vector<KnowledgeItem>> getByIds(OwnerId owner, const std::vector<RowId>& ids,
                                                double minConfidence = 0.0);

    Result<std::optional<KnowledgeItem>> get(OwnerId owner, RowId id);

    /**
     * @brief Ranked items for a query: vector search, then keyword search.
     * Empty when neither path finds anything.
     */
    Result<std::vector<KnowledgeItem>> search(OwnerId owner, EntityType type,
                                              const std::string& query, size_t limit,
                                              double minConfidence = 0.0);

    /**
     * @brief Set last_referenced_at to now for the given items.
     */
    Result<void> markReferenced(OwnerId owner, const std::vector<RowId>& ids);

    /**
     * @brief Set a goal's status ("active", "completed", "abandoned").
     */
    Result<bool> setGoalStatus(OwnerId owner, RowId id, const std::string& status);

    Result<bool> isDuplicate(OwnerId owner, EntityType type, const std::string& content);

    Result<int64_t> count(OwnerId owner, std::optional<EntityType> type = std::nullopt);

    /**
     * @brief Block until every scheduled embedding task has finished.
     */
    void waitForPendingEmbeddings();

    size_t pendingEmbeddings() const;
    uint64_t embeddingFailures() const { return embeddingFailures_.load(); }

private:
    Result<RowId> insertRow(OwnerId owner, const KnowledgeItem& item);
    void scheduleEmbedding(OwnerId owner, RowId id, EntityType type, std::string content);
    void embedNow(OwnerId owner, RowId id, EntityType type, const std::string& content);
    KnowledgeItem readRow(const metadata::Statement& stmt) const;

    metadata::Database& db_;
    vector::EmbeddingStore* embeddings_;
    KnowledgeStoreConfig config_;
    core::WorkerPool* background_;
    std::unique_ptr<search::KeywordSearch> keyword_;
    std::unique_ptr<search::FallbackSearch> search_;

    mutable std::mutex pendingMutex_;
    std::condition_variable pendingCv_;
    size_t pending_ = 0;
    std::atomic<uint64_t> embeddingFailures_{0};
};

} // namespace memex::knowledge
