#pragma once

#include <memex/core/types.h>
#include <memex/vector/vector_index.h>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace memex::metadata {
class Database;
}

namespace memex::vector {

class VectorEncoder;

/**
 * @brief A persisted embedding row (the vector itself lives in the index)
 */
struct EmbeddingRecord {
    RowId id = 0;
    OwnerId owner = 0;
    std::string sourceType;
    RowId sourceId = 0;
    std::string contentText;
    std::string modelName;
    std::string createdAt;
};

struct SimilarityHit {
    RowId embeddingId = 0;
    std::string sourceType;
    RowId sourceId = 0;
    std::string contentText;
    double distance = 0.0;
};

/**
 * @brief Distance multiplier for an item last referenced `ageDays` ago.
 * Within 30 days 0.8, within 90 days 1.0, older 1.2; unknown age is neutral.
 */
double recencyFactor(std::optional<double> ageDays);

/**
 * @brief Embedding persistence and nearest-neighbour retrieval.
 *
 * Rows in `embeddings` are always written. Vectors are mirrored into the
 * IVectorIndex when one is available; an index write failure is logged and
 * does not fail the upsert. Without an index every search returns empty and
 * callers fall back to keyword search.
 */
class EmbeddingStore {
public:
    EmbeddingStore(metadata::Database& db, std::shared_ptr<VectorEncoder> encoder,
                   std::unique_ptr<IVectorIndex> index = nullptr);
    ~EmbeddingStore();

    EmbeddingStore(const EmbeddingStore&) = delete;
    EmbeddingStore& operator=(const EmbeddingStore&) = delete;

    /**
     * @brief Build a store, attaching sqlite-vec when it can be loaded.
     * A missing or dimension-incompatible index is not an error.
     */
    static std::unique_ptr<EmbeddingStore> create(metadata::Database& db,
                                                  std::shared_ptr<VectorEncoder> encoder);

    bool vectorSearchAvailable() const { return index_ != nullptr && encoder_ != nullptr; }
    bool canEmbed() const { return encoder_ != nullptr; }

    /**
     * @brief Embed `text` and persist it, returning the new embedding id.
     */
    Result<RowId> upsertEmbedding(OwnerId owner, const std::string& sourceType, RowId sourceId,
                                  const std::string& text);

    /**
     * @brief Persist an already computed vector.
     */
    Result<RowId> storeEmbedding(OwnerId owner, const std::string& sourceType, RowId sourceId,
                                 const std::string& text, const std::vector<float>& vector);

    Result<std::vector<float>> embed(const std::string& text);

    /**
     * @brief Start encoding on the embedding pool; the future is ready immediately
     * with NotInitialized when no encoder is configured.
     */
    std::future<Result<std::vector<float>>> embedAsync(std::string text);

    Result<std::vector<SimilarityHit>> searchSimilar(OwnerId owner, const std::string& query,
                                                     size_t limit);

    Result<std::vector<SimilarityHit>> searchSimilarForType(OwnerId owner,
                                                            const std::string& query,
                                                            const std::string& sourceType,
                                                            size_t limit,
                                                            bool recencyBoost = false);

    /**
     * @brief Search with a precomputed query vector and an arbitrary filter.
     */
    Result<std::vector<SimilarityHit>> searchByVector(const std::vector<float>& query,
                                                      const VectorFilter& filter, size_t limit,
                                                      bool recencyBoost = false);

    Result<std::optional<EmbeddingRecord>> get(RowId embeddingId);

    Result<void> remove(RowId embeddingId);

    /**
     * @brief Delete embeddings no knowledge item or file chunk references.
     * Rows younger than `graceSeconds` are kept so in-flight writers can attach them.
     * @return number of rows removed
     */
    Result<size_t> collectOrphans(int64_t graceSeconds = 3600);

    /**
     * @brief Re-populate the vector index from the stored vectors.
     * @return number of vectors written
     */
    Result<size_t> rebuildIndex();

    Result<int64_t> count(std::optional<OwnerId> owner = std::nullopt);

    size_t dimension() const;
    std::string indexName() const { return index_ ? index_->name() : "none"; }
    uint64_t indexWriteFailures() const { return indexWriteFailures_.load(); }

private:
    Result<std::vector<SimilarityHit>> hydrate(const std::vector<VectorMatch>& matches,
                                               bool recencyBoost, size_t limit);

    metadata::Database& db_;
    std::shared_ptr<VectorEncoder> encoder_;
    std::unique_ptr<IVectorIndex> index_;
    std::atomic<uint64_t> indexWriteFailures_{0};
};

} // namespace memex::vector
