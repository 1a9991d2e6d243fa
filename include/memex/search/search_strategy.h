#pragma once

#include <memex/core/types.h>
#include <memex/knowledge/knowledge_item.h>
#include <memory>
#include <string>
#include <vector>

namespace memex::vector {
class EmbeddingStore;
}

namespace memex::search {

class KeywordSearch;

/**
 * @brief Ranked knowledge-item ids for a query, most relevant first.
 *
 * Strategies never fail: an unavailable backend or an internal error yields
 * an empty list so the next strategy in a chain can answer.
 */
class ISearchStrategy {
public:
    virtual ~ISearchStrategy() = default;

    virtual std::vector<RowId> search(OwnerId owner, knowledge::EntityType type,
                                      const std::string& query, size_t limit) = 0;

    virtual std::string name() const = 0;
};

/// Nearest-neighbour lookup over the item embeddings
class VectorSearchStrategy : public ISearchStrategy {
public:
    VectorSearchStrategy(vector::EmbeddingStore& embeddings, bool recencyBoost);

    std::vector<RowId> search(OwnerId owner, knowledge::EntityType type, const std::string& query,
                              size_t limit) override;
    std::string name() const override { return "vector"; }

private:
    vector::EmbeddingStore& embeddings_;
    bool recencyBoost_;
};

/// BM25 full-text lookup
class KeywordSearchStrategy : public ISearchStrategy {
public:
    explicit KeywordSearchStrategy(KeywordSearch& keyword);

    std::vector<RowId> search(OwnerId owner, knowledge::EntityType type, const std::string& query,
                              size_t limit) override;
    std::string name() const override { return "keyword"; }

private:
    KeywordSearch& keyword_;
};

/**
 * @brief Tries each strategy in order and returns the first non-empty answer.
 */
class FallbackSearch : public ISearchStrategy {
public:
    explicit FallbackSearch(std::vector<std::shared_ptr<ISearchStrategy>> chain);

    std::vector<RowId> search(OwnerId owner, knowledge::EntityType type, const std::string& query,
                              size_t limit) override;
    std::string name() const override;

    struct Outcome {
        std::vector<RowId> ids;
        std::string servedBy; ///< "" when every strategy came back empty
    };

    Outcome run(OwnerId owner, knowledge::EntityType type, const std::string& query,
                size_t limit);

private:
    std::vector<std::shared_ptr<ISearchStrategy>> chain_;
};

} // namespace memex::search
