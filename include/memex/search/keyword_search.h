#pragma once

#include <memex/core/types.h>
#include <memex/knowledge/knowledge_item.h>
#include <optional>
#include <string>
#include <vector>

namespace memex::metadata {
class Database;
}

namespace memex::search {

struct KeywordHit {
    RowId id = 0;
    std::string content;
    double score = 0.0; ///< bm25(); lower is more relevant
};

/**
 * @brief Turn free text into a safe FTS5 MATCH expression.
 *
 * Whitespace-separated tokens starting with '-' are dropped, the rest are
 * quoted as phrases and OR-ed together, so punctuation in user text is never
 * read as query syntax. Returns "" when nothing survives.
 */
std::string sanitizeFtsQuery(const std::string& query);

/**
 * @brief BM25-ranked full-text lookup over knowledge items.
 *
 * Every method degrades to an empty result on failure (missing FTS5 table,
 * query error); the failure is logged at debug level only.
 */
class KeywordSearch {
public:
    explicit KeywordSearch(metadata::Database& db);

    bool available();

    std::vector<KeywordHit> searchKnowledge(OwnerId owner, knowledge::EntityType type,
                                            const std::string& query, size_t limit,
                                            std::optional<double> minConfidence = std::nullopt);

    std::vector<KeywordHit> searchFacts(OwnerId owner, const std::string& query,
                                        size_t limit = 5) {
        return searchKnowledge(owner, knowledge::EntityType::Fact, query, limit);
    }

    /// Active goals only
    std::vector<KeywordHit> searchGoals(OwnerId owner, const std::string& query,
                                        size_t limit = 3) {
        return searchKnowledge(owner, knowledge::EntityType::Goal, query, limit);
    }

private:
    metadata::Database& db_;
    std::optional<bool> available_;
};

} // namespace memex::search
