#include <spdlog/spdlog.h>
#include <memex/search/keyword_search.h>
#include <memex/search/search_strategy.h>
#include <memex/vector/embedding_store.h>

namespace memex::search {

VectorSearchStrategy::VectorSearchStrategy(vector::EmbeddingStore& embeddings, bool recencyBoost)
    : embeddings_(embeddings), recencyBoost_(recencyBoost) {}

std::vector<RowId> VectorSearchStrategy::search(OwnerId owner, knowledge::EntityType type,
                                                const std::string& query, size_t limit) {
    std::vector<RowId> ids;
    if (!embeddings_.vectorSearchAvailable()) {
        return ids;
    }
    auto hits = embeddings_.searchSimilarForType(owner, query, knowledge::sourceTypeFor(type),
                                                 limit, recencyBoost_);
    if (!hits) {
        spdlog::debug("Vector search failed: {}", hits.error().message);
        return ids;
    }
    for (const auto& hit : hits.value()) {
        if (hit.sourceId > 0) {
            ids.push_back(hit.sourceId);
        }
    }
    return ids;
}

KeywordSearchStrategy::KeywordSearchStrategy(KeywordSearch& keyword) : keyword_(keyword) {}

std::vector<RowId> KeywordSearchStrategy::search(OwnerId owner, knowledge::EntityType type,
                                                 const std::string& query, size_t limit) {
    std::vector<RowId> ids;
    for (const auto& hit : keyword_.searchKnowledge(owner, type, query, limit)) {
        ids.push_back(hit.id);
    }
    return ids;
}

FallbackSearch::FallbackSearch(std::vector<std::shared_ptr<ISearchStrategy>> chain)
    : chain_(std::move(chain)) {}

FallbackSearch::Outcome FallbackSearch::run(OwnerId owner, knowledge::EntityType type,
                                            const std::string& query, size_t limit) {
    for (const auto& strategy : chain_) {
        if (!strategy) {
            continue;
        }
        auto ids = strategy->search(owner, type, query, limit);
        if (!ids.empty()) {
            return Outcome{std::move(ids), strategy->name()};
        }
    }
    return {};
}

std::vector<RowId> FallbackSearch::search(OwnerId owner, knowledge::EntityType type,
                                          const std::string& query, size_t limit) {
    return run(owner, type, query, limit).ids;
}

std::string FallbackSearch::name() const {
    std::string out;
    for (const auto& strategy : chain_) {
        if (!strategy) {
            continue;
        }
        if (!out.empty()) {
            out += "->";
        }
        out += strategy->name();
    }
    return out;
}

} // namespace memex::search
