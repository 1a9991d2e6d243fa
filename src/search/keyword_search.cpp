#include <spdlog/spdlog.h>
#include <sstream>
#include <memex/metadata/database.h>
#include <memex/search/keyword_search.h>

namespace memex::search {

std::string sanitizeFtsQuery(const std::string& query) {
    std::istringstream in(query);
    std::string token;
    std::string out;
    while (in >> token) {
        if (token.front() == '-') {
            continue;
        }
        std::string quoted = "\"";
        for (char c : token) {
            if (c == '"') {
                quoted += "\"\"";
            } else {
                quoted += c;
            }
        }
        quoted += '"';
        if (!out.empty()) {
            out += " OR ";
        }
        out += quoted;
    }
    return out;
}

KeywordSearch::KeywordSearch(metadata::Database& db) : db_(db) {}

bool KeywordSearch::available() {
    if (!available_) {
        auto exists = db_.tableExists("knowledge_fts");
        available_ = exists && exists.value();
        if (!*available_) {
            spdlog::debug("knowledge_fts missing; keyword search disabled");
        }
    }
    return *available_;
}

std::vector<KeywordHit> KeywordSearch::searchKnowledge(OwnerId owner, knowledge::EntityType type,
                                                       const std::string& query, size_t limit,
                                                       std::optional<double> minConfidence) {
    std::vector<KeywordHit> hits;
    const auto match = sanitizeFtsQuery(query);
    if (match.empty() || limit == 0 || !available()) {
        return hits;
    }

    std::string sql = "SELECT k.id, k.content, bm25(knowledge_fts) AS score "
                      "FROM knowledge_fts JOIN knowledge k ON k.id = knowledge_fts.rowid "
                      "WHERE knowledge_fts MATCH ? AND k.owner_id = ? AND k.entity_type = ? ";
    if (type == knowledge::EntityType::Goal) {
        sql += "AND COALESCE(json_extract(k.metadata, '$.status'), 'active') = 'active' ";
    }
    if (minConfidence) {
        sql += "AND k.confidence >= ? ";
    }
    sql += "ORDER BY score ASC LIMIT ?";

    auto guard = db_.acquire();
    auto stmt = db_.prepare(sql);
    if (!stmt) {
        spdlog::debug("Keyword search prepare failed: {}", stmt.error().message);
        return hits;
    }
    auto& s = stmt.value();
    int idx = 1;
    bool bound = s.bind(idx++, match) && s.bind(idx++, static_cast<int64_t>(owner)) &&
                 s.bind(idx++, knowledge::entityTypeName(type));
    if (bound && minConfidence) {
        bound = static_cast<bool>(s.bind(idx++, *minConfidence));
    }
    bound = bound && s.bind(idx++, static_cast<int64_t>(limit));
    if (!bound) {
        spdlog::debug("Keyword search bind failed");
        return hits;
    }

    while (true) {
        auto step = s.step();
        if (!step) {
            spdlog::debug("Keyword search failed for '{}': {}", query, step.error().message);
            return {};
        }
        if (!step.value()) {
            break;
        }
        hits.push_back(KeywordHit{s.getInt64(0), s.getString(1), s.getDouble(2)});
    }
    return hits;
}

} // namespace memex::search
