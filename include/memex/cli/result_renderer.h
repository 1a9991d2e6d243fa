#pragma once

#include <nlohmann/json.hpp>
#include <memex/indexing/file_indexer.h>
#include <memex/knowledge/knowledge_item.h>
#include <ostream>
#include <string>
#include <vector>

namespace memex::cli {

using json = nlohmann::json;

json toJson(const knowledge::KnowledgeItem& item);
json toJson(const indexing::FileSearchHit& hit);
json toJson(const indexing::IndexRunStats& stats);
json toJson(const indexing::IndexStatus& status);

/**
 * @brief One line per item: "#id [type] content (confidence)"
 */
void renderItems(std::ostream& out, const std::vector<knowledge::KnowledgeItem>& items);

/**
 * @brief Path, chunk index, optional distance and a single-line excerpt per hit
 */
void renderFileHits(std::ostream& out, const std::vector<indexing::FileSearchHit>& hits,
                    size_t excerptChars = 160);

void renderRunStats(std::ostream& out, const indexing::IndexRunStats& stats);

} // namespace memex::cli
