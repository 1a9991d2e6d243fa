#include <algorithm>
#include <iomanip>
#include <memex/cli/result_renderer.h>

namespace memex::cli {

namespace {

std::string oneLine(const std::string& text, size_t maxChars) {
    std::string out;
    out.reserve(std::min(text.size(), maxChars));
    bool space = false;
    for (char c : text) {
        if (out.size() >= maxChars) {
            out += "...";
            break;
        }
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!space && !out.empty()) {
                out.push_back(' ');
            }
            space = true;
            continue;
        }
        space = false;
        out.push_back(c);
    }
    return out;
}

} // namespace

json toJson(const knowledge::KnowledgeItem& item) {
    json j;
    j["id"] = item.id;
    j["type"] = knowledge::entityTypeName(item.type);
    j["content"] = item.content;
    j["metadata"] = json::parse(item.metadata.toJson(), nullptr, false);
    j["confidence"] = item.confidence;
    j["created_at"] = item.createdAt;
    j["updated_at"] = item.updatedAt;
    if (item.lastReferencedAt) {
        j["last_referenced_at"] = *item.lastReferencedAt;
    }
    j["embedded"] = item.embeddingId.has_value();
    return j;
}

json toJson(const indexing::FileSearchHit& hit) {
    json j;
    j["path"] = hit.path;
    j["chunk_index"] = hit.chunkIndex;
    j["text"] = hit.text;
    if (hit.score) {
        j["score"] = *hit.score;
    }
    return j;
}

json toJson(const indexing::IndexRunStats& stats) {
    json j;
    if (stats.disabled) {
        j["status"] = "disabled";
        return j;
    }
    j["files_indexed"] = stats.filesIndexed;
    j["chunks_created"] = stats.chunksCreated;
    j["files_removed"] = stats.filesRemoved;
    j["files_skipped"] = stats.filesSkipped;
    j["files_ineligible"] = stats.filesIneligible;
    j["errors"] = stats.errors;
    j["embedding_errors"] = stats.embeddingErrors;
    j["cancelled"] = stats.cancelled;
    j["elapsed_ms"] = stats.elapsed.count();
    return j;
}

json toJson(const indexing::IndexStatus& status) {
    json j;
    j["enabled"] = status.enabled;
    j["files_indexed"] = status.filesIndexed;
    j["total_chunks"] = status.totalChunks;
    j["embedded_chunks"] = status.embeddedChunks;
    j["last_indexed_at"] = status.lastIndexedAt ? json(*status.lastIndexedAt) : json(nullptr);
    json roots = json::array();
    for (const auto& r : status.roots) {
        roots.push_back(r.string());
    }
    j["roots"] = roots;
    j["extensions"] = status.extensions;
    j["vector_search"] = status.vectorSearch;
    return j;
}

void renderItems(std::ostream& out, const std::vector<knowledge::KnowledgeItem>& items) {
    if (items.empty()) {
        out << "(nothing stored)\n";
        return;
    }
    for (const auto& item : items) {
        out << "#" << item.id << " [" << knowledge::entityTypeName(item.type);
        if (auto cat = item.metadata.category()) {
            out << "/" << *cat;
        }
        if (auto status = item.metadata.status()) {
            out << "/" << *status;
        }
        out << "] " << item.content << " (" << std::fixed << std::setprecision(2)
            << item.confidence << ")\n";
        out.unsetf(std::ios::floatfield);
    }
}

void renderFileHits(std::ostream& out, const std::vector<indexing::FileSearchHit>& hits,
                    size_t excerptChars) {
    if (hits.empty()) {
        out << "No matches\n";
        return;
    }
    for (const auto& hit : hits) {
        out << hit.path << "#" << hit.chunkIndex;
        if (hit.score) {
            out << "  (distance " << std::fixed << std::setprecision(3) << *hit.score << ")";
            out.unsetf(std::ios::floatfield);
        }
        out << "\n    " << oneLine(hit.text, excerptChars) << "\n";
    }
}

void renderRunStats(std::ostream& out, const indexing::IndexRunStats& stats) {
    if (stats.disabled) {
        out << "File indexing is disabled\n";
        return;
    }
    out << "Indexed   : " << stats.filesIndexed << " files, " << stats.chunksCreated
        << " chunks\n";
    out << "Unchanged : " << stats.filesSkipped << "\n";
    out << "Removed   : " << stats.filesRemoved << "\n";
    out << "Ineligible: " << stats.filesIneligible << "\n";
    out << "Errors    : " << stats.errors;
    if (stats.embeddingErrors > 0) {
        out << " (+" << stats.embeddingErrors << " chunks without embeddings)";
    }
    out << "\n";
    if (stats.cancelled) {
        out << "Run was stopped before completion\n";
    }
    out << "Elapsed   : " << stats.elapsed.count() << " ms\n";
}

} // namespace memex::cli
