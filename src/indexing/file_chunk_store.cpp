#include <unordered_map>
#include <memex/indexing/file_chunk_store.h>
#include <memex/metadata/database.h>
#include <memex/metadata/query_helpers.h>

namespace memex::indexing {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, path, chunk_index, content_text, embedding_id, file_mtime, indexed_at "
    "FROM file_chunks ";

} // namespace

FileChunk FileChunkStore::readRow(const metadata::Statement& s) {
    FileChunk chunk;
    chunk.id = s.getInt64(0);
    chunk.path = s.getString(1);
    chunk.chunkIndex = static_cast<int>(s.getInt64(2));
    chunk.contentText = s.getString(3);
    if (!s.isNull(4)) {
        chunk.embeddingId = s.getInt64(4);
    }
    chunk.fileMtime = s.getDouble(5);
    chunk.indexedAt = s.getString(6);
    return chunk;
}

Result<RowId> FileChunkStore::saveChunk(const std::string& path, int chunkIndex,
                                        const std::string& text,
                                        std::optional<RowId> embeddingId, double fileMtime) {
    auto guard = db_.acquire();
    auto stmt = db_.prepare(R"(
        INSERT INTO file_chunks (path, chunk_index, content_text, embedding_id, file_mtime)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(path, chunk_index) DO UPDATE SET
            content_text = excluded.content_text,
            embedding_id = excluded.embedding_id,
            file_mtime = excluded.file_mtime,
            indexed_at = datetime('now')
        RETURNING id
    )");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    std::optional<int64_t> embedding;
    if (embeddingId) {
        embedding = static_cast<int64_t>(*embeddingId);
    }
    if (auto b = s.bindAll(path, chunkIndex, text, embedding, fileMtime); !b) {
        return b.error();
    }
    auto row = s.step();
    if (!row) {
        return row.error();
    }
    if (!row.value()) {
        return Error{ErrorCode::DatabaseError, "Chunk upsert returned no row for " + path};
    }
    return static_cast<RowId>(s.getInt64(0));
}

Result<void> FileChunkStore::attachEmbedding(RowId chunkId, RowId embeddingId) {
    auto guard = db_.acquire();
    auto stmt = db_.prepare("UPDATE file_chunks SET embedding_id = ? WHERE id = ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bindAll(static_cast<int64_t>(embeddingId), static_cast<int64_t>(chunkId)); !b) {
        return b;
    }
    return s.execute();
}

Result<int> FileChunkStore::deleteChunksForFile(const std::string& path) {
    auto guard = db_.acquire();
    auto stmt = db_.prepare("DELETE FROM file_chunks WHERE path = ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bind(1, path); !b) {
        return b.error();
    }
    if (auto r = s.execute(); !r) {
        return r.error();
    }
    return db_.changes();
}

Result<int> FileChunkStore::deleteChunksAbove(const std::string& path, int maxChunkIndex) {
    auto guard = db_.acquire();
    auto stmt = db_.prepare("DELETE FROM file_chunks WHERE path = ? AND chunk_index > ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bindAll(path, maxChunkIndex); !b) {
        return b.error();
    }
    if (auto r = s.execute(); !r) {
        return r.error();
    }
    return db_.changes();
}

Result<std::map<std::string, double>> FileChunkStore::indexedPaths() {
    auto guard = db_.acquire();
    auto stmt = db_.prepare("SELECT path, MAX(file_mtime) FROM file_chunks GROUP BY path");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    std::map<std::string, double> paths;
    while (true) {
        auto row = s.step();
        if (!row) {
            return row.error();
        }
        if (!row.value()) {
            break;
        }
        paths.emplace(s.getString(0), s.getDouble(1));
    }
    return paths;
}

Result<std::vector<FileChunk>> FileChunkStore::chunksFor(const std::string& path) {
    auto guard = db_.acquire();
    auto stmt = db_.prepare(std::string(kSelectColumns) + "WHERE path = ? ORDER BY chunk_index");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bind(1, path); !b) {
        return b.error();
    }
    std::vector<FileChunk> chunks;
    while (true) {
        auto row = s.step();
        if (!row) {
            return row.error();
        }
        if (!row.value()) {
            break;
        }
        chunks.push_back(readRow(s));
    }
    return chunks;
}

Result<std::vector<FileChunk>>
FileChunkStore::getByEmbeddingIds(const std::vector<RowId>& embeddingIds) {
    std::vector<FileChunk> ordered;
    if (embeddingIds.empty()) {
        return ordered;
    }
    std::unordered_map<RowId, FileChunk> byEmbedding;
    {
        auto guard = db_.acquire();
        auto stmt = db_.prepare(std::string(kSelectColumns) + "WHERE embedding_id IN (" +
                                metadata::sql::placeholders(embeddingIds.size()) + ")");
        if (!stmt) {
            return stmt.error();
        }
        auto& s = stmt.value();
        int idx = 1;
        for (RowId id : embeddingIds) {
            if (auto b = s.bind(idx++, static_cast<int64_t>(id)); !b) {
                return b.error();
            }
        }
        while (true) {
            auto row = s.step();
            if (!row) {
                return row.error();
            }
            if (!row.value()) {
                break;
            }
            auto chunk = readRow(s);
            byEmbedding.emplace(*chunk.embeddingId, std::move(chunk));
        }
    }
    for (RowId id : embeddingIds) {
        auto it = byEmbedding.find(id);
        if (it != byEmbedding.end()) {
            ordered.push_back(std::move(it->second));
            byEmbedding.erase(it);
        }
    }
    return ordered;
}

Result<std::vector<FileChunk>>
FileChunkStore::searchText(const std::string& query, size_t limit,
                           const std::optional<std::string>& pathPrefix) {
    std::vector<FileChunk> chunks;
    if (query.empty() || limit == 0) {
        return chunks;
    }
    std::string sql =
        std::string(kSelectColumns) + "WHERE content_text LIKE ? ESCAPE '\\' ";
    if (pathPrefix) {
        sql += "AND path LIKE ? ESCAPE '\\' ";
    }
    sql += "ORDER BY path, chunk_index LIMIT ?";

    auto guard = db_.acquire();
    auto stmt = db_.prepare(sql);
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    int idx = 1;
    if (auto b = s.bind(idx++, metadata::sql::containsPattern(query)); !b) {
        return b.error();
    }
    if (pathPrefix) {
        if (auto b = s.bind(idx++, metadata::sql::prefixPattern(*pathPrefix)); !b) {
            return b.error();
        }
    }
    if (auto b = s.bind(idx++, static_cast<int64_t>(limit)); !b) {
        return b.error();
    }
    while (true) {
        auto row = s.step();
        if (!row) {
            return row.error();
        }
        if (!row.value()) {
            break;
        }
        chunks.push_back(readRow(s));
    }
    return chunks;
}

Result<ChunkTableStats> FileChunkStore::stats() {
    auto guard = db_.acquire();
    auto stmt = db_.prepare("SELECT COUNT(DISTINCT path), COUNT(*), COUNT(embedding_id), "
                            "MAX(indexed_at) FROM file_chunks");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    auto row = s.step();
    if (!row) {
        return row.error();
    }
    ChunkTableStats stats;
    if (row.value()) {
        stats.files = s.getInt64(0);
        stats.chunks = s.getInt64(1);
        stats.embedded = s.getInt64(2);
        if (!s.isNull(3)) {
            stats.lastIndexedAt = s.getString(3);
        }
    }
    return stats;
}

} // namespace memex::indexing
