#pragma once

#include <memex/core/types.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace memex::metadata {
class Database;
class Statement;
} // namespace memex::metadata

namespace memex::indexing {

/**
 * @brief One stored slice of an indexed file
 */
struct FileChunk {
    RowId id = 0;
    std::string path;
    int chunkIndex = 0;
    std::string contentText;
    std::optional<RowId> embeddingId;
    /// Source file modification time, seconds since the epoch
    double fileMtime = 0.0;
    std::string indexedAt;
};

struct ChunkTableStats {
    int64_t files = 0;
    int64_t chunks = 0;
    int64_t embedded = 0;
    std::optional<std::string> lastIndexedAt;
};

/**
 * @brief Persistence for file_chunks. (path, chunk_index) is unique.
 */
class FileChunkStore {
public:
    explicit FileChunkStore(metadata::Database& db) : db_(db) {}

    /**
     * @brief Insert or replace the chunk at (path, chunkIndex).
     * @return the row id of the chunk
     */
    Result<RowId> saveChunk(const std::string& path, int chunkIndex, const std::string& text,
                            std::optional<RowId> embeddingId, double fileMtime);

    Result<void> attachEmbedding(RowId chunkId, RowId embeddingId);

    /**
     * @return number of rows removed
     */
    Result<int> deleteChunksForFile(const std::string& path);

    /**
     * @brief Remove chunks left over from a longer previous version of the file.
     */
    Result<int> deleteChunksAbove(const std::string& path, int maxChunkIndex);

    /**
     * @brief Every indexed path with its stored modification time.
     */
    Result<std::map<std::string, double>> indexedPaths();

    Result<std::vector<FileChunk>> chunksFor(const std::string& path);

    /**
     * @brief Fetch chunks by embedding id, keeping the order of `embeddingIds`.
     */
    Result<std::vector<FileChunk>> getByEmbeddingIds(const std::vector<RowId>& embeddingIds);

    /**
     * @brief Case-insensitive substring match on chunk text (ASCII folding).
     */
    Result<std::vector<FileChunk>> searchText(const std::string& query, size_t limit,
                                              const std::optional<std::string>& pathPrefix);

    Result<ChunkTableStats> stats();

private:
    static FileChunk readRow(const metadata::Statement& stmt);

    metadata::Database& db_;
};

} // namespace memex::indexing
