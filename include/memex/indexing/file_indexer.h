#pragma once

#include <memex/core/types.h>
#include <memex/indexing/file_chunk_store.h>
#include <memex/indexing/file_filters.h>
#include <memex/indexing/text_chunker.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace memex::metadata {
class Database;
}
namespace memex::vector {
class EmbeddingStore;
}

namespace memex::indexing {

/// source_type of file chunk embeddings
inline constexpr const char* kFileChunkSourceType = "file_chunk";
/// File chunks are shared across owners and stored under owner 0
inline constexpr OwnerId kFileChunkOwner = 0;

struct FileIndexerConfig {
    bool enabled = true;
    std::vector<std::filesystem::path> roots = defaultRoots();
    FileFilterConfig filters;
    ChunkingConfig chunking;
    /// Stored and current mtimes closer than this are treated as unchanged
    double mtimeTolerance = 1.0;
    /// Only this many leading bytes of a chunk are embedded
    size_t embedPrefixChars = 500;

    /// ~/Projects and ~/Documents
    static std::vector<std::filesystem::path> defaultRoots();
};

/**
 * @brief Counters for one incremental run
 */
struct IndexRunStats {
    size_t filesIndexed = 0;
    size_t chunksCreated = 0;
    size_t filesRemoved = 0;
    /// Unchanged since the previous run
    size_t filesSkipped = 0;
    /// Rejected by extension, sensitivity, size or binary checks
    size_t filesIneligible = 0;
    size_t errors = 0;
    /// Chunks stored without a vector because embedding failed
    size_t embeddingErrors = 0;
    bool cancelled = false;
    bool disabled = false;
    std::chrono::milliseconds elapsed{0};
};

struct FileSearchHit {
    std::string path;
    int chunkIndex = 0;
    std::string text;
    /// Cosine distance when served by vector search; absent for substring matches
    std::optional<double> score;
};

struct IndexStatus {
    bool enabled = true;
    int64_t filesIndexed = 0;
    int64_t totalChunks = 0;
    int64_t embeddedChunks = 0;
    std::optional<std::string> lastIndexedAt;
    std::vector<std::filesystem::path> roots;
    std::vector<std::string> extensions;
    bool vectorSearch = false;
};

/**
 * @brief Incremental indexer over local text files.
 *
 * Each run walks every root, re-chunks files whose mtime changed, and drops
 * chunks of files that disappeared or are no longer eligible. Chunk
 * embeddings are computed on the embedding pool; a failed embedding leaves
 * the chunk searchable by substring only. Per-file failures are counted and
 * never abort the run.
 */
class FileIndexer {
public:
    FileIndexer(metadata::Database& db, vector::EmbeddingStore* embeddings,
                FileIndexerConfig config = {});

    FileIndexer(const FileIndexer&) = delete;
    FileIndexer& operator=(const FileIndexer&) = delete;

    /**
     * @brief Walk all roots once. Fails with InvalidState if a run is already in progress.
     */
    Result<IndexRunStats> runIncremental();

    /**
     * @brief Ask a running walk to stop before its next file. Files already
     * started are finished and the removal sweep is skipped.
     */
    void requestStop() { stopRequested_.store(true); }
    bool stopRequested() const { return stopRequested_.load(); }

    /**
     * @brief Re-index one file regardless of its stored mtime.
     * @return number of chunks written (0 when the file is ineligible and was dropped)
     */
    Result<size_t> indexFile(const std::filesystem::path& path);

    /**
     * @brief Semantic search over chunks, falling back to substring match.
     * @param pathFilter optional path prefix; "~" is expanded
     */
    Result<std::vector<FileSearchHit>> search(const std::string& query, size_t limit = 5,
                                              const std::optional<std::string>& pathFilter = {});

    Result<IndexStatus> getStatus();

    const FileIndexerConfig& config() const { return config_; }

private:
    struct FileOutcome {
        size_t chunks = 0;
        size_t embeddingErrors = 0;
        bool ineligible = false;
        bool dropped = false;
    };

    Result<FileOutcome> indexOne(const std::filesystem::path& path, double mtime);
    void walkRoot(const std::filesystem::path& root, const std::map<std::string, double>& known,
                  std::set<std::string>& seen, IndexRunStats& stats);
    Result<std::vector<FileSearchHit>> vectorSearch(const std::string& query, size_t limit,
                                                    const std::optional<std::string>& prefix);

    metadata::Database& db_;
    vector::EmbeddingStore* embeddings_;
    FileIndexerConfig config_;
    FileChunkStore chunks_;
    std::mutex runMutex_;
    std::atomic<bool> stopRequested_{false};
};

/**
 * @brief Modification time of `path` in seconds since the epoch.
 */
Result<double> fileMtimeSeconds(const std::filesystem::path& path);

} // namespace memex::indexing
