#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <future>
#include <iterator>
#include <system_error>
#include <unordered_map>
#include <memex/config/config_helpers.h>
#include <memex/core/utf8.h>
#include <memex/indexing/file_indexer.h>
#include <memex/metadata/database.h>
#include <memex/vector/embedding_store.h>

namespace memex::indexing {

namespace fs = std::filesystem;

namespace {

Result<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::PermissionDenied, "Cannot open " + path.string()};
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::CorruptedData, "Read failed for " + path.string()};
    }
    return content;
}

} // namespace

std::vector<fs::path> FileIndexerConfig::defaultRoots() {
    return {config::expand_tilde("~/Projects"), config::expand_tilde("~/Documents")};
}

Result<double> fileMtimeSeconds(const fs::path& path) {
    std::error_code ec;
    auto ft = fs::last_write_time(path, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound, ec.message()};
    }
    auto sys = std::chrono::file_clock::to_sys(ft);
    return std::chrono::duration<double>(sys.time_since_epoch()).count();
}

FileIndexer::FileIndexer(metadata::Database& db, vector::EmbeddingStore* embeddings,
                         FileIndexerConfig config)
    : db_(db), embeddings_(embeddings), config_(std::move(config)), chunks_(db) {}

Result<IndexRunStats> FileIndexer::runIncremental() {
    std::unique_lock<std::mutex> running(runMutex_, std::try_to_lock);
    if (!running.owns_lock()) {
        return Error{ErrorCode::InvalidState, "An index run is already in progress"};
    }

    IndexRunStats stats;
    if (!config_.enabled) {
        stats.disabled = true;
        return stats;
    }
    stopRequested_.store(false);
    const auto started = std::chrono::steady_clock::now();

    auto known = chunks_.indexedPaths();
    if (!known) {
        return known.error();
    }

    std::set<std::string> seen;
    for (const auto& root : config_.roots) {
        if (stopRequested_.load()) {
            break;
        }
        walkRoot(root, known.value(), seen, stats);
    }

    if (stopRequested_.load()) {
        stats.cancelled = true;
        spdlog::info("Index run stopped early; skipping removal sweep");
    } else {
        for (const auto& [path, mtime] : known.value()) {
            (void)mtime;
            if (seen.count(path) != 0) {
                continue;
            }
            auto removed = chunks_.deleteChunksForFile(path);
            if (!removed) {
                ++stats.errors;
                spdlog::warn("Failed to remove chunks for {}: {}", path, removed.error().message);
                continue;
            }
            ++stats.filesRemoved;
            spdlog::debug("Removed {} chunks for vanished file {}", removed.value(), path);
        }
    }

    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::info("Index run: {} indexed, {} chunks, {} removed, {} unchanged, {} errors in {}ms",
                 stats.filesIndexed, stats.chunksCreated, stats.filesRemoved, stats.filesSkipped,
                 stats.errors, stats.elapsed.count());
    return stats;
}

void FileIndexer::walkRoot(const fs::path& root, const std::map<std::string, double>& known,
                           std::set<std::string>& seen, IndexRunStats& stats) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        spdlog::debug("Index root {} is not a directory, skipping", root.string());
        return;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        ++stats.errors;
        spdlog::warn("Cannot walk {}: {}", root.string(), ec.message());
        return;
    }

    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            ++stats.errors;
            spdlog::debug("Walk error under {}: {}", root.string(), ec.message());
            ec.clear();
            continue;
        }
        if (stopRequested_.load()) {
            return;
        }

        const auto& entry = *it;
        std::error_code typeEc;
        if (entry.is_directory(typeEc)) {
            if (shouldSkipDir(entry.path().filename().string(), config_.filters)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(typeEc)) {
            continue;
        }

        const fs::path& path = entry.path();
        std::error_code sizeEc;
        const auto size = entry.file_size(sizeEc);
        if (sizeEc) {
            ++stats.errors;
            continue;
        }
        if (auto reason = checkEligibility(path, size, config_.filters)) {
            ++stats.filesIneligible;
            spdlog::trace("Skipping {} ({})", path.string(), skipReasonName(*reason));
            continue;
        }

        const std::string key = path.string();
        seen.insert(key);

        try {
            auto mtime = fileMtimeSeconds(path);
            if (!mtime) {
                ++stats.errors;
                continue;
            }
            auto prev = known.find(key);
            if (prev != known.end() &&
                std::abs(prev->second - mtime.value()) < config_.mtimeTolerance) {
                ++stats.filesSkipped;
                continue;
            }

            auto outcome = indexOne(path, mtime.value());
            if (!outcome) {
                ++stats.errors;
                spdlog::warn("Failed to index {}: {}", key, outcome.error().message);
                continue;
            }
            const auto& o = outcome.value();
            stats.embeddingErrors += o.embeddingErrors;
            if (o.ineligible) {
                ++stats.filesIneligible;
            }
            if (o.dropped) {
                ++stats.filesRemoved;
            }
            if (o.chunks > 0) {
                ++stats.filesIndexed;
                stats.chunksCreated += o.chunks;
            }
        } catch (const std::exception& e) {
            ++stats.errors;
            spdlog::warn("Failed to index {}: {}", key, e.what());
        }
    }
}

Result<FileIndexer::FileOutcome> FileIndexer::indexOne(const fs::path& path, double mtime) {
    FileOutcome outcome;
    const std::string key = path.string();

    auto content = readFile(path);
    if (!content) {
        return content.error();
    }

    std::vector<std::string> pieces;
    if (looksBinary(content.value(), config_.filters.binarySniffBytes)) {
        outcome.ineligible = true;
    } else {
        pieces = chunkText(utf8::sanitize(content.value()), config_.chunking);
    }

    if (pieces.empty()) {
        auto removed = chunks_.deleteChunksForFile(key);
        if (!removed) {
            return removed.error();
        }
        outcome.dropped = removed.value() > 0;
        return outcome;
    }

    // Fan the chunk embeddings out to the pool, then write in chunk order
    const bool embed = embeddings_ != nullptr && embeddings_->canEmbed();
    std::vector<std::future<Result<std::vector<float>>>> pending;
    std::vector<std::string> prefixes;
    if (embed) {
        pending.reserve(pieces.size());
        prefixes.reserve(pieces.size());
        for (const auto& piece : pieces) {
            prefixes.push_back(utf8::prefix(piece, config_.embedPrefixChars));
            pending.push_back(embeddings_->embedAsync(prefixes.back()));
        }
    }

    for (size_t i = 0; i < pieces.size(); ++i) {
        const int index = static_cast<int>(i);
        auto chunkId = chunks_.saveChunk(key, index, pieces[i], std::nullopt, mtime);
        if (!chunkId) {
            return chunkId.error();
        }
        ++outcome.chunks;
        if (!embed) {
            continue;
        }

        Result<std::vector<float>> vec = Error{ErrorCode::Unknown, "not run"};
        try {
            vec = pending[i].get();
        } catch (const std::exception& e) {
            vec = Error{ErrorCode::InternalError, e.what()};
        }
        if (!vec) {
            ++outcome.embeddingErrors;
            spdlog::warn("Embedding failed for {}#{}: {}", key, index, vec.error().message);
            continue;
        }
        auto embeddingId = embeddings_->storeEmbedding(kFileChunkOwner, kFileChunkSourceType,
                                                       chunkId.value(), prefixes[i], vec.value());
        if (!embeddingId) {
            ++outcome.embeddingErrors;
            spdlog::warn("Storing embedding for {}#{} failed: {}", key, index,
                         embeddingId.error().message);
            continue;
        }
        if (auto attached = chunks_.attachEmbedding(chunkId.value(), embeddingId.value());
            !attached) {
            ++outcome.embeddingErrors;
            spdlog::warn("Linking embedding for {}#{} failed: {}", key, index,
                         attached.error().message);
        }
    }

    auto surplus = chunks_.deleteChunksAbove(key, static_cast<int>(pieces.size()) - 1);
    if (!surplus) {
        return surplus.error();
    }
    if (surplus.value() > 0) {
        spdlog::debug("Dropped {} trailing chunks of {}", surplus.value(), key);
    }
    return outcome;
}

Result<size_t> FileIndexer::indexFile(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::FileNotFound, path.string() + ": " + ec.message()};
    }
    if (auto reason = checkEligibility(path, size, config_.filters)) {
        spdlog::debug("{} is not indexable ({})", path.string(), skipReasonName(*reason));
        auto removed = chunks_.deleteChunksForFile(path.string());
        if (!removed) {
            return removed.error();
        }
        return size_t{0};
    }
    auto mtime = fileMtimeSeconds(path);
    if (!mtime) {
        return mtime.error();
    }
    auto outcome = indexOne(path, mtime.value());
    if (!outcome) {
        return outcome.error();
    }
    return outcome.value().chunks;
}

Result<std::vector<FileSearchHit>>
FileIndexer::vectorSearch(const std::string& query, size_t limit,
                          const std::optional<std::string>& prefix) {
    std::vector<FileSearchHit> hits;
    auto vec = embeddings_->embed(query);
    if (!vec) {
        return vec.error();
    }
    vector::VectorFilter filter;
    filter.owner = kFileChunkOwner;
    filter.sourceType = kFileChunkSourceType;
    filter.pathPrefix = prefix;
    auto similar = embeddings_->searchByVector(vec.value(), filter, limit);
    if (!similar) {
        return similar.error();
    }
    if (similar.value().empty()) {
        return hits;
    }

    std::vector<RowId> ids;
    std::unordered_map<RowId, double> distance;
    for (const auto& hit : similar.value()) {
        ids.push_back(hit.embeddingId);
        distance.emplace(hit.embeddingId, hit.distance);
    }
    auto rows = chunks_.getByEmbeddingIds(ids);
    if (!rows) {
        return rows.error();
    }
    for (auto& chunk : rows.value()) {
        FileSearchHit hit;
        hit.path = std::move(chunk.path);
        hit.chunkIndex = chunk.chunkIndex;
        hit.text = std::move(chunk.contentText);
        hit.score = distance[*chunk.embeddingId];
        hits.push_back(std::move(hit));
    }
    return hits;
}

Result<std::vector<FileSearchHit>>
FileIndexer::search(const std::string& query, size_t limit,
                    const std::optional<std::string>& pathFilter) {
    std::vector<FileSearchHit> hits;
    if (!config_.enabled || limit == 0) {
        return hits;
    }
    std::optional<std::string> prefix;
    if (pathFilter && !pathFilter->empty()) {
        prefix = config::expand_tilde(*pathFilter).string();
    }

    if (embeddings_ && embeddings_->vectorSearchAvailable()) {
        auto semantic = vectorSearch(query, limit, prefix);
        if (semantic && !semantic.value().empty()) {
            return semantic;
        }
        if (!semantic) {
            spdlog::debug("Vector search over files failed, using substring match: {}",
                          semantic.error().message);
        }
    }

    auto rows = chunks_.searchText(query, limit, prefix);
    if (!rows) {
        return rows.error();
    }
    for (auto& chunk : rows.value()) {
        FileSearchHit hit;
        hit.path = std::move(chunk.path);
        hit.chunkIndex = chunk.chunkIndex;
        hit.text = std::move(chunk.contentText);
        hits.push_back(std::move(hit));
    }
    return hits;
}

Result<IndexStatus> FileIndexer::getStatus() {
    IndexStatus status;
    status.enabled = config_.enabled;
    status.roots = config_.roots;
    status.extensions = config_.filters.extensions;
    status.vectorSearch = embeddings_ != nullptr && embeddings_->vectorSearchAvailable();
    auto stats = chunks_.stats();
    if (!stats) {
        return stats.error();
    }
    status.filesIndexed = stats.value().files;
    status.totalChunks = stats.value().chunks;
    status.embeddedChunks = stats.value().embedded;
    status.lastIndexedAt = stats.value().lastIndexedAt;
    return status;
}

} // namespace memex::indexing
