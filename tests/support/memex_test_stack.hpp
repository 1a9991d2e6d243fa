#pragma once

#include <memex/core/worker_pool.h>
#include <memex/metadata/database.h>
#include <memex/metadata/migration.h>
#include <memex/metadata/query_helpers.h>
#include <memex/vector/embedding_store.h>
#include <memex/vector/vector_codec.h>
#include <memex/vector/vector_encoder.h>
#include <memex/vector/vector_index.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>

namespace memex::test_support {

// Exact nearest-neighbour index kept in memory. Owner, type and path filters
// are resolved against the store tables the same way the sqlite-vec index does.
class InMemoryVectorIndex : public vector::IVectorIndex {
public:
    explicit InMemoryVectorIndex(metadata::Database& db) : db_(db) {}

    Result<void> initialize(size_t dimension) override {
        dimension_ = dimension;
        return {};
    }

    size_t dimension() const override { return dimension_; }

    Result<void> upsert(RowId id, std::span<const float> v) override {
        if (failWrites.load()) {
            return Error{ErrorCode::DatabaseError, "index write refused"};
        }
        if (v.size() != dimension_) {
            return Error{ErrorCode::InvalidData, "dimension mismatch"};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        vectors_[id] = std::vector<float>(v.begin(), v.end());
        return {};
    }

    Result<void> remove(RowId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        vectors_.erase(id);
        return {};
    }

    Result<std::vector<vector::VectorMatch>> search(std::span<const float> query,
                                                    const vector::VectorFilter& filter,
                                                    size_t limit) override {
        std::string sql = "SELECT e.id FROM embeddings e ";
        if (filter.pathPrefix) {
            sql += "JOIN file_chunks fc ON fc.embedding_id = e.id ";
        }
        sql += "WHERE e.owner_id = ? ";
        if (filter.sourceType) {
            sql += "AND e.source_type = ? ";
        }
        if (filter.pathPrefix) {
            sql += "AND fc.path LIKE ? ESCAPE '\\' ";
        }
        std::vector<RowId> candidates;
        {
            auto guard = db_.acquire();
            auto stmt = db_.prepare(sql);
            if (!stmt) {
                return stmt.error();
            }
            auto& s = stmt.value();
            int idx = 1;
            s.bind(idx++, static_cast<int64_t>(filter.owner));
            if (filter.sourceType) {
                s.bind(idx++, *filter.sourceType);
            }
            if (filter.pathPrefix) {
                s.bind(idx++, metadata::sql::prefixPattern(*filter.pathPrefix));
            }
            while (true) {
                auto row = s.step();
                if (!row) {
                    return row.error();
                }
                if (!row.value()) {
                    break;
                }
                candidates.push_back(s.getInt64(0));
            }
        }

        std::vector<vector::VectorMatch> matches;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (RowId id : candidates) {
                auto it = vectors_.find(id);
                if (it != vectors_.end()) {
                    matches.push_back({id, vector::cosineDistance(query, it->second)});
                }
            }
        }
        std::sort(matches.begin(), matches.end(),
                  [](const auto& a, const auto& b) { return a.distance < b.distance; });
        if (matches.size() > limit) {
            matches.resize(limit);
        }
        return matches;
    }

    std::string name() const override { return "in-memory"; }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return vectors_.size();
    }

    std::atomic<bool> failWrites{false};

private:
    metadata::Database& db_;
    size_t dimension_ = 0;
    mutable std::mutex mutex_;
    std::map<RowId, std::vector<float>> vectors_;
};

// Backend whose failures are scripted by the test.
class ScriptedEncoderBackend : public vector::IEncoderBackend {
public:
    explicit ScriptedEncoderBackend(size_t dimension = 32) : inner_(dimension) {}

    Result<void> initialize() override { return {}; }

    Result<std::vector<float>> encode(const std::string& text) override {
        calls.fetch_add(1);
        if (auto ms = delayMs.load(); ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
        if (noSpaceFailures.load() > 0) {
            noSpaceFailures.fetch_sub(1);
            throw std::system_error(std::make_error_code(std::errc::no_space_on_device),
                                    "writing cache");
        }
        if (noSpaceResults.load() > 0) {
            noSpaceResults.fetch_sub(1);
            return Error{ErrorCode::InternalError,
                         "Inference failed: write model.optimized.onnx: No space left on device"};
        }
        if (failAll.load()) {
            return Error{ErrorCode::InternalError, "model unavailable"};
        }
        if (!failOn.empty() && text.find(failOn) != std::string::npos) {
            return Error{ErrorCode::InternalError, "refused input"};
        }
        return inner_.encode(text);
    }

    size_t dimension() const override { return inner_.dimension(); }
    std::string name() const override { return "scripted"; }

    std::atomic<int> noSpaceFailures{0};
    /// Like noSpaceFailures, but reported as a plain error result
    std::atomic<int> noSpaceResults{0};
    std::atomic<bool> failAll{false};
    std::atomic<int> calls{0};
    std::atomic<int> delayMs{0};
    std::string failOn;

private:
    vector::HashingEncoderBackend inner_;
};

// In-memory database plus encoder, embedding store and optional vector index.
struct TestStack {
    explicit TestStack(bool withVectorIndex = true, size_t dimension = 64) {
        auto opened = metadata::openAndMigrate(db, ":memory:");
        if (!opened) {
            throw std::runtime_error("openAndMigrate failed: " + opened.error().message);
        }
        auto backend = std::make_unique<ScriptedEncoderBackend>(dimension);
        scripted = backend.get();
        vector::EncoderConfig cfg;
        cfg.dimension = dimension;
        cfg.modelName = "test-hashing";
        encoder = std::make_shared<vector::VectorEncoder>(cfg, std::move(backend), &pool);

        std::unique_ptr<vector::IVectorIndex> idx;
        if (withVectorIndex) {
            auto made = std::make_unique<InMemoryVectorIndex>(db);
            made->initialize(dimension);
            index = made.get();
            idx = std::move(made);
        }
        embeddings = std::make_unique<vector::EmbeddingStore>(db, encoder, std::move(idx));
    }

    metadata::Database db;
    core::WorkerPool pool{"test-embedding", 2};
    core::WorkerPool background{"test-background", 1};
    std::shared_ptr<vector::VectorEncoder> encoder;
    ScriptedEncoderBackend* scripted = nullptr;
    InMemoryVectorIndex* index = nullptr;
    std::unique_ptr<vector::EmbeddingStore> embeddings;
};

} // namespace memex::test_support
