#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_map>
#include <memex/metadata/database.h>
#include <memex/metadata/query_helpers.h>
#include <memex/vector/embedding_store.h>
#include <memex/vector/vector_codec.h>
#include <memex/vector/vector_encoder.h>

namespace memex::vector {

double recencyFactor(std::optional<double> ageDays) {
    if (!ageDays) {
        return 1.0;
    }
    if (*ageDays <= 30.0) {
        return 0.8;
    }
    if (*ageDays <= 90.0) {
        return 1.0;
    }
    return 1.2;
}

EmbeddingStore::EmbeddingStore(metadata::Database& db, std::shared_ptr<VectorEncoder> encoder,
                               std::unique_ptr<IVectorIndex> index)
    : db_(db), encoder_(std::move(encoder)), index_(std::move(index)) {}

EmbeddingStore::~EmbeddingStore() = default;

std::unique_ptr<EmbeddingStore> EmbeddingStore::create(metadata::Database& db,
                                                       std::shared_ptr<VectorEncoder> encoder) {
    std::unique_ptr<IVectorIndex> index;
    if (encoder) {
        auto made = makeSqliteVecIndex(db);
        if (!made) {
            spdlog::info("Vector index unavailable ({}); using keyword search",
                         made.error().message);
        } else {
            auto idx = std::move(made).value();
            if (auto init = idx->initialize(encoder->dimension()); !init) {
                spdlog::warn("Vector index disabled: {}", init.error().message);
            } else {
                index = std::move(idx);
            }
        }
    } else {
        spdlog::info("No encoder configured; embeddings and vector search disabled");
    }
    return std::make_unique<EmbeddingStore>(db, std::move(encoder), std::move(index));
}

size_t EmbeddingStore::dimension() const {
    return encoder_ ? encoder_->dimension() : 0;
}

Result<std::vector<float>> EmbeddingStore::embed(const std::string& text) {
    if (!encoder_) {
        return Error{ErrorCode::NotInitialized, "No encoder configured"};
    }
    return encoder_->embed(text);
}

std::future<Result<std::vector<float>>> EmbeddingStore::embedAsync(std::string text) {
    if (!encoder_) {
        std::promise<Result<std::vector<float>>> ready;
        ready.set_value(Error{ErrorCode::NotInitialized, "No encoder configured"});
        return ready.get_future();
    }
    return encoder_->embedAsync(std::move(text));
}

Result<RowId> EmbeddingStore::upsertEmbedding(OwnerId owner, const std::string& sourceType,
                                              RowId sourceId, const std::string& text) {
    if (owner < 0) {
        return Error{ErrorCode::InvalidArgument, "Invalid owner id"};
    }
    auto vec = embed(text);
    if (!vec) {
        return vec.error();
    }
    return storeEmbedding(owner, sourceType, sourceId, text, vec.value());
}

Result<RowId> EmbeddingStore::storeEmbedding(OwnerId owner, const std::string& sourceType,
                                             RowId sourceId, const std::string& text,
                                             const std::vector<float>& vector) {
    if (owner < 0) {
        return Error{ErrorCode::InvalidArgument, "Invalid owner id"};
    }
    if (encoder_ && vector.size() != encoder_->dimension()) {
        return Error{ErrorCode::InvalidData,
                     "Vector has dimension " + std::to_string(vector.size()) + ", expected " +
                         std::to_string(encoder_->dimension())};
    }

    RowId id = 0;
    {
        auto guard = db_.acquire();
        auto stmt = db_.prepare("INSERT INTO embeddings (owner_id, source_type, source_id, "
                                "content_text, model_name, vector) VALUES (?, ?, ?, ?, ?, ?)");
        if (!stmt) {
            return stmt.error();
        }
        auto blob = encodeVector(vector);
        auto& s = stmt.value();
        const std::string model = encoder_ ? encoder_->modelName() : std::string("external");
        if (auto b = s.bindAll(static_cast<int64_t>(owner), sourceType,
                               static_cast<int64_t>(sourceId), text, model,
                               std::span<const std::byte>(blob));
            !b) {
            return b.error();
        }
        if (auto e = s.execute(); !e) {
            return e.error();
        }
        id = db_.lastInsertRowId();
    }

    if (index_) {
        if (auto r = index_->upsert(id, vector); !r) {
            indexWriteFailures_.fetch_add(1);
            spdlog::warn("Vector index write failed for embedding {}: {}", id, r.error().message);
        }
    }
    return id;
}

Result<std::vector<SimilarityHit>> EmbeddingStore::searchSimilar(OwnerId owner,
                                                                 const std::string& query,
                                                                 size_t limit) {
    if (!vectorSearchAvailable()) {
        return std::vector<SimilarityHit>{};
    }
    auto vec = embed(query);
    if (!vec) {
        return vec.error();
    }
    VectorFilter filter;
    filter.owner = owner;
    return searchByVector(vec.value(), filter, limit);
}

Result<std::vector<SimilarityHit>>
EmbeddingStore::searchSimilarForType(OwnerId owner, const std::string& query,
                                     const std::string& sourceType, size_t limit,
                                     bool recencyBoost) {
    if (!vectorSearchAvailable()) {
        return std::vector<SimilarityHit>{};
    }
    auto vec = embed(query);
    if (!vec) {
        return vec.error();
    }
    VectorFilter filter;
    filter.owner = owner;
    filter.sourceType = sourceType;
    return searchByVector(vec.value(), filter, limit, recencyBoost);
}

Result<std::vector<SimilarityHit>> EmbeddingStore::searchByVector(const std::vector<float>& query,
                                                                  const VectorFilter& filter,
                                                                  size_t limit,
                                                                  bool recencyBoost) {
    if (!index_ || limit == 0) {
        return std::vector<SimilarityHit>{};
    }
    // Over-fetch so boosting can promote items just outside the raw top-k
    const size_t fetch = recencyBoost ? limit * 3 : limit;
    auto matches = index_->search(query, filter, fetch);
    if (!matches) {
        return matches.error();
    }
    return hydrate(matches.value(), recencyBoost, limit);
}

Result<std::vector<SimilarityHit>>
EmbeddingStore::hydrate(const std::vector<VectorMatch>& matches, bool recencyBoost,
                        size_t limit) {
    std::vector<SimilarityHit> hits;
    if (matches.empty()) {
        return hits;
    }

    const std::string sql =
        "SELECT e.id, e.source_type, e.source_id, e.content_text, "
        "julianday('now') - julianday(COALESCE(k.last_referenced_at, k.updated_at)) "
        "FROM embeddings e "
        "LEFT JOIN knowledge k ON k.id = e.source_id AND e.source_type LIKE 'knowledge\\_%' "
        "ESCAPE '\\' "
        "WHERE e.id IN (" +
        metadata::sql::placeholders(matches.size()) + ")";

    struct Row {
        SimilarityHit hit;
        std::optional<double> ageDays;
    };
    std::unordered_map<RowId, Row> rows;
    {
        auto guard = db_.acquire();
        auto stmt = db_.prepare(sql);
        if (!stmt) {
            return stmt.error();
        }
        auto& s = stmt.value();
        int idx = 1;
        for (const auto& m : matches) {
            if (auto b = s.bind(idx++, static_cast<int64_t>(m.embeddingId)); !b) {
                return b.error();
            }
        }
        while (true) {
            auto step = s.step();
            if (!step) {
                return step.error();
            }
            if (!step.value()) {
                break;
            }
            Row row;
            row.hit.embeddingId = s.getInt64(0);
            row.hit.sourceType = s.getString(1);
            row.hit.sourceId = s.getInt64(2);
            row.hit.contentText = s.getString(3);
            if (!s.isNull(4)) {
                row.ageDays = s.getDouble(4);
            }
            rows.emplace(row.hit.embeddingId, std::move(row));
        }
    }

    hits.reserve(matches.size());
    for (const auto& m : matches) {
        auto it = rows.find(m.embeddingId);
        if (it == rows.end()) {
            continue;
        }
        SimilarityHit hit = it->second.hit;
        hit.distance = m.distance;
        if (recencyBoost) {
            hit.distance *= recencyFactor(it->second.ageDays);
        }
        hits.push_back(std::move(hit));
    }
    if (recencyBoost) {
        std::stable_sort(hits.begin(), hits.end(),
                         [](const SimilarityHit& a, const SimilarityHit& b) {
                             return a.distance < b.distance;
                         });
    }
    if (hits.size() > limit) {
        hits.resize(limit);
    }
    return hits;
}

Result<std::optional<EmbeddingRecord>> EmbeddingStore::get(RowId embeddingId) {
    auto guard = db_.acquire();
    auto stmt = db_.prepare("SELECT id, owner_id, source_type, source_id, content_text, "
                            "model_name, created_at FROM embeddings WHERE id = ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bind(1, static_cast<int64_t>(embeddingId)); !b) {
        return b.error();
    }
    auto step = s.step();
    if (!step) {
        return step.error();
    }
    if (!step.value()) {
        return std::optional<EmbeddingRecord>{};
    }
    EmbeddingRecord rec;
    rec.id = s.getInt64(0);
    rec.owner = s.getInt64(1);
    rec.sourceType = s.getString(2);
    rec.sourceId = s.getInt64(3);
    rec.contentText = s.getString(4);
    rec.modelName = s.getString(5);
    rec.createdAt = s.getString(6);
    return std::optional<EmbeddingRecord>{std::move(rec)};
}

Result<void> EmbeddingStore::remove(RowId embeddingId) {
    auto guard = db_.acquire();
    if (index_) {
        if (auto r = index_->remove(embeddingId); !r) {
            spdlog::warn("Vector index delete failed for embedding {}: {}", embeddingId,
                         r.error().message);
        }
    }
    auto stmt = db_.prepare("DELETE FROM embeddings WHERE id = ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bind(1, static_cast<int64_t>(embeddingId)); !b) {
        return b;
    }
    return s.execute();
}

Result<size_t> EmbeddingStore::collectOrphans(int64_t graceSeconds) {
    auto guard = db_.acquire();
    auto stmt = db_.prepare(
        "SELECT e.id FROM embeddings e "
        "WHERE e.created_at <= datetime('now', ?) "
        "AND NOT EXISTS (SELECT 1 FROM knowledge k WHERE k.embedding_id = e.id) "
        "AND NOT EXISTS (SELECT 1 FROM file_chunks fc WHERE fc.embedding_id = e.id)");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bind(1, "-" + std::to_string(std::max<int64_t>(graceSeconds, 0)) + " seconds");
        !b) {
        return b.error();
    }

    std::vector<RowId> orphans;
    while (true) {
        auto step = s.step();
        if (!step) {
            return step.error();
        }
        if (!step.value()) {
            break;
        }
        orphans.push_back(s.getInt64(0));
    }

    size_t removed = 0;
    for (RowId id : orphans) {
        if (auto r = remove(id); !r) {
            spdlog::warn("Failed to remove orphaned embedding {}: {}", id, r.error().message);
            continue;
        }
        ++removed;
    }
    if (removed > 0) {
        spdlog::info("Collected {} orphaned embedding(s)", removed);
    }
    return removed;
}

Result<size_t> EmbeddingStore::rebuildIndex() {
    if (!index_) {
        return Error{ErrorCode::NotSupported, "No vector index attached"};
    }
    auto guard = db_.acquire();
    auto stmt = db_.prepare("SELECT id, vector FROM embeddings WHERE vector IS NOT NULL");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    size_t written = 0;
    while (true) {
        auto step = s.step();
        if (!step) {
            return step.error();
        }
        if (!step.value()) {
            break;
        }
        const RowId id = s.getInt64(0);
        auto blob = s.getBlob(1);
        auto vec = decodeVector(blob, index_->dimension());
        if (!vec) {
            spdlog::debug("Skipping embedding {} during rebuild: {}", id, vec.error().message);
            continue;
        }
        if (auto r = index_->upsert(id, vec.value()); !r) {
            indexWriteFailures_.fetch_add(1);
            spdlog::warn("Vector index write failed for embedding {}: {}", id, r.error().message);
            continue;
        }
        ++written;
    }
    return written;
}

Result<int64_t> EmbeddingStore::count(std::optional<OwnerId> owner) {
    auto guard = db_.acquire();
    auto stmt = db_.prepare(owner ? "SELECT COUNT(*) FROM embeddings WHERE owner_id = ?"
                                  : "SELECT COUNT(*) FROM embeddings");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (owner) {
        if (auto b = s.bind(1, static_cast<int64_t>(*owner)); !b) {
            return b.error();
        }
    }
    auto step = s.step();
    if (!step) {
        return step.error();
    }
    return s.getInt64(0);
}

} // namespace memex::vector
