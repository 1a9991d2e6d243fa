#include <spdlog/spdlog.h>
#include <memex/metadata/database.h>
#include <memex/metadata/query_helpers.h>
#include <memex/vector/vector_codec.h>
#include <memex/vector/vector_index.h>

#ifdef MEMEX_HAVE_SQLITE_VEC
extern "C" {
#include "sqlite-vec.h"
}
#endif

namespace memex::vector {

#ifdef MEMEX_HAVE_SQLITE_VEC

namespace {

class SqliteVecIndex : public IVectorIndex {
public:
    explicit SqliteVecIndex(metadata::Database& db) : db_(db) {}

    Result<void> loadExtension() {
        char* errorMsg = nullptr;
        int rc = sqlite3_vec_init(db_.nativeHandle(), &errorMsg, nullptr);
        if (rc != SQLITE_OK) {
            std::string error = errorMsg ? errorMsg : "Unknown error";
            if (errorMsg) {
                sqlite3_free(errorMsg);
            }
            return Error{ErrorCode::NotSupported, "Failed to initialise sqlite-vec: " + error};
        }

        auto stmt = db_.prepare("SELECT 1 FROM pragma_module_list WHERE name='vec0'");
        if (!stmt) {
            return stmt.error();
        }
        auto step = stmt.value().step();
        if (!step || !step.value()) {
            return Error{ErrorCode::NotSupported,
                         "sqlite-vec extension loaded but vec0 module not available"};
        }
        return {};
    }

    Result<void> initialize(size_t dimension) override {
        auto guard = db_.acquire();
        auto existing = storedDimension();
        if (!existing) {
            return existing.error();
        }
        if (existing.value() && *existing.value() != dimension) {
            return Error{ErrorCode::InvalidArgument,
                         "Vector index holds dimension " + std::to_string(*existing.value()) +
                             ", encoder produces " + std::to_string(dimension)};
        }

        auto created = db_.execute(
            "CREATE VIRTUAL TABLE IF NOT EXISTS embeddings_vec USING vec0(embedding float[" +
            std::to_string(dimension) + "])");
        if (!created) {
            return created;
        }
        auto meta = db_.execute("CREATE TABLE IF NOT EXISTS vector_index_meta ("
                                "key TEXT PRIMARY KEY, value TEXT NOT NULL)");
        if (!meta) {
            return meta;
        }
        auto stmt = db_.prepare(
            "INSERT OR REPLACE INTO vector_index_meta(key, value) VALUES ('dimension', ?)");
        if (!stmt) {
            return stmt.error();
        }
        auto& s = stmt.value();
        if (auto b = s.bind(1, std::to_string(dimension)); !b) {
            return b;
        }
        if (auto e = s.execute(); !e) {
            return e;
        }
        dimension_ = dimension;
        spdlog::debug("sqlite-vec index ready (dim={})", dimension);
        return {};
    }

    size_t dimension() const override { return dimension_; }

    Result<void> upsert(RowId embeddingId, std::span<const float> vector) override {
        if (vector.size() != dimension_) {
            return Error{ErrorCode::InvalidData, "Vector dimension mismatch"};
        }
        auto guard = db_.acquire();
        // vec0 does not support INSERT OR REPLACE
        if (auto r = remove(embeddingId); !r) {
            return r;
        }
        auto stmt = db_.prepare("INSERT INTO embeddings_vec(rowid, embedding) VALUES (?, ?)");
        if (!stmt) {
            return stmt.error();
        }
        auto blob = encodeVector(vector);
        auto& s = stmt.value();
        if (auto b = s.bindAll(static_cast<int64_t>(embeddingId),
                               std::span<const std::byte>(blob));
            !b) {
            return b;
        }
        return s.execute();
    }

    Result<void> remove(RowId embeddingId) override {
        auto stmt = db_.prepare("DELETE FROM embeddings_vec WHERE rowid = ?");
        if (!stmt) {
            return stmt.error();
        }
        auto& s = stmt.value();
        if (auto b = s.bind(1, static_cast<int64_t>(embeddingId)); !b) {
            return b;
        }
        return s.execute();
    }

    Result<std::vector<VectorMatch>> search(std::span<const float> query,
                                            const VectorFilter& filter, size_t limit) override {
        if (query.size() != dimension_) {
            return Error{ErrorCode::InvalidData, "Query dimension mismatch"};
        }

        std::string sql = "SELECT e.id, vec_distance_cosine(v.embedding, ?) AS distance "
                          "FROM embeddings_vec v JOIN embeddings e ON e.id = v.rowid ";
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
        sql += "ORDER BY distance ASC LIMIT ?";

        auto guard = db_.acquire();
        auto stmt = db_.prepare(sql);
        if (!stmt) {
            return stmt.error();
        }
        auto& s = stmt.value();
        auto blob = encodeVector(query);
        int idx = 1;
        if (auto b = s.bind(idx++, std::span<const std::byte>(blob)); !b) {
            return b.error();
        }
        if (auto b = s.bind(idx++, static_cast<int64_t>(filter.owner)); !b) {
            return b.error();
        }
        if (filter.sourceType) {
            if (auto b = s.bind(idx++, *filter.sourceType); !b) {
                return b.error();
            }
        }
        if (filter.pathPrefix) {
            if (auto b = s.bind(idx++, metadata::sql::prefixPattern(*filter.pathPrefix)); !b) {
                return b.error();
            }
        }
        if (auto b = s.bind(idx++, static_cast<int64_t>(limit)); !b) {
            return b.error();
        }

        std::vector<VectorMatch> out;
        while (true) {
            auto step = s.step();
            if (!step) {
                return step.error();
            }
            if (!step.value()) {
                break;
            }
            out.push_back(VectorMatch{s.getInt64(0), s.getDouble(1)});
        }
        return out;
    }

    std::string name() const override { return "sqlite-vec"; }

private:
    Result<std::optional<size_t>> storedDimension() {
        auto exists = db_.tableExists("vector_index_meta");
        if (!exists) {
            return exists.error();
        }
        if (!exists.value()) {
            return std::optional<size_t>{};
        }
        auto stmt = db_.prepare("SELECT value FROM vector_index_meta WHERE key = 'dimension'");
        if (!stmt) {
            return stmt.error();
        }
        auto step = stmt.value().step();
        if (!step) {
            return step.error();
        }
        if (!step.value()) {
            return std::optional<size_t>{};
        }
        try {
            return std::optional<size_t>{std::stoul(stmt.value().getString(0))};
        } catch (const std::exception&) {
            return Error{ErrorCode::CorruptedData, "Invalid stored vector dimension"};
        }
    }

    metadata::Database& db_;
    size_t dimension_ = 0;
};

} // namespace

Result<std::unique_ptr<IVectorIndex>> makeSqliteVecIndex(metadata::Database& db) {
    auto index = std::make_unique<SqliteVecIndex>(db);
    if (auto loaded = index->loadExtension(); !loaded) {
        return loaded.error();
    }
    return std::unique_ptr<IVectorIndex>(std::move(index));
}

#else

Result<std::unique_ptr<IVectorIndex>> makeSqliteVecIndex(metadata::Database&) {
    return Error{ErrorCode::NotSupported, "built without sqlite-vec"};
}

#endif

} // namespace memex::vector
