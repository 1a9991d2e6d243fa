#pragma once

#include <memex/core/types.h>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace memex::metadata {
class Database;
}

namespace memex::vector {

/**
 * @brief Restricts a nearest-neighbour scan to one owner's embeddings.
 */
struct VectorFilter {
    OwnerId owner = 0;
    std::optional<std::string> sourceType;
    /// Only embeddings referenced by file_chunks rows whose path starts with this prefix
    std::optional<std::string> pathPrefix;
};

struct VectorMatch {
    RowId embeddingId = 0;
    double distance = 0.0;
};

/**
 * @brief Nearest-neighbour index keyed by embeddings.id
 *
 * The index holds vectors only; owner and type metadata live in the
 * embeddings table, which implementations join against when filtering.
 */
class IVectorIndex {
public:
    virtual ~IVectorIndex() = default;

    /**
     * @brief Create backing storage for vectors of the given dimension.
     * Fails with InvalidArgument if existing storage has a different dimension.
     */
    virtual Result<void> initialize(size_t dimension) = 0;

    virtual size_t dimension() const = 0;

    virtual Result<void> upsert(RowId embeddingId, std::span<const float> vector) = 0;
    virtual Result<void> remove(RowId embeddingId) = 0;

    /**
     * @brief Matches ordered by ascending cosine distance, at most `limit` entries.
     */
    virtual Result<std::vector<VectorMatch>> search(std::span<const float> query,
                                                    const VectorFilter& filter,
                                                    size_t limit) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief sqlite-vec (vec0) index living in the store database.
 *
 * Returns NotSupported when the library was built without sqlite-vec; callers
 * treat that as a permanent switch to keyword fallback for the process.
 */
Result<std::unique_ptr<IVectorIndex>> makeSqliteVecIndex(metadata::Database& db);

} // namespace memex::vector
