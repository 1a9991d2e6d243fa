#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace memex::indexing {

/**
 * @brief Sizes (in bytes) for splitting file text into overlapping chunks
 */
struct ChunkingConfig {
    size_t chunkSize = 1500;
    size_t overlap = 200;
    /// Chunks shorter than this after trimming are dropped
    size_t minChunkSize = 50;
    /// Boundaries tried in order when looking for a split point
    std::vector<std::string> separators = {"\n\n", "\n", ". ", " "};
};

/**
 * @brief Split text into chunks of at most chunkSize bytes.
 *
 * Surrounding whitespace is trimmed first. A chunk ends at the last separator
 * found in the second half of the window, or at the hard size limit when there
 * is none; hard cuts and overlap starts are moved onto UTF-8 character
 * boundaries. Consecutive chunks share about `overlap` bytes. Trimmed text no
 * longer than chunkSize yields a single chunk, or none if it is shorter than
 * minChunkSize.
 */
std::vector<std::string> chunkText(const std::string& text, const ChunkingConfig& config = {});

} // namespace memex::indexing
