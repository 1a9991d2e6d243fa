#pragma once

#include <memex/core/types.h>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace memex::vector {

/**
 * @brief Pack floats as little-endian IEEE-754 binary32, 4 bytes per element.
 * This is the on-disk layout of embeddings.vector and of sqlite-vec float[N] blobs.
 */
inline std::vector<std::byte> encodeVector(std::span<const float> values) {
    std::vector<std::byte> out(values.size() * sizeof(float));
    for (size_t i = 0; i < values.size(); ++i) {
        uint32_t bits = std::bit_cast<uint32_t>(values[i]);
        for (size_t b = 0; b < 4; ++b) {
            out[i * 4 + b] = static_cast<std::byte>((bits >> (8 * b)) & 0xFFu);
        }
    }
    return out;
}

/**
 * @brief Inverse of encodeVector. With a non-zero expectedDimension the blob
 * must be exactly 4 x expectedDimension bytes; any other length is CorruptedData.
 */
inline Result<std::vector<float>> decodeVector(std::span<const std::byte> blob,
                                               size_t expectedDimension = 0) {
    if (blob.size() % sizeof(float) != 0) {
        return Error{ErrorCode::CorruptedData, "Vector blob length is not a multiple of 4"};
    }
    const size_t dim = blob.size() / sizeof(float);
    if (expectedDimension != 0 && dim != expectedDimension) {
        return Error{ErrorCode::CorruptedData, "Vector blob holds " + std::to_string(dim) +
                                                   " floats, expected " +
                                                   std::to_string(expectedDimension)};
    }
    std::vector<float> out(dim);
    for (size_t i = 0; i < dim; ++i) {
        uint32_t bits = 0;
        for (size_t b = 0; b < 4; ++b) {
            bits |= static_cast<uint32_t>(std::to_integer<uint8_t>(blob[i * 4 + b])) << (8 * b);
        }
        out[i] = std::bit_cast<float>(bits);
    }
    return out;
}

/**
 * @brief Cosine distance (1 - cosine similarity), matching sqlite-vec's vec_distance_cosine.
 */
inline double cosineDistance(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size() || a.empty()) {
        return 2.0;
    }
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) {
        return 1.0;
    }
    return 1.0 - dot / (std::sqrt(na) * std::sqrt(nb));
}

} // namespace memex::vector
