#pragma once

#include <cstddef>
#include <string>

namespace memex::metadata::sql {

// Escape %, _ and \ for use in `LIKE ? ESCAPE '\'`
std::string escapeLike(const std::string& s);

// "?,?,?" for an IN (...) list of n parameters
std::string placeholders(std::size_t n);

// Prefix match pattern: escaped prefix followed by %
inline std::string prefixPattern(const std::string& prefix) {
    return escapeLike(prefix) + "%";
}

// Substring match pattern: %escaped%
inline std::string containsPattern(const std::string& needle) {
    return "%" + escapeLike(needle) + "%";
}

} // namespace memex::metadata::sql
