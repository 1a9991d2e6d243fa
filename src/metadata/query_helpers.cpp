#include <memex/metadata/query_helpers.h>

namespace memex::metadata::sql {

std::string escapeLike(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '%' || c == '_' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string placeholders(std::size_t n) {
    std::string out;
    out.reserve(n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        out += (i == 0) ? "?" : ",?";
    }
    return out;
}

} // namespace memex::metadata::sql
