#include <memex/config/config_helpers.h>
#include <memex/core/utf8.h>
#include <memex/indexing/text_chunker.h>
#include <algorithm>

namespace memex::indexing {

namespace {

std::string trimmed(std::string s) {
    config::trim(s);
    return s;
}

} // namespace

std::vector<std::string> chunkText(const std::string& text, const ChunkingConfig& config) {
    std::vector<std::string> chunks;
    const size_t size = config.chunkSize == 0 ? 1 : config.chunkSize;
    const std::string body = trimmed(text);

    if (body.size() <= size) {
        if (body.size() >= config.minChunkSize) {
            chunks.push_back(body);
        }
        return chunks;
    }

    const size_t overlap = config.overlap < size ? config.overlap : 0;
    const size_t halfWindow = size / 2;
    size_t start = 0;
    while (start < body.size()) {
        size_t end = std::min(start + size, body.size());
        if (end < body.size()) {
            bool split = false;
            for (const auto& sep : config.separators) {
                if (sep.empty() || end - start < sep.size()) {
                    continue;
                }
                const size_t pos = body.rfind(sep, end - sep.size());
                if (pos != std::string::npos && pos >= start && pos > start + halfWindow) {
                    end = pos + sep.size();
                    split = true;
                    break;
                }
            }
            if (!split) {
                size_t cut = utf8::boundaryAtOrBefore(body, end, start);
                end = cut > start ? cut : utf8::boundaryAtOrAfter(body, start + 1);
            }
        }

        auto chunk = trimmed(body.substr(start, end - start));
        if (chunk.size() >= config.minChunkSize) {
            chunks.push_back(std::move(chunk));
        }
        if (end >= body.size()) {
            break;
        }
        const size_t next = utf8::boundaryAtOrAfter(body, end > overlap ? end - overlap : end);
        start = next > start && next <= end ? next : end;
    }
    return chunks;
}

} // namespace memex::indexing
