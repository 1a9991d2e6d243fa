#include <memex/indexing/file_filters.h>
#include <algorithm>
#include <cctype>

namespace memex::indexing {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

const char* skipReasonName(SkipReason reason) {
    switch (reason) {
        case SkipReason::Extension:
            return "extension";
        case SkipReason::Sensitive:
            return "sensitive";
        case SkipReason::TooLarge:
            return "too_large";
        case SkipReason::Unreadable:
            return "unreadable";
        case SkipReason::Binary:
            return "binary";
    }
    return "unknown";
}

bool shouldSkipDir(const std::string& name, const FileFilterConfig& config) {
    if (!name.empty() && name.front() == '.') {
        return true;
    }
    for (const auto& pattern : config.skipDirs) {
        if (!pattern.empty() && pattern.front() == '*') {
            if (endsWith(name, pattern.substr(1))) {
                return true;
            }
        } else if (name == pattern) {
            return true;
        }
    }
    return false;
}

bool hasAllowedExtension(const std::filesystem::path& path, const FileFilterConfig& config) {
    const std::string name = lower(path.filename().string());
    return std::any_of(config.extensions.begin(), config.extensions.end(),
                       [&](const std::string& ext) { return endsWith(name, lower(ext)); });
}

bool isSensitivePath(const std::filesystem::path& path, const FileFilterConfig& config) {
    const std::string full = lower(path.string());
    return std::any_of(config.sensitivePatterns.begin(), config.sensitivePatterns.end(),
                       [&](const std::string& p) { return full.find(p) != std::string::npos; });
}

std::optional<SkipReason> checkEligibility(const std::filesystem::path& path,
                                           std::uintmax_t fileSize,
                                           const FileFilterConfig& config) {
    if (!hasAllowedExtension(path, config)) {
        return SkipReason::Extension;
    }
    if (isSensitivePath(path, config)) {
        return SkipReason::Sensitive;
    }
    if (fileSize > config.maxFileSize) {
        return SkipReason::TooLarge;
    }
    return std::nullopt;
}

bool looksBinary(const std::string& content, size_t sniffBytes) {
    const size_t n = std::min(content.size(), sniffBytes);
    return content.find('\0') < n;
}

} // namespace memex::indexing
