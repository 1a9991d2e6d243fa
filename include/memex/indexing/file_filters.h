#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace memex::indexing {

/**
 * @brief Why a file was left out of the index
 */
enum class SkipReason { Extension, Sensitive, TooLarge, Unreadable, Binary };

const char* skipReasonName(SkipReason reason);

struct FileFilterConfig {
    /// Lowercase suffixes, compared against the end of the lowercased file name
    std::vector<std::string> extensions = {
        ".md",  ".txt",  ".py",  ".js",   ".ts",  ".json", ".yaml", ".yml",
        ".toml", ".csv", ".html", ".css", ".sh",  ".bash", ".zsh",  ".rst",
        ".xml", ".ini",  ".cfg",  ".conf", ".env.example"};
    /// Directory names never descended into (a leading "*" matches any prefix)
    std::vector<std::string> skipDirs = {
        ".git",   "node_modules", "__pycache__", ".venv", "venv",       ".mypy_cache",
        ".pytest_cache", ".tox",  "dist",        "build", ".eggs",      "*.egg-info",
        ".cache", ".idea",        ".vscode"};
    /// Substrings of the lowercased full path that mark credential material
    std::vector<std::string> sensitivePatterns = {".env",        ".ssh",    ".aws",
                                                  ".gnupg",      "credentials", "secrets"};
    std::uintmax_t maxFileSize = 500 * 1024;
    /// Bytes inspected for a NUL when detecting binary content
    size_t binarySniffBytes = 8192;
};

/**
 * @brief True for directories the walker must not enter (listed names and dot-directories).
 */
bool shouldSkipDir(const std::string& name, const FileFilterConfig& config);

bool hasAllowedExtension(const std::filesystem::path& path, const FileFilterConfig& config);

bool isSensitivePath(const std::filesystem::path& path, const FileFilterConfig& config);

/**
 * @brief Path-only eligibility: extension, then sensitivity, then size.
 * @return the first failing check, or nullopt when the file may be read
 */
std::optional<SkipReason> checkEligibility(const std::filesystem::path& path,
                                           std::uintmax_t fileSize,
                                           const FileFilterConfig& config);

/**
 * @brief A NUL byte within the first `sniffBytes` marks content as binary.
 */
bool looksBinary(const std::string& content, size_t sniffBytes);

} // namespace memex::indexing
