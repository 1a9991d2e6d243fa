#pragma once

#include <memex/core/types.h>
#include <memex/indexing/file_indexer.h>
#include <memex/knowledge/knowledge_item.h>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace memex::knowledge {
class KnowledgeStore;
}

namespace memex::context {

struct InjectorConfig {
    size_t factLimit = 5;
    size_t goalLimit = 3;
    size_t listLimit = 5;
    double minConfidence = 0.5;
    /// Read README.md of facts categorised as "project"
    bool projectContext = true;
    size_t projectReadmeChars = 1500;
    size_t maxProjects = 3;
    /// File chunks added when a FileIndexer is attached (0 disables)
    size_t fileLimit = 3;
    size_t fileSnippetChars = 500;
};

/**
 * @brief A project README surfaced as a synthetic fact
 */
struct ProjectSnippet {
    std::string path;
    std::string text;
};

/**
 * @brief Everything selected for one message, before rendering
 */
struct MemoryContext {
    std::vector<knowledge::KnowledgeItem> facts;
    std::vector<knowledge::KnowledgeItem> goals;
    std::vector<knowledge::KnowledgeItem> listItems;
    std::vector<ProjectSnippet> projects;
    std::vector<indexing::FileSearchHit> files;

    bool empty() const;
};

/**
 * @brief Render the <memory> block. Empty when `ctx` is empty.
 */
std::string renderMemoryBlock(const MemoryContext& ctx);

/**
 * @brief Escape &, <, >, ' and " for XML text and attribute values.
 */
std::string escapeXml(const std::string& text);

/**
 * @brief Assembles the memory block injected ahead of a conversation turn.
 *
 * For each entity type the knowledge store is searched (vector first, then
 * keyword). When both come back empty the most recent items of that type
 * are used instead. Items shown are marked referenced so recency boosting
 * favours them next time. Lookup failures degrade to "nothing found".
 */
class MemoryInjector {
public:
    MemoryInjector(knowledge::KnowledgeStore& knowledge, indexing::FileIndexer* files = nullptr,
                   InjectorConfig config = {});

    Result<MemoryContext> collect(OwnerId owner, const std::string& message,
                                  std::optional<double> minConfidence = std::nullopt);

    /**
     * @brief Rendered block for `message`, or "" when there is nothing to show.
     */
    Result<std::string> buildContext(OwnerId owner, const std::string& message,
                                     std::optional<double> minConfidence = std::nullopt);

    /**
     * @brief `baseText` followed by a blank line and the memory block, or
     * `baseText` unchanged when the block is empty.
     */
    Result<std::string> buildSystemPrompt(OwnerId owner, const std::string& message,
                                          const std::string& baseText,
                                          std::optional<double> minConfidence = std::nullopt);

    const InjectorConfig& config() const { return config_; }

private:
    std::vector<knowledge::KnowledgeItem> relevant(OwnerId owner, knowledge::EntityType type,
                                                   const std::string& message, size_t limit,
                                                   double minConfidence);
    std::vector<ProjectSnippet> projectContext(OwnerId owner, double minConfidence);

    knowledge::KnowledgeStore& knowledge_;
    indexing::FileIndexer* files_;
    InjectorConfig config_;
};

} // namespace memex::context
