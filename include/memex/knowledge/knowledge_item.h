#pragma once

#include <memex/core/types.h>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace memex::knowledge {

enum class EntityType { Fact, Goal, ListItem };

inline constexpr const char* entityTypeName(EntityType type) {
    switch (type) {
        case EntityType::Fact: return "fact";
        case EntityType::Goal: return "goal";
        case EntityType::ListItem: return "list_item";
    }
    return "fact";
}

std::optional<EntityType> parseEntityType(std::string_view name);

/// Embedding source label, e.g. "knowledge_fact"
std::string sourceTypeFor(EntityType type);

inline constexpr const char* kGoalActive = "active";
inline constexpr const char* kProjectCategory = "project";

struct FactMetadata {
    std::optional<std::string> category;
};

struct GoalMetadata {
    std::optional<std::string> description;
    std::string status = kGoalActive;
};

struct ListItemMetadata {
    std::string list = "shopping";
    bool done = false;
};

/**
 * @brief Per-type typed fields plus an open key/value bag.
 *
 * Serialised as one flat JSON object: typed fields under their own keys
 * ("category", "description", "status", "list", "done") and everything in
 * `extra` alongside them.
 */
struct KnowledgeMetadata {
    std::variant<FactMetadata, GoalMetadata, ListItemMetadata> typed;
    std::map<std::string, std::string> extra;

    static KnowledgeMetadata defaultFor(EntityType type);

    EntityType type() const;

    std::optional<std::string> category() const;
    std::optional<std::string> description() const;
    std::optional<std::string> status() const;

    std::string toJson() const;

    /**
     * @brief Parse stored JSON for an item of `type`. Unknown keys go to `extra`;
     * typed keys with the wrong JSON type are rejected.
     */
    static Result<KnowledgeMetadata> fromJson(EntityType type, std::string_view json);
};

struct KnowledgeItem {
    RowId id = 0;
    OwnerId owner = 0;
    EntityType type = EntityType::Fact;
    std::string content;
    KnowledgeMetadata metadata = KnowledgeMetadata::defaultFor(EntityType::Fact);
    double confidence = 1.0;
    std::optional<RowId> embeddingId;
    std::string createdAt;
    std::string updatedAt;
    std::optional<std::string> lastReferencedAt;

    static KnowledgeItem make(EntityType type, std::string content, double confidence = 1.0);
};

} // namespace memex::knowledge
