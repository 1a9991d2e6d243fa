#include <nlohmann/json.hpp>
#include <algorithm>
#include <type_traits>
#include <memex/knowledge/knowledge_item.h>

namespace memex::knowledge {

using json = nlohmann::json;

namespace {

std::string scalarToString(const json& v) {
    if (v.is_string()) {
        return v.get<std::string>();
    }
    return v.dump();
}

} // namespace

std::optional<EntityType> parseEntityType(std::string_view name) {
    if (name == "fact")
        return EntityType::Fact;
    if (name == "goal")
        return EntityType::Goal;
    if (name == "list_item" || name == "shopping_item")
        return EntityType::ListItem;
    return std::nullopt;
}

std::string sourceTypeFor(EntityType type) {
    return std::string("knowledge_") + entityTypeName(type);
}

KnowledgeMetadata KnowledgeMetadata::defaultFor(EntityType type) {
    KnowledgeMetadata m;
    switch (type) {
        case EntityType::Fact:
            m.typed = FactMetadata{};
            break;
        case EntityType::Goal:
            m.typed = GoalMetadata{};
            break;
        case EntityType::ListItem:
            m.typed = ListItemMetadata{};
            break;
    }
    return m;
}

EntityType KnowledgeMetadata::type() const {
    switch (typed.index()) {
        case 1: return EntityType::Goal;
        case 2: return EntityType::ListItem;
        default: return EntityType::Fact;
    }
}

std::optional<std::string> KnowledgeMetadata::category() const {
    if (auto* f = std::get_if<FactMetadata>(&typed)) {
        return f->category;
    }
    return std::nullopt;
}

std::optional<std::string> KnowledgeMetadata::description() const {
    if (auto* g = std::get_if<GoalMetadata>(&typed)) {
        return g->description;
    }
    return std::nullopt;
}

std::optional<std::string> KnowledgeMetadata::status() const {
    if (auto* g = std::get_if<GoalMetadata>(&typed)) {
        return g->status;
    }
    return std::nullopt;
}

std::string KnowledgeMetadata::toJson() const {
    json j = json::object();
    for (const auto& [k, v] : extra) {
        j[k] = v;
    }
    std::visit(
        [&j](const auto& m) {
            using M = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<M, FactMetadata>) {
                if (m.category)
                    j["category"] = *m.category;
            } else if constexpr (std::is_same_v<M, GoalMetadata>) {
                if (m.description)
                    j["description"] = *m.description;
                j["status"] = m.status;
            } else {
                j["list"] = m.list;
                j["done"] = m.done;
            }
        },
        typed);
    return j.dump();
}

Result<KnowledgeMetadata> KnowledgeMetadata::fromJson(EntityType type, std::string_view text) {
    KnowledgeMetadata m = defaultFor(type);
    if (text.empty()) {
        return m;
    }

    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorCode::InvalidData, "Metadata is not a JSON object"};
    }

    auto takeString = [&j](const char* key,
                           std::optional<std::string>& out) -> Result<void> {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return {};
        }
        if (!it->is_string()) {
            return Error{ErrorCode::InvalidData, std::string("Metadata field '") + key +
                                                     "' must be a string"};
        }
        out = it->get<std::string>();
        return {};
    };

    std::vector<std::string> typedKeys;
    switch (type) {
        case EntityType::Fact: {
            auto& f = std::get<FactMetadata>(m.typed);
            if (auto r = takeString("category", f.category); !r)
                return r.error();
            typedKeys = {"category"};
            break;
        }
        case EntityType::Goal: {
            auto& g = std::get<GoalMetadata>(m.typed);
            if (auto r = takeString("description", g.description); !r)
                return r.error();
            std::optional<std::string> status;
            if (auto r = takeString("status", status); !r)
                return r.error();
            if (status && !status->empty())
                g.status = *status;
            typedKeys = {"description", "status"};
            break;
        }
        case EntityType::ListItem: {
            auto& l = std::get<ListItemMetadata>(m.typed);
            std::optional<std::string> list;
            if (auto r = takeString("list", list); !r)
                return r.error();
            if (list && !list->empty())
                l.list = *list;
            if (auto it = j.find("done"); it != j.end() && !it->is_null()) {
                if (!it->is_boolean()) {
                    return Error{ErrorCode::InvalidData, "Metadata field 'done' must be a bool"};
                }
                l.done = it->get<bool>();
            }
            typedKeys = {"list", "done"};
            break;
        }
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (std::find(typedKeys.begin(), typedKeys.end(), it.key()) != typedKeys.end()) {
            continue;
        }
        if (it->is_null()) {
            continue;
        }
        m.extra[it.key()] = scalarToString(*it);
    }
    return m;
}

KnowledgeItem KnowledgeItem::make(EntityType type, std::string content, double confidence) {
    KnowledgeItem item;
    item.type = type;
    item.content = std::move(content);
    item.metadata = KnowledgeMetadata::defaultFor(type);
    item.confidence = confidence;
    return item;
}

} // namespace memex::knowledge
