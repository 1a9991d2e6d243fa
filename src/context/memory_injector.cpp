#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <memex/config/config_helpers.h>
#include <memex/core/utf8.h>
#include <memex/context/memory_injector.h>
#include <memex/indexing/file_indexer.h>
#include <memex/knowledge/knowledge_store.h>

namespace memex::context {

namespace {

using knowledge::EntityType;
using knowledge::KnowledgeItem;

bool showable(const KnowledgeItem& item) {
    if (item.type == EntityType::Goal) {
        return item.metadata.status().value_or(knowledge::kGoalActive) == knowledge::kGoalActive;
    }
    if (item.type == EntityType::ListItem) {
        const auto* list = std::get_if<knowledge::ListItemMetadata>(&item.metadata.typed);
        return list == nullptr || !list->done;
    }
    return true;
}

std::string idAttr(RowId id) {
    return id > 0 ? fmt::format(" id='{}'", id) : std::string();
}

} // namespace

bool MemoryContext::empty() const {
    return facts.empty() && goals.empty() && listItems.empty() && projects.empty() &&
           files.empty();
}

std::string escapeXml(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '\'':
                out += "&apos;";
                break;
            case '"':
                out += "&quot;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string renderMemoryBlock(const MemoryContext& ctx) {
    if (ctx.empty()) {
        return {};
    }
    std::vector<std::string> lines;
    lines.emplace_back("<memory>");

    if (!ctx.facts.empty() || !ctx.projects.empty()) {
        lines.emplace_back("  <facts>");
        for (const auto& f : ctx.facts) {
            lines.push_back(fmt::format("    <fact{} category='{}'>{}</fact>", idAttr(f.id),
                                        escapeXml(f.metadata.category().value_or("general")),
                                        escapeXml(f.content)));
        }
        for (const auto& p : ctx.projects) {
            lines.push_back(fmt::format("    <fact category='project_context'>[{}] {}</fact>",
                                        escapeXml(p.path), escapeXml(p.text)));
        }
        lines.emplace_back("  </facts>");
    }

    if (!ctx.goals.empty()) {
        lines.emplace_back("  <goals>");
        for (const auto& g : ctx.goals) {
            const auto desc = g.metadata.description().value_or("");
            lines.push_back(fmt::format("    <goal{}>{}{}</goal>", idAttr(g.id),
                                        escapeXml(g.content),
                                        desc.empty() ? std::string() : " - " + escapeXml(desc)));
        }
        lines.emplace_back("  </goals>");
    }

    if (!ctx.listItems.empty()) {
        lines.emplace_back("  <list-section>");
        for (const auto& item : ctx.listItems) {
            const auto* meta = std::get_if<knowledge::ListItemMetadata>(&item.metadata.typed);
            lines.push_back(fmt::format("    <item{} list='{}'>{}</item>", idAttr(item.id),
                                        escapeXml(meta ? meta->list : std::string("shopping")),
                                        escapeXml(item.content)));
        }
        lines.emplace_back("  </list-section>");
    }

    if (!ctx.files.empty()) {
        lines.emplace_back("  <files>");
        for (const auto& hit : ctx.files) {
            lines.push_back(fmt::format("    <file path='{}' chunk='{}'>{}</file>",
                                        escapeXml(hit.path), hit.chunkIndex,
                                        escapeXml(hit.text)));
        }
        lines.emplace_back("  </files>");
    }

    lines.emplace_back("</memory>");

    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        out += lines[i];
    }
    return out;
}

MemoryInjector::MemoryInjector(knowledge::KnowledgeStore& knowledge, indexing::FileIndexer* files,
                               InjectorConfig config)
    : knowledge_(knowledge), files_(files), config_(config) {}

std::vector<KnowledgeItem> MemoryInjector::relevant(OwnerId owner, EntityType type,
                                                    const std::string& message, size_t limit,
                                                    double minConfidence) {
    std::vector<KnowledgeItem> items;
    if (limit == 0) {
        return items;
    }

    if (!message.empty()) {
        auto found = knowledge_.search(owner, type, message, limit, minConfidence);
        if (found) {
            items = std::move(found).value();
        } else {
            spdlog::debug("{} lookup failed, using recent items: {}",
                          knowledge::entityTypeName(type), found.error().message);
        }
    }
    items.erase(std::remove_if(items.begin(), items.end(),
                               [](const KnowledgeItem& i) { return !showable(i); }),
                items.end());

    if (items.empty()) {
        // Over-fetch so filtered-out goals and finished list items do not starve the section
        auto recent = knowledge_.getByType(owner, type, limit * 3, minConfidence);
        if (!recent) {
            spdlog::debug("Recent {} lookup failed: {}", knowledge::entityTypeName(type),
                          recent.error().message);
            return items;
        }
        for (auto& item : recent.value()) {
            if (items.size() >= limit) {
                break;
            }
            if (showable(item)) {
                items.push_back(std::move(item));
            }
        }
    }
    if (items.size() > limit) {
        items.resize(limit);
    }

    std::vector<RowId> ids;
    ids.reserve(items.size());
    for (const auto& item : items) {
        ids.push_back(item.id);
    }
    if (auto marked = knowledge_.markReferenced(owner, ids); !marked) {
        spdlog::debug("Could not mark items referenced: {}", marked.error().message);
    }
    return items;
}

std::vector<ProjectSnippet> MemoryInjector::projectContext(OwnerId owner, double minConfidence) {
    std::vector<ProjectSnippet> snippets;
    if (!config_.projectContext || config_.maxProjects == 0) {
        return snippets;
    }
    auto projects = knowledge_.getFactsByCategory(owner, knowledge::kProjectCategory,
                                                  config_.maxProjects, minConfidence);
    if (!projects) {
        spdlog::debug("Project lookup failed: {}", projects.error().message);
        return snippets;
    }
    for (const auto& fact : projects.value()) {
        std::string dir = fact.content;
        config::trim(dir);
        const auto readme = config::expand_tilde(dir) / "README.md";
        std::ifstream in(readme, std::ios::binary);
        if (!in) {
            continue;
        }
        std::string text;
        text.resize(config_.projectReadmeChars + 4);
        in.read(text.data(), static_cast<std::streamsize>(text.size()));
        text.resize(static_cast<size_t>(in.gcount()));
        if (in.bad() || text.empty()) {
            spdlog::debug("Could not read {}", readme.string());
            continue;
        }
        snippets.push_back({dir, utf8::sanitize(utf8::prefix(text, config_.projectReadmeChars))});
    }
    return snippets;
}

Result<MemoryContext> MemoryInjector::collect(OwnerId owner, const std::string& message,
                                              std::optional<double> minConfidence) {
    if (owner <= 0) {
        return Error{ErrorCode::InvalidArgument, "Owner id must be positive"};
    }
    const double floor = minConfidence.value_or(config_.minConfidence);

    MemoryContext ctx;
    ctx.facts = relevant(owner, EntityType::Fact, message, config_.factLimit, floor);
    ctx.goals = relevant(owner, EntityType::Goal, message, config_.goalLimit, floor);
    ctx.listItems = relevant(owner, EntityType::ListItem, message, config_.listLimit, floor);
    ctx.projects = projectContext(owner, floor);

    if (files_ && config_.fileLimit > 0 && !message.empty()) {
        auto hits = files_->search(message, config_.fileLimit);
        if (hits) {
            ctx.files = std::move(hits).value();
            for (auto& hit : ctx.files) {
                hit.text = utf8::prefix(hit.text, config_.fileSnippetChars);
            }
        } else {
            spdlog::debug("File lookup failed: {}", hits.error().message);
        }
    }
    return ctx;
}

Result<std::string> MemoryInjector::buildContext(OwnerId owner, const std::string& message,
                                                 std::optional<double> minConfidence) {
    auto ctx = collect(owner, message, minConfidence);
    if (!ctx) {
        return ctx.error();
    }
    return renderMemoryBlock(ctx.value());
}

Result<std::string> MemoryInjector::buildSystemPrompt(OwnerId owner, const std::string& message,
                                                      const std::string& baseText,
                                                      std::optional<double> minConfidence) {
    auto block = buildContext(owner, message, minConfidence);
    if (!block) {
        return block.error();
    }
    if (block.value().empty()) {
        return baseText;
    }
    std::string prompt = baseText + "\n\n" + block.value();
    // Rough size estimate, four bytes per token
    spdlog::debug("System prompt: ~{} tokens (base ~{}, memory ~{})", prompt.size() / 4,
                  baseText.size() / 4, block.value().size() / 4);
    return prompt;
}

} // namespace memex::context
