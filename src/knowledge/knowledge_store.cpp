#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <memex/config/config_helpers.h>
#include <memex/core/worker_pool.h>
#include <memex/knowledge/knowledge_store.h>
#include <memex/metadata/database.h>
#include <memex/metadata/query_helpers.h>
#include <memex/search/keyword_search.h>
#include <memex/search/search_strategy.h>
#include <memex/vector/embedding_store.h>

namespace memex::knowledge {

namespace {

constexpr const char* kSelectColumns =
    "SELECT id, owner_id, entity_type, content, metadata, confidence, embedding_id, "
    "created_at, updated_at, last_referenced_at FROM knowledge ";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalized(const std::string& content) {
    std::string s = content;
    config::trim(s);
    return s;
}

Result<void> validateOwner(OwnerId owner) {
    if (owner <= 0) {
        return Error{ErrorCode::InvalidArgument, "Owner id must be positive"};
    }
    return {};
}

} // namespace

KnowledgeStore::KnowledgeStore(metadata::Database& db, vector::EmbeddingStore* embeddings,
                               KnowledgeStoreConfig config, core::WorkerPool* background)
    : db_(db), embeddings_(embeddings), config_(config), background_(background),
      keyword_(std::make_unique<search::KeywordSearch>(db)) {
    std::vector<std::shared_ptr<search::ISearchStrategy>> chain;
    if (embeddings_) {
        chain.push_back(
            std::make_shared<search::VectorSearchStrategy>(*embeddings_, config_.recencyBoost));
    }
    chain.push_back(std::make_shared<search::KeywordSearchStrategy>(*keyword_));
    search_ = std::make_unique<search::FallbackSearch>(std::move(chain));
}

KnowledgeStore::~KnowledgeStore() {
    waitForPendingEmbeddings();
}

KnowledgeItem KnowledgeStore::readRow(const metadata::Statement& s) const {
    KnowledgeItem item;
    item.id = s.getInt64(0);
    item.owner = s.getInt64(1);
    item.type = parseEntityType(s.getString(2)).value_or(EntityType::Fact);
    item.content = s.getString(3);
    auto meta = KnowledgeMetadata::fromJson(item.type, s.getString(4));
    if (meta) {
        item.metadata = std::move(meta).value();
    } else {
        spdlog::warn("Knowledge item {} has unreadable metadata: {}", item.id,
                     meta.error().message);
        item.metadata = KnowledgeMetadata::defaultFor(item.type);
    }
    item.confidence = s.getDouble(5);
    if (!s.isNull(6)) {
        item.embeddingId = s.getInt64(6);
    }
    item.createdAt = s.getString(7);
    item.updatedAt = s.getString(8);
    if (!s.isNull(9)) {
        item.lastReferencedAt = s.getString(9);
    }
    return item;
}

Result<bool> KnowledgeStore::isDuplicate(OwnerId owner, EntityType type,
                                         const std::string& content) {
    const std::string text = normalized(content);
    auto guard = db_.acquire();
    auto stmt = db_.prepare("SELECT 1 FROM knowledge WHERE owner_id = ? AND entity_type = ? "
                            "AND LOWER(content) = LOWER(?) LIMIT 1");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bindAll(static_cast<int64_t>(owner), entityTypeName(type), text); !b) {
        return b.error();
    }
    auto step = s.step();
    if (!step) {
        return step.error();
    }
    if (step.value()) {
        return true;
    }
    if (type != EntityType::Goal) {
        return false;
    }

    // Active goal titles that contain one another are treated as the same goal
    auto goals = db_.prepare(
        "SELECT content FROM knowledge WHERE owner_id = ? AND entity_type = 'goal' "
        "AND COALESCE(json_extract(metadata, '$.status'), 'active') = 'active'");
    if (!goals) {
        return goals.error();
    }
    auto& g = goals.value();
    if (auto b = g.bind(1, static_cast<int64_t>(owner)); !b) {
        return b.error();
    }
    const std::string needle = lower(text);
    while (true) {
        auto row = g.step();
        if (!row) {
            return row.error();
        }
        if (!row.value()) {
            break;
        }
        const std::string existing = lower(g.getString(0));
        if (existing.empty()) {
            continue;
        }
        if (existing.find(needle) != std::string::npos ||
            needle.find(existing) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Result<RowId> KnowledgeStore::insertRow(OwnerId owner, const KnowledgeItem& item) {
    auto stmt = db_.prepare("INSERT INTO knowledge (owner_id, entity_type, content, metadata, "
                            "confidence) VALUES (?, ?, ?, ?, ?)");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bindAll(static_cast<int64_t>(owner), entityTypeName(item.type),
                           normalized(item.content), item.metadata.toJson(), item.confidence);
        !b) {
        return b.error();
    }
    if (auto e = s.execute(); !e) {
        return e.error();
    }
    return db_.lastInsertRowId();
}

Result<UpsertReport> KnowledgeStore::upsert(OwnerId owner,
                                            const std::vector<KnowledgeItem>& items) {
    if (auto v = validateOwner(owner); !v) {
        return v.error();
    }
    UpsertReport report;
    for (const auto& item : items) {
        auto id = addItem(owner, item.type, item.content, item.metadata, item.confidence);
        if (id) {
            report.inserted.push_back(id.value());
        } else if (id.error().code == ErrorCode::AlreadyExists) {
            ++report.duplicates;
        } else {
            return id.error();
        }
    }
    spdlog::debug("Knowledge upsert for owner {}: {} inserted, {} duplicate(s)", owner,
                  report.inserted.size(), report.duplicates);
    return report;
}

Result<RowId> KnowledgeStore::addItem(OwnerId owner, EntityType type, const std::string& content,
                                      std::optional<KnowledgeMetadata> metadata,
                                      double confidence) {
    if (auto v = validateOwner(owner); !v) {
        return v.error();
    }
    KnowledgeItem item = KnowledgeItem::make(type, normalized(content), confidence);
    if (item.content.empty()) {
        return Error{ErrorCode::InvalidArgument, "Knowledge content is empty"};
    }
    if (confidence < 0.0 || confidence > 1.0) {
        return Error{ErrorCode::InvalidArgument, "Confidence must be within [0, 1]"};
    }
    if (metadata) {
        if (metadata->type() != type) {
            return Error{ErrorCode::InvalidArgument,
                         std::string("Metadata does not match entity type ") +
                             entityTypeName(type)};
        }
        item.metadata = std::move(*metadata);
    }

    RowId id = 0;
    {
        auto guard = db_.acquire();
        auto dup = isDuplicate(owner, type, item.content);
        if (!dup) {
            return dup.error();
        }
        if (dup.value()) {
            return Error{ErrorCode::AlreadyExists, "Duplicate " + std::string(entityTypeName(type))};
        }
        auto inserted = insertRow(owner, item);
        if (!inserted) {
            return inserted.error();
        }
        id = inserted.value();
    }

    scheduleEmbedding(owner, id, type, item.content);
    return id;
}

Result<bool> KnowledgeStore::update(OwnerId owner, RowId id, std::optional<std::string> content,
                                    std::optional<KnowledgeMetadata> metadata) {
    if (auto v = validateOwner(owner); !v) {
        return v.error();
    }
    if (content) {
        *content = normalized(*content);
        if (content->empty()) {
            return Error{ErrorCode::InvalidArgument, "Knowledge content is empty"};
        }
    }
    if (!content && !metadata) {
        return false;
    }

    EntityType type = EntityType::Fact;
    {
        auto guard = db_.acquire();
        auto existing = get(owner, id);
        if (!existing) {
            return existing.error();
        }
        if (!existing.value()) {
            return false;
        }
        type = existing.value()->type;
        if (metadata && metadata->type() != type) {
            return Error{ErrorCode::InvalidArgument, "Metadata does not match entity type"};
        }

        std::string sql = "UPDATE knowledge SET ";
        if (content) {
            sql += "content = ?, ";
        }
        if (metadata) {
            sql += "metadata = ?, ";
        }
        sql += "updated_at = datetime('now') WHERE id = ? AND owner_id = ?";

        auto stmt = db_.prepare(sql);
        if (!stmt) {
            return stmt.error();
        }
        auto& s = stmt.value();
        int idx = 1;
        if (content) {
            if (auto b = s.bind(idx++, *content); !b) {
                return b.error();
            }
        }
        if (metadata) {
            if (auto b = s.bind(idx++, metadata->toJson()); !b) {
                return b.error();
            }
        }
        if (auto b = s.bind(idx++, static_cast<int64_t>(id)); !b) {
            return b.error();
        }
        if (auto b = s.bind(idx++, static_cast<int64_t>(owner)); !b) {
            return b.error();
        }
        if (auto e = s.execute(); !e) {
            return e.error();
        }
        if (db_.changes() == 0) {
            return false;
        }
    }

    if (content) {
        // The previous embedding row is superseded and left for collectOrphans()
        scheduleEmbedding(owner, id, type, *content);
    }
    return true;
}

Result<bool> KnowledgeStore::deleteItem(OwnerId owner, RowId id) {
    if (auto v = validateOwner(owner); !v) {
        return v.error();
    }
    auto guard = db_.acquire();
    auto stmt = db_.prepare("DELETE FROM knowledge WHERE id = ? AND owner_id = ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bindAll(static_cast<int64_t>(id), static_cast<int64_t>(owner)); !b) {
        return b.error();
    }
    if (auto e = s.execute(); !e) {
        return e.error();
    }
    return db_.changes() > 0;
}

Result<std::vector<KnowledgeItem>> KnowledgeStore::getByType(OwnerId owner, EntityType type,
                                                             size_t limit, double minConfidence) {
    if (auto v = validateOwner(owner); !v) {
        return v.error();
    }
    auto guard = db_.acquire();
    auto stmt = db_.prepare(std::string(kSelectColumns) +
                            "WHERE owner_id = ? AND entity_type = ? AND confidence >= ? "
                            "ORDER BY created_at DESC, id DESC LIMIT ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bindAll(static_cast<int64_t>(owner), entityTypeName(type), minConfidence,
                           static_cast<int64_t>(limit));
        !b) {
        return b.error();
    }
    std::vector<KnowledgeItem> items;
    while (true) {
        auto step = s.step();
        if (!step) {
            return step.error();
        }
        if (!step.value()) {
            break;
        }
        items.push_back(readRow(s));
    }
    return items;
}

Result<std::vector<KnowledgeItem>>
KnowledgeStore::getFactsByCategory(OwnerId owner, const std::string& category, size_t limit,
                                   double minConfidence) {
    if (auto v = validateOwner(owner); !v) {
        return v.error();
    }
    auto guard = db_.acquire();
    auto stmt = db_.prepare(std::string(kSelectColumns) +
                            "WHERE owner_id = ? AND entity_type = 'fact' "
                            "AND json_extract(metadata, '$.category') = ? AND confidence >= ? "
                            "ORDER BY created_at DESC, id DESC LIMIT ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bindAll(static_cast<int64_t>(owner), category, minConfidence,
                           static_cast<int64_t>(limit));
        !b) {
        return b.error();
    }
    std::vector<KnowledgeItem> items;
    while (true) {
        auto step = s.step();
        if (!step) {
            return step.error();
        }
        if (!step.value()) {
            break;
        }
        items.push_back(readRow(s));
    }
    return items;
}

Result<std::vector<KnowledgeItem>> KnowledgeStore::getByIds(OwnerId owner,
                                                            const std::vector<RowId>& ids,
                                                            double minConfidence) {
    if (auto v = validateOwner(owner); !v) {
        return v.error();
    }
    std::vector<KnowledgeItem> items;
    if (ids.empty()) {
        return items;
    }

    auto guard = db_.acquire();
    auto stmt = db_.prepare(std::string(kSelectColumns) + "WHERE owner_id = ? AND id IN (" +
                            metadata::sql::placeholders(ids.size()) + ") AND confidence >= ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    int idx = 1;
    if (auto b = s.bind(idx++, static_cast<int64_t>(owner)); !b) {
        return b.error();
    }
    for (RowId id : ids) {
        if (auto b = s.bind(idx++, static_cast<int64_t>(id)); !b) {
            return b.error();
        }
    }
    if (auto b = s.bind(idx++, minConfidence); !b) {
        return b.error();
    }

    std::unordered_map<RowId, KnowledgeItem> byId;
    while (true) {
        auto step = s.step();
        if (!step) {
            return step.error();
        }
        if (!step.value()) {
            break;
        }
        auto item = readRow(s);
        byId.emplace(item.id, std::move(item));
    }
    for (RowId id : ids) {
        auto it = byId.find(id);
        if (it != byId.end()) {
            items.push_back(std::move(it->second));
            byId.erase(it);
        }
    }
    return items;
}

Result<std::optional<KnowledgeItem>> KnowledgeStore::get(OwnerId owner, RowId id) {
    auto items = getByIds(owner, {id});
    if (!items) {
        return items.error();
    }
    if (items.value().empty()) {
        return std::optional<KnowledgeItem>{};
    }
    return std::optional<KnowledgeItem>{std::move(items).value().front()};
}

Result<std::vector<KnowledgeItem>> KnowledgeStore::search(OwnerId owner, EntityType type,
                                                          const std::string& query, size_t limit,
                                                          double minConfidence) {
    if (auto v = validateOwner(owner); !v) {
        return v.error();
    }
    auto outcome = search_->run(owner, type, query, limit);
    if (outcome.ids.empty()) {
        return std::vector<KnowledgeItem>{};
    }
    spdlog::debug("{} search for owner {} served by {} ({} candidates)", entityTypeName(type),
                  owner, outcome.servedBy, outcome.ids.size());
    return getByIds(owner, outcome.ids, minConfidence);
}

Result<void> KnowledgeStore::markReferenced(OwnerId owner, const std::vector<RowId>& ids) {
    if (auto v = validateOwner(owner); !v) {
        return v;
    }
    if (ids.empty()) {
        return {};
    }
    auto guard = db_.acquire();
    auto stmt = db_.prepare("UPDATE knowledge SET last_referenced_at = datetime('now') "
                            "WHERE owner_id = ? AND id IN (" +
                            metadata::sql::placeholders(ids.size()) + ")");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    int idx = 1;
    if (auto b = s.bind(idx++, static_cast<int64_t>(owner)); !b) {
        return b;
    }
    for (RowId id : ids) {
        if (auto b = s.bind(idx++, static_cast<int64_t>(id)); !b) {
            return b;
        }
    }
    return s.execute();
}

Result<bool> KnowledgeStore::setGoalStatus(OwnerId owner, RowId id, const std::string& status) {
    auto existing = get(owner, id);
    if (!existing) {
        return existing.error();
    }
    if (!existing.value() || existing.value()->type != EntityType::Goal) {
        return false;
    }
    auto meta = existing.value()->metadata;
    std::get<GoalMetadata>(meta.typed).status = status;
    return update(owner, id, std::nullopt, std::move(meta));
}

Result<int64_t> KnowledgeStore::count(OwnerId owner, std::optional<EntityType> type) {
    if (auto v = validateOwner(owner); !v) {
        return v.error();
    }
    auto guard = db_.acquire();
    auto stmt = db_.prepare(type ? "SELECT COUNT(*) FROM knowledge WHERE owner_id = ? "
                                   "AND entity_type = ?"
                                 : "SELECT COUNT(*) FROM knowledge WHERE owner_id = ?");
    if (!stmt) {
        return stmt.error();
    }
    auto& s = stmt.value();
    if (auto b = s.bind(1, static_cast<int64_t>(owner)); !b) {
        return b.error();
    }
    if (type) {
        if (auto b = s.bind(2, entityTypeName(*type)); !b) {
            return b.error();
        }
    }
    auto step = s.step();
    if (!step) {
        return step.error();
    }
    return s.getInt64(0);
}

void KnowledgeStore::scheduleEmbedding(OwnerId owner, RowId id, EntityType type,
                                       std::string content) {
    if (!embeddings_ || !embeddings_->canEmbed()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pendingMutex_);
        ++pending_;
    }
    auto& pool = background_ ? *background_ : core::WorkerPool::background();
    pool.post([this, owner, id, type, content = std::move(content)]() {
        embedNow(owner, id, type, content);
        std::lock_guard<std::mutex> lock(pendingMutex_);
        --pending_;
        pendingCv_.notify_all();
    });
}

void KnowledgeStore::embedNow(OwnerId owner, RowId id, EntityType type,
                              const std::string& content) {
    try {
        auto embeddingId = embeddings_->upsertEmbedding(owner, sourceTypeFor(type), id, content);
        if (!embeddingId) {
            embeddingFailures_.fetch_add(1);
            spdlog::warn("Could not embed knowledge item {}: {}", id,
                         embeddingId.error().message);
            return;
        }

        auto guard = db_.acquire();
        // Skip if the content changed meanwhile; the newer task attaches its own embedding
        auto stmt = db_.prepare("UPDATE knowledge SET embedding_id = ? "
                                "WHERE id = ? AND owner_id = ? AND content = ?");
        if (!stmt) {
            embeddingFailures_.fetch_add(1);
            spdlog::warn("Could not attach embedding to item {}: {}", id, stmt.error().message);
            return;
        }
        auto& s = stmt.value();
        auto bound = s.bindAll(static_cast<int64_t>(embeddingId.value()), static_cast<int64_t>(id),
                               static_cast<int64_t>(owner), content);
        auto done = bound ? s.execute() : bound;
        if (!done) {
            embeddingFailures_.fetch_add(1);
            spdlog::warn("Could not attach embedding to item {}: {}", id, done.error().message);
        }
    } catch (const std::exception& e) {
        embeddingFailures_.fetch_add(1);
        spdlog::warn("Embedding task for knowledge item {} failed: {}", id, e.what());
    }
}

void KnowledgeStore::waitForPendingEmbeddings() {
    std::unique_lock<std::mutex> lock(pendingMutex_);
    pendingCv_.wait(lock, [this]() { return pending_ == 0; });
}

size_t KnowledgeStore::pendingEmbeddings() const {
    std::lock_guard<std::mutex> lock(pendingMutex_);
    return pending_;
}

} // namespace memex::knowledge
