#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <type_traits>
#include <memex/config/config_helpers.h>
#include <memex/config/memex_config.h>

namespace memex::config {

namespace {

std::string env(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

std::string lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

Error badValue(const std::string& section, const std::string& key, const std::string& raw) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for [" + section + "] " + key + ": '" + raw + "'"};
}

// Reads one key at a time; every setter leaves the default in place when the key is absent
class Reader {
public:
    explicit Reader(std::filesystem::path path) : path_(std::move(path)) {}

    std::string raw(const std::string& section, const std::string& key) const {
        return parse_config_value(path_, section, key);
    }

    Result<void> str(const std::string& section, const std::string& key, std::string& out) const {
        auto v = raw(section, key);
        if (!v.empty()) {
            out = v;
        }
        return {};
    }

    Result<void> path(const std::string& section, const std::string& key,
                      std::filesystem::path& out) const {
        auto v = raw(section, key);
        if (!v.empty()) {
            out = expand_tilde(v);
        }
        return {};
    }

    template <typename T>
    Result<void> number(const std::string& section, const std::string& key, T& out) const {
        auto v = raw(section, key);
        if (v.empty()) {
            return {};
        }
        try {
            size_t used = 0;
            if constexpr (std::is_floating_point_v<T>) {
                out = static_cast<T>(std::stod(v, &used));
            } else {
                const long long parsed = std::stoll(v, &used);
                if (parsed < 0 && std::is_unsigned_v<T>) {
                    return badValue(section, key, v);
                }
                out = static_cast<T>(parsed);
            }
            if (used != v.size()) {
                return badValue(section, key, v);
            }
        } catch (const std::logic_error&) {
            return badValue(section, key, v);
        }
        return {};
    }

    Result<void> flag(const std::string& section, const std::string& key, bool& out) const {
        auto v = raw(section, key);
        if (v.empty()) {
            return {};
        }
        auto parsed = parse_bool(v);
        if (!parsed) {
            return badValue(section, key, v);
        }
        out = parsed.value();
        return {};
    }

private:
    std::filesystem::path path_;
};

} // namespace

Result<bool> parse_bool(const std::string& raw) {
    const auto v = lower(raw);
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return false;
    }
    return Error{ErrorCode::InvalidArgument, "Not a boolean: " + raw};
}

Result<MemexConfig> MemexConfig::load(const std::string& overridePath) {
    MemexConfig cfg;
    cfg.configFile = get_config_path(overridePath);
    cfg.dataDir = get_data_dir();

    std::error_code ec;
    const bool haveFile = std::filesystem::exists(cfg.configFile, ec);
    if (!overridePath.empty() && !haveFile) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + cfg.configFile.string()};
    }

    if (haveFile) {
        Reader r(cfg.configFile);
        std::string paths;
        std::string extensions;
        const Result<void> steps[] = {
            r.path("core", "data_dir", cfg.dataDir),
            r.str("core", "log_level", cfg.logLevel),
            r.path("database", "path", cfg.databasePath),
            r.str("embeddings", "model", cfg.encoder.modelName),
            r.number("embeddings", "dimension", cfg.encoder.dimension),
            r.str("embeddings", "backend", cfg.encoder.backend),
            r.path("embeddings", "model_path", cfg.encoder.modelPath),
            r.path("embeddings", "cache_dir", cfg.encoder.cacheDir),
            r.number("embeddings", "max_sequence_length", cfg.encoder.maxSequenceLength),
            r.number("embeddings", "intra_op_threads", cfg.encoder.intraOpThreads),
            r.flag("embeddings", "vector_index", cfg.vectorIndex),
            r.number("workers", "embedding_threads", cfg.embeddingThreads),
            r.number("workers", "background_threads", cfg.backgroundThreads),
            r.flag("knowledge", "recency_boost", cfg.knowledge.recencyBoost),
            r.flag("index", "enabled", cfg.indexer.enabled),
            r.str("index", "paths", paths),
            r.str("index", "extensions", extensions),
            r.number("index", "max_file_size", cfg.indexer.filters.maxFileSize),
            r.number("index", "chunk_size", cfg.indexer.chunking.chunkSize),
            r.number("index", "chunk_overlap", cfg.indexer.chunking.overlap),
            r.number("index", "min_chunk_size", cfg.indexer.chunking.minChunkSize),
            r.number("index", "mtime_tolerance", cfg.indexer.mtimeTolerance),
            r.number("index", "embed_prefix_chars", cfg.indexer.embedPrefixChars),
            r.number("context", "facts", cfg.injector.factLimit),
            r.number("context", "goals", cfg.injector.goalLimit),
            r.number("context", "list_items", cfg.injector.listLimit),
            r.number("context", "files", cfg.injector.fileLimit),
            r.number("context", "min_confidence", cfg.injector.minConfidence),
            r.flag("context", "project_context", cfg.injector.projectContext),
            r.number("context", "project_readme_chars", cfg.injector.projectReadmeChars),
            r.number("context", "max_projects", cfg.injector.maxProjects),
        };
        for (const auto& step : steps) {
            if (!step) {
                return step.error();
            }
        }
        if (!paths.empty()) {
            cfg.indexer.roots = parse_path_list(paths);
        }
        if (!extensions.empty()) {
            cfg.indexer.filters.extensions.clear();
            for (auto& ext : parse_string_list(extensions)) {
                cfg.indexer.filters.extensions.push_back(ext.front() == '.' ? lower(ext)
                                                                            : "." + lower(ext));
            }
        }
    }

    if (auto v = env("MEMEX_DATA_DIR"); !v.empty()) {
        cfg.dataDir = expand_tilde(v);
    }
    if (auto v = env("MEMEX_DB_PATH"); !v.empty()) {
        cfg.databasePath = expand_tilde(v);
    }
    if (auto v = env("MEMEX_INDEX_PATHS"); !v.empty()) {
        cfg.indexer.roots = parse_path_list(v);
    }
    if (auto v = env("MEMEX_LOG_LEVEL"); !v.empty()) {
        cfg.logLevel = v;
    }
    if (auto v = env("MEMEX_EMBEDDING_BACKEND"); !v.empty()) {
        cfg.encoder.backend = v;
    }

    if (cfg.databasePath.empty()) {
        cfg.databasePath = cfg.dataDir / "memex.db";
    }
    if (cfg.encoder.modelPath.empty()) {
        cfg.encoder.modelPath = cfg.dataDir / "models" / cfg.encoder.modelName;
    }
    if (cfg.encoder.cacheDir.empty()) {
        cfg.encoder.cacheDir = get_cache_dir();
    }

    if (cfg.injector.minConfidence < 0.0 || cfg.injector.minConfidence > 1.0) {
        return badValue("context", "min_confidence", std::to_string(cfg.injector.minConfidence));
    }
    if (cfg.indexer.chunking.overlap >= cfg.indexer.chunking.chunkSize) {
        return Error{ErrorCode::InvalidArgument, "[index] chunk_overlap must be below chunk_size"};
    }
    if (cfg.encoder.dimension == 0) {
        return badValue("embeddings", "dimension", "0");
    }
    // Room for at least [CLS] and [SEP]
    if (cfg.encoder.maxSequenceLength < 2) {
        return badValue("embeddings", "max_sequence_length",
                        std::to_string(cfg.encoder.maxSequenceLength));
    }

    spdlog::debug("Loaded config from {} (data dir {})",
                  haveFile ? cfg.configFile.string() : std::string("defaults"),
                  cfg.dataDir.string());
    return cfg;
}

} // namespace memex::config
