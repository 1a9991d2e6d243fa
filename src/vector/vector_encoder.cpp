#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <stdexcept>
#include <system_error>
#include <unistd.h>
#include <memex/core/once_cell.h>
#include <memex/core/worker_pool.h>
#include <memex/vector/vector_encoder.h>

namespace memex::vector {

namespace {

uint64_t fnv1a(std::string_view s, uint64_t seed = 1469598103934665603ULL) {
    uint64_t h = seed;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::vector<std::string> wordTokens(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        // Bytes >= 0x80 are kept so UTF-8 words stay whole
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

bool isNoSpace(const std::system_error& e) {
    return e.code() == std::errc::no_space_on_device ||
           (e.code().category() == std::system_category() && e.code().value() == ENOSPC);
}

class EncoderInitError : public std::runtime_error {
public:
    explicit EncoderInitError(Error err) : std::runtime_error(err.message), error(std::move(err)) {}
    Error error;
};

} // namespace

HashingEncoderBackend::HashingEncoderBackend(size_t dimension)
    : dimension_(std::max<size_t>(dimension, 1)) {}

Result<std::vector<float>> HashingEncoderBackend::encode(const std::string& text) {
    std::vector<float> out(dimension_, 0.0f);
    auto tokens = wordTokens(text);
    if (tokens.empty()) {
        tokens.emplace_back("\x01empty");
    }

    auto add = [&](std::string_view feature, float weight) {
        const uint64_t h = fnv1a(feature);
        const size_t bucket = static_cast<size_t>(h % dimension_);
        const float sign = (h >> 63) ? -1.0f : 1.0f;
        out[bucket] += sign * weight;
    };

    for (size_t i = 0; i < tokens.size(); ++i) {
        add(tokens[i], 1.0f);
        if (i + 1 < tokens.size()) {
            add(tokens[i] + ' ' + tokens[i + 1], 0.5f);
        }
    }

    double norm = 0.0;
    for (float v : out) {
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm > 1e-12) {
        for (float& v : out) {
            v = static_cast<float>(v / norm);
        }
    } else {
        // All features cancelled out; fall back to a fixed unit vector
        out[fnv1a(text) % dimension_] = 1.0f;
    }
    return out;
}

Result<std::unique_ptr<IEncoderBackend>> makeEncoderBackend(const EncoderConfig& config) {
    if (config.backend == "hashing") {
        return std::unique_ptr<IEncoderBackend>(
            std::make_unique<HashingEncoderBackend>(config.dimension));
    }
    if (config.backend != "onnx" && config.backend != "auto") {
        return Error{ErrorCode::InvalidArgument, "Unknown encoder backend: " + config.backend};
    }

    auto onnx = makeOnnxEncoderBackend(config);
    auto init = onnx->initialize();
    if (init) {
        return std::move(onnx);
    }
    if (config.backend == "onnx") {
        return init.error();
    }
    spdlog::info("ONNX encoder unavailable ({}), using hashing encoder", init.error().message);
    return std::unique_ptr<IEncoderBackend>(
        std::make_unique<HashingEncoderBackend>(config.dimension));
}

size_t purgeStaleCaches(const std::filesystem::path& cacheDir, const std::string& prefix) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (cacheDir.empty() || !fs::is_directory(cacheDir, ec)) {
        return 0;
    }

    size_t removed = 0;
    for (fs::directory_iterator it(cacheDir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.rfind(prefix, 0) != 0 || !it->is_directory(ec)) {
            continue;
        }
        std::error_code rmEc;
        fs::remove_all(it->path(), rmEc);
        if (rmEc) {
            spdlog::warn("Could not purge encoder cache {}: {}", it->path().string(),
                         rmEc.message());
            continue;
        }
        ++removed;
    }
    if (removed > 0) {
        spdlog::info("Purged {} stale encoder cache dir(s) under {}", removed, cacheDir.string());
    }
    return removed;
}

std::filesystem::path encoderCacheDir(const EncoderConfig& config) {
    if (config.cacheDir.empty()) {
        return {};
    }
    return config.cacheDir / (config.cacheDirPrefix + std::to_string(::getpid()));
}

bool reportsNoSpace(std::string_view message) {
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("no space left on device") != std::string::npos ||
           lower.find("enospc") != std::string::npos;
}

VectorEncoder::VectorEncoder(EncoderConfig config, std::unique_ptr<IEncoderBackend> backend,
                             core::WorkerPool* pool)
    : config_(std::move(config)), backend_(std::move(backend)), pool_(pool) {
    if (!backend_) {
        throw std::invalid_argument("VectorEncoder requires a backend");
    }
}

VectorEncoder::~VectorEncoder() = default;

size_t VectorEncoder::dimension() const {
    return backend_->dimension();
}

std::string VectorEncoder::backendName() const {
    return backend_->name();
}

Result<std::vector<float>> VectorEncoder::encodeOnce(const std::string& text) {
    try {
        std::unique_lock<std::mutex> lock(backendMutex_, std::defer_lock);
        if (!backend_->threadSafe()) {
            lock.lock();
        }
        auto result = backend_->encode(text);
        if (result && result.value().size() != backend_->dimension()) {
            return Error{ErrorCode::InvalidData,
                         "Encoder produced " + std::to_string(result.value().size()) +
                             " values, expected " + std::to_string(backend_->dimension())};
        }
        if (!result && result.error().code != ErrorCode::StorageFull &&
            reportsNoSpace(result.error().message)) {
            return Error{ErrorCode::StorageFull, result.error().message};
        }
        return result;
    } catch (const std::system_error& e) {
        if (isNoSpace(e) || reportsNoSpace(e.what())) {
            return Error{ErrorCode::StorageFull, e.what()};
        }
        return Error{ErrorCode::InternalError, e.what()};
    } catch (const std::exception& e) {
        return Error{reportsNoSpace(e.what()) ? ErrorCode::StorageFull : ErrorCode::InternalError,
                     e.what()};
    }
}

Result<std::vector<float>> VectorEncoder::embedInline(const std::string& text) {
    auto result = encodeOnce(text);
    if (!result && result.error().code == ErrorCode::StorageFull) {
        spdlog::warn("Encoder hit no-space condition: {}; purging caches and retrying once",
                     result.error().message);
        purgeStaleCaches(config_.cacheDir, config_.cacheDirPrefix);
        cachePurges_.fetch_add(1);
        result = encodeOnce(text);
    }
    if (result) {
        encodeCount_.fetch_add(1);
    }
    return result;
}

std::future<Result<std::vector<float>>> VectorEncoder::embedAsync(std::string text) {
    auto& pool = pool_ ? *pool_ : core::WorkerPool::embedding();
    return pool.submit(
        [this, text = std::move(text)]() -> Result<std::vector<float>> { return embedInline(text); });
}

Result<std::vector<float>> VectorEncoder::embed(const std::string& text) {
    return embedAsync(text).get();
}

Result<std::shared_ptr<VectorEncoder>> sharedEncoder(const EncoderConfig& config) {
    static core::OnceCell<VectorEncoder> cell;
    try {
        auto encoder = cell.getOrInit([&config]() {
            auto backend = makeEncoderBackend(config);
            if (!backend) {
                throw EncoderInitError(backend.error());
            }
            auto enc = std::make_unique<VectorEncoder>(config, std::move(backend).value());
            // Warm-up under the init lock so the first-call cost is paid once
            auto warm = enc->embedInline("warm up");
            if (!warm) {
                throw EncoderInitError(warm.error());
            }
            spdlog::info("Vector encoder ready: model={} backend={} dim={}", config.modelName,
                         enc->backendName(), enc->dimension());
            return enc;
        });
        return encoder;
    } catch (const EncoderInitError& e) {
        spdlog::error("Vector encoder initialisation failed: {}", e.error.message);
        return e.error;
    } catch (const std::exception& e) {
        spdlog::error("Vector encoder initialisation failed: {}", e.what());
        return Error{ErrorCode::InternalError, e.what()};
    }
}

} // namespace memex::vector
