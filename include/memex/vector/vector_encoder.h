#pragma once

#include <memex/core/types.h>
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace memex::core {
class WorkerPool;
}

namespace memex::vector {

/**
 * @brief Encoder configuration
 */
struct EncoderConfig {
    std::string modelName = "all-MiniLM-L6-v2";
    size_t dimension = 384;
    /// "auto" (onnx when compiled in and the model is present, else hashing), "onnx", "hashing"
    std::string backend = "auto";
    /// Directory holding model.onnx and vocab.txt for the onnx backend
    std::filesystem::path modelPath;
    /// Parent of the runtime's cache artefacts; stale entries here are purged on ENOSPC
    std::filesystem::path cacheDir;
    std::string cacheDirPrefix = "memex-encoder-";
    size_t maxSequenceLength = 256;
    int intraOpThreads = 2;
};

/**
 * @brief A text-to-vector model. Implementations need not be thread-safe;
 * VectorEncoder serialises calls that the backend reports as unsafe.
 */
class IEncoderBackend {
public:
    virtual ~IEncoderBackend() = default;

    virtual Result<void> initialize() = 0;
    virtual Result<std::vector<float>> encode(const std::string& text) = 0;
    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
    virtual bool threadSafe() const { return true; }
};

/**
 * @brief Deterministic signed feature-hashing encoder.
 *
 * Lowercased word unigrams and bigrams are hashed into `dimension` buckets
 * with a hash-derived sign, then L2-normalised. Texts sharing vocabulary land
 * close together, which is enough for lexical-semantic recall without a model
 * download.
 */
class HashingEncoderBackend : public IEncoderBackend {
public:
    explicit HashingEncoderBackend(size_t dimension = 384);

    Result<void> initialize() override { return {}; }
    Result<std::vector<float>> encode(const std::string& text) override;
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "hashing-" + std::to_string(dimension_); }

private:
    size_t dimension_;
};

/**
 * @brief Sentence-transformer encoder on ONNX Runtime (mean pooling + L2 norm).
 * Returns NotSupported from initialize() when built without ONNX Runtime.
 */
std::unique_ptr<IEncoderBackend> makeOnnxEncoderBackend(const EncoderConfig& config);

/**
 * @brief Pick a backend for the configuration ("auto" falls back to hashing).
 */
Result<std::unique_ptr<IEncoderBackend>> makeEncoderBackend(const EncoderConfig& config);

/**
 * @brief Remove cache directories under `cacheDir` whose name starts with `prefix`.
 * @return number of directories removed
 */
size_t purgeStaleCaches(const std::filesystem::path& cacheDir, const std::string& prefix);

/**
 * @brief This process's directory for runtime cache artefacts:
 * `cacheDir / (cacheDirPrefix + pid)`, or empty when no cacheDir is configured.
 */
std::filesystem::path encoderCacheDir(const EncoderConfig& config);

/// Whether a runtime or OS error message reports a full disk (ENOSPC)
bool reportsNoSpace(std::string_view message);

/**
 * @brief Thread-safe text encoder that runs the model on the embedding pool.
 *
 * A call that fails with StorageFull (ENOSPC while the runtime writes cache
 * artefacts) purges stale cache directories and is retried once; a second
 * failure is returned to the caller.
 */
class VectorEncoder {
public:
    VectorEncoder(EncoderConfig config, std::unique_ptr<IEncoderBackend> backend,
                  core::WorkerPool* pool = nullptr);
    ~VectorEncoder();

    VectorEncoder(const VectorEncoder&) = delete;
    VectorEncoder& operator=(const VectorEncoder&) = delete;

    /**
     * @brief Encode on the embedding pool and block for the result.
     */
    Result<std::vector<float>> embed(const std::string& text);

    /**
     * @brief Encode on the embedding pool without blocking the caller.
     */
    std::future<Result<std::vector<float>>> embedAsync(std::string text);

    /**
     * @brief Encode on the calling thread (used for warm-up and by pool tasks).
     */
    Result<std::vector<float>> embedInline(const std::string& text);

    size_t dimension() const;
    const std::string& modelName() const { return config_.modelName; }
    std::string backendName() const;
    uint64_t encodeCount() const { return encodeCount_.load(); }
    uint64_t cachePurges() const { return cachePurges_.load(); }

private:
    Result<std::vector<float>> encodeOnce(const std::string& text);

    EncoderConfig config_;
    std::unique_ptr<IEncoderBackend> backend_;
    core::WorkerPool* pool_;
    std::mutex backendMutex_;
    std::atomic<uint64_t> encodeCount_{0};
    std::atomic<uint64_t> cachePurges_{0};
};

/**
 * @brief Process-wide encoder, built and warmed up on first use.
 *
 * Concurrent first callers block behind one initialisation. If initialisation
 * fails the error is returned and the next call tries again.
 */
Result<std::shared_ptr<VectorEncoder>> sharedEncoder(const EncoderConfig& config = {});

} // namespace memex::vector
