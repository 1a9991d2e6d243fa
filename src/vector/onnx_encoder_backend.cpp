#include <spdlog/spdlog.h>
#include <memex/vector/vector_encoder.h>

#ifdef MEMEX_USE_ONNX_RUNTIME
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <unordered_map>
#endif

namespace memex::vector {

#ifdef MEMEX_USE_ONNX_RUNTIME

namespace {

// BERT-style basic tokenisation followed by greedy longest-match WordPiece.
class WordPieceTokenizer {
public:
    Result<void> load(const std::filesystem::path& vocabPath) {
        std::ifstream in(vocabPath);
        if (!in) {
            return Error{ErrorCode::FileNotFound, "Vocabulary not found: " + vocabPath.string()};
        }
        std::string line;
        int64_t id = 0;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            vocab_.emplace(line, id++);
        }
        auto lookup = [this](const char* tok, int64_t& out) {
            auto it = vocab_.find(tok);
            if (it == vocab_.end())
                return false;
            out = it->second;
            return true;
        };
        if (!lookup("[CLS]", cls_) || !lookup("[SEP]", sep_) || !lookup("[UNK]", unk_)) {
            return Error{ErrorCode::InvalidData, "Vocabulary lacks [CLS]/[SEP]/[UNK]"};
        }
        return {};
    }

    std::vector<int64_t> encode(const std::string& text, size_t maxLen) const {
        maxLen = std::max<size_t>(maxLen, 2);
        std::vector<int64_t> ids{cls_};
        for (const auto& word : basicTokens(text)) {
            appendWordPieces(word, ids);
            if (ids.size() >= maxLen - 1) {
                ids.resize(maxLen - 1);
                break;
            }
        }
        ids.push_back(sep_);
        return ids;
    }

private:
    static std::vector<std::string> basicTokens(const std::string& text) {
        std::vector<std::string> out;
        std::string cur;
        auto flush = [&]() {
            if (!cur.empty()) {
                out.push_back(std::move(cur));
                cur.clear();
            }
        };
        for (unsigned char c : text) {
            if (std::isspace(c)) {
                flush();
            } else if (c < 0x80 && std::ispunct(c)) {
                flush();
                out.emplace_back(1, static_cast<char>(c));
            } else {
                cur.push_back(static_cast<char>(std::tolower(c)));
            }
        }
        flush();
        return out;
    }

    void appendWordPieces(const std::string& word, std::vector<int64_t>& ids) const {
        if (word.size() > 100) {
            ids.push_back(unk_);
            return;
        }
        std::vector<int64_t> pieces;
        size_t start = 0;
        while (start < word.size()) {
            size_t end = word.size();
            int64_t found = -1;
            while (start < end) {
                std::string sub = word.substr(start, end - start);
                if (start > 0) {
                    sub = "##" + sub;
                }
                auto it = vocab_.find(sub);
                if (it != vocab_.end()) {
                    found = it->second;
                    break;
                }
                --end;
            }
            if (found < 0) {
                ids.push_back(unk_);
                return;
            }
            pieces.push_back(found);
            start = end;
        }
        ids.insert(ids.end(), pieces.begin(), pieces.end());
    }

    std::unordered_map<std::string, int64_t> vocab_;
    int64_t cls_ = 0;
    int64_t sep_ = 0;
    int64_t unk_ = 0;
};

class OnnxEncoderBackend : public IEncoderBackend {
public:
    explicit OnnxEncoderBackend(EncoderConfig config)
        : config_(std::move(config)), env_(ORT_LOGGING_LEVEL_WARNING, "memex") {}

    Result<void> initialize() override {
        const auto modelFile = config_.modelPath / "model.onnx";
        std::error_code ec;
        if (config_.modelPath.empty() || !std::filesystem::exists(modelFile, ec)) {
            return Error{ErrorCode::FileNotFound, "Model file not found: " + modelFile.string()};
        }
        if (auto vocab = tokenizer_.load(config_.modelPath / "vocab.txt"); !vocab) {
            return vocab;
        }

        try {
            options_.SetIntraOpNumThreads(std::max(1, config_.intraOpThreads));
            options_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
            try {
                createSession(modelFile);
            } catch (const Ort::Exception& e) {
                if (!reportsNoSpace(e.what())) {
                    throw;
                }
                spdlog::warn("Model load hit no-space condition: {}; purging caches and retrying",
                             e.what());
                purgeStaleCaches(config_.cacheDir, config_.cacheDirPrefix);
                createSession(modelFile);
            }

            Ort::AllocatorWithDefaultOptions allocator;
            for (size_t i = 0; i < session_->GetInputCount(); ++i) {
                inputNames_.emplace_back(session_->GetInputNameAllocated(i, allocator).get());
            }
            for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
                outputNames_.emplace_back(session_->GetOutputNameAllocated(i, allocator).get());
            }
        } catch (const Ort::Exception& e) {
            return Error{failureCode(e), std::string("Failed to load model: ") + e.what()};
        }
        if (inputNames_.size() < 2 || outputNames_.empty()) {
            return Error{ErrorCode::InvalidData,
                         "Model should have at least 2 inputs (input_ids, attention_mask)"};
        }
        spdlog::debug("Loaded ONNX model {} ({} inputs)", modelFile.string(), inputNames_.size());
        return {};
    }

    Result<std::vector<float>> encode(const std::string& text) override {
        if (!session_) {
            return Error{ErrorCode::NotInitialized, "ONNX session not initialised"};
        }
        auto ids = tokenizer_.encode(text, config_.maxSequenceLength);
        const auto len = static_cast<int64_t>(ids.size());
        std::vector<int64_t> mask(ids.size(), 1);
        std::vector<int64_t> typeIds(ids.size(), 0);
        std::vector<int64_t> shape{1, len};

        auto memoryInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::vector<Ort::Value> inputs;
        inputs.push_back(
            Ort::Value::CreateTensor<int64_t>(memoryInfo, ids.data(), ids.size(), shape.data(), 2));
        inputs.push_back(Ort::Value::CreateTensor<int64_t>(memoryInfo, mask.data(), mask.size(),
                                                           shape.data(), 2));
        if (inputNames_.size() >= 3) {
            inputs.push_back(Ort::Value::CreateTensor<int64_t>(memoryInfo, typeIds.data(),
                                                               typeIds.size(), shape.data(), 2));
        }

        std::vector<const char*> inNames;
        for (size_t i = 0; i < inputs.size(); ++i) {
            inNames.push_back(inputNames_[i].c_str());
        }
        const char* outName = outputNames_[0].c_str();

        std::vector<Ort::Value> outputs;
        try {
            outputs = session_->Run(Ort::RunOptions{nullptr}, inNames.data(), inputs.data(),
                                    inputs.size(), &outName, 1);
        } catch (const Ort::Exception& e) {
            return Error{failureCode(e), std::string("Inference failed: ") + e.what()};
        }

        auto outShape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        if (outShape.size() != 3 || static_cast<size_t>(outShape[2]) != config_.dimension) {
            return Error{ErrorCode::InvalidData, "Unexpected model output shape"};
        }
        const float* data = outputs[0].GetTensorData<float>();
        const size_t seqLen = static_cast<size_t>(outShape[1]);
        const size_t hidden = static_cast<size_t>(outShape[2]);

        // Attention-mask-weighted mean pooling, then L2 normalisation
        std::vector<float> embedding(hidden, 0.0f);
        for (size_t t = 0; t < seqLen; ++t) {
            for (size_t d = 0; d < hidden; ++d) {
                embedding[d] += data[t * hidden + d];
            }
        }
        double norm = 0.0;
        for (float& v : embedding) {
            v /= static_cast<float>(seqLen);
            norm += static_cast<double>(v) * v;
        }
        norm = std::sqrt(norm);
        if (norm > 1e-8) {
            for (float& v : embedding) {
                v = static_cast<float>(v / norm);
            }
        }
        return embedding;
    }

    size_t dimension() const override { return config_.dimension; }
    std::string name() const override { return "onnx:" + config_.modelName; }
    bool threadSafe() const override { return true; }

private:
    static ErrorCode failureCode(const Ort::Exception& e) {
        return reportsNoSpace(e.what()) ? ErrorCode::StorageFull : ErrorCode::InternalError;
    }

    // The optimized graph is written under this process's cache directory
    void createSession(const std::filesystem::path& modelFile) {
        const auto cacheDir = encoderCacheDir(config_);
        if (!cacheDir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(cacheDir, ec);
            if (ec) {
                spdlog::warn("Encoder cache dir {} unavailable: {}", cacheDir.string(),
                             ec.message());
            } else {
                optimizedModel_ = cacheDir / "model.optimized.onnx";
                options_.SetOptimizedModelFilePath(optimizedModel_.c_str());
            }
        }
        session_ = std::make_unique<Ort::Session>(env_, modelFile.c_str(), options_);
    }

    EncoderConfig config_;
    Ort::Env env_;
    Ort::SessionOptions options_;
    std::filesystem::path optimizedModel_;
    std::unique_ptr<Ort::Session> session_;
    WordPieceTokenizer tokenizer_;
    std::vector<std::string> inputNames_;
    std::vector<std::string> outputNames_;
};

} // namespace

std::unique_ptr<IEncoderBackend> makeOnnxEncoderBackend(const EncoderConfig& config) {
    return std::make_unique<OnnxEncoderBackend>(config);
}

#else

namespace {

class UnavailableOnnxBackend : public IEncoderBackend {
public:
    explicit UnavailableOnnxBackend(size_t dimension) : dimension_(dimension) {}

    Result<void> initialize() override {
        return Error{ErrorCode::NotSupported, "built without ONNX Runtime"};
    }
    Result<std::vector<float>> encode(const std::string&) override {
        return Error{ErrorCode::NotSupported, "built without ONNX Runtime"};
    }
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "onnx-unavailable"; }

private:
    size_t dimension_;
};

} // namespace

std::unique_ptr<IEncoderBackend> makeOnnxEncoderBackend(const EncoderConfig& config) {
    return std::make_unique<UnavailableOnnxBackend>(config.dimension);
}

#endif

} // namespace memex::vector
