#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <memex/core/worker_pool.h>

namespace memex::core {

namespace {

std::atomic<std::size_t> gEmbeddingThreads{0};
std::atomic<std::size_t> gBackgroundThreads{0};

std::size_t defaultEmbeddingThreads() {
    auto hw = std::thread::hardware_concurrency();
    if (hw == 0)
        hw = 2;
    return std::clamp<std::size_t>(hw / 2, 1, 8);
}

} // namespace

WorkerPool::WorkerPool(std::string name, std::size_t threads)
    : name_(std::move(name)), threads_(std::max<std::size_t>(threads, 1)),
      pool_(std::make_unique<boost::asio::thread_pool>(threads_)) {
    spdlog::debug("[WorkerPool:{}] Initialized with {} threads", name_, threads_);
}

WorkerPool::~WorkerPool() {
    join();
}

void WorkerPool::join() {
    if (pool_) {
        pool_->join();
    }
}

void WorkerPool::configure(std::size_t embeddingThreads, std::size_t backgroundThreads) {
    gEmbeddingThreads.store(embeddingThreads);
    gBackgroundThreads.store(backgroundThreads);
}

WorkerPool& WorkerPool::embedding() {
    static std::once_flag flag;
    static std::unique_ptr<WorkerPool> inst;
    std::call_once(flag, []() {
        auto threads = gEmbeddingThreads.load();
        inst = std::make_unique<WorkerPool>("embedding",
                                            threads > 0 ? threads : defaultEmbeddingThreads());
    });
    return *inst;
}

WorkerPool& WorkerPool::background() {
    static std::once_flag flag;
    static std::unique_ptr<WorkerPool> inst;
    std::call_once(flag, []() {
        auto threads = gBackgroundThreads.load();
        inst = std::make_unique<WorkerPool>("background", threads > 0 ? threads : 2);
    });
    return *inst;
}

} // namespace memex::core
