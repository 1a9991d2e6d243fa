#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

namespace memex::core {

/**
 * @brief Bounded pool of worker threads for CPU-bound work.
 *
 * Embedding runs here so callers on the orchestration thread never block on
 * the model. Two process-wide pools exist: embedding() for encoder calls and
 * background() for fire-and-forget follow-up work (post-write embedding).
 */
class WorkerPool {
public:
    WorkerPool(std::string name, std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Run fn on the pool and return a future for its result.
     * Exceptions thrown by fn are delivered through the future.
     */
    template <typename Fn> auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using R = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        auto fut = task->get_future();
        boost::asio::post(*pool_, [task]() { (*task)(); });
        return fut;
    }

    /**
     * @brief Run fn on the pool without tracking its completion.
     */
    template <typename Fn> void post(Fn&& fn) { boost::asio::post(*pool_, std::forward<Fn>(fn)); }

    /**
     * @brief Block until all queued work has run; the pool cannot be reused afterwards.
     */
    void join();

    std::size_t threadCount() const { return threads_; }
    const std::string& name() const { return name_; }

    static WorkerPool& embedding();
    static WorkerPool& background();

    /**
     * @brief Set thread counts used when the shared pools are first created.
     * Has no effect once a pool exists.
     */
    static void configure(std::size_t embeddingThreads, std::size_t backgroundThreads);

private:
    std::string name_;
    std::size_t threads_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

} // namespace memex::core
