#pragma once

#include <atomic>
#include <memory>
#include <mutex>

namespace memex::core {

/**
 * @brief Lazily initialised, process-lifetime value.
 *
 * getOrInit() reads the published pointer without locking; only the first
 * callers take the mutex, and exactly one of them runs the factory. The
 * factory runs under the lock, so any warm-up it performs is paid once and
 * concurrent first callers wait for it instead of racing to build copies.
 * A factory that throws leaves the cell empty so a later call can retry.
 */
template <typename T> class OnceCell {
public:
    OnceCell() = default;
    OnceCell(const OnceCell&) = delete;
    OnceCell& operator=(const OnceCell&) = delete;

    template <typename Factory> std::shared_ptr<T> getOrInit(Factory&& factory) {
        if (auto* ready = published_.load(std::memory_order_acquire)) {
            return *ready;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto* ready = published_.load(std::memory_order_relaxed)) {
            return *ready;
        }
        storage_ = std::shared_ptr<T>(factory());
        published_.store(&storage_, std::memory_order_release);
        return storage_;
    }

    std::shared_ptr<T> get() const {
        auto* ready = published_.load(std::memory_order_acquire);
        return ready ? *ready : nullptr;
    }

    bool initialized() const { return published_.load(std::memory_order_acquire) != nullptr; }

private:
    std::mutex mutex_;
    std::shared_ptr<T> storage_;
    std::atomic<std::shared_ptr<T>*> published_{nullptr};
};

} // namespace memex::core
