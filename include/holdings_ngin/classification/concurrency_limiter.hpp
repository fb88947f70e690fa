// include/holdings_ngin/classification/concurrency_limiter.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace holdings_ngin {

/**
 * @brief Counting semaphore bounding concurrent authoritative calls
 */
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(size_t limit) : limit_(limit == 0 ? 1 : limit) {}

    /**
     * @brief Take a permit, waiting no later than deadline
     * @return false if no permit became free in time
     */
    bool acquire_until(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_until(lock, deadline, [this] { return in_use_ < limit_; })) {
            return false;
        }
        ++in_use_;
        if (in_use_ > peak_)
            peak_ = in_use_;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (in_use_ > 0)
                --in_use_;
        }
        cv_.notify_one();
    }

    size_t in_use() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_use_;
    }

    /**
     * @brief Highest number of permits held at once since construction
     */
    size_t peak() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_;
    }

    size_t limit() const {
        return limit_;
    }

private:
    const size_t limit_;
    size_t in_use_{0};
    size_t peak_{0};
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace holdings_ngin
