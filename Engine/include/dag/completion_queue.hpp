#pragma once

#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <queue>

namespace Dagstore {

/**
 * @brief Outcome channel between flush workers and the batch owner.
 *
 * Many workers push, one consumer pops. Each message is one flush outcome:
 * a null exception_ptr for success, the captured exception otherwise.
 */
class CompletionQueue {
public:
    void push(std::exception_ptr result) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            results_.push(std::move(result));
        }
        cv_.notify_one();
    }

    /**
     * @brief Take a result if one is ready. Never blocks.
     */
    std::optional<std::exception_ptr> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (results_.empty()) return std::nullopt;
        std::exception_ptr result = std::move(results_.front());
        results_.pop();
        return result;
    }

    /**
     * @brief Block until a result is available and take it.
     */
    std::exception_ptr pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !results_.empty(); });
        std::exception_ptr result = std::move(results_.front());
        results_.pop();
        return result;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::exception_ptr> results_;
};

} // namespace Dagstore
