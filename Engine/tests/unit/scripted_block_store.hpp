/**
 * @file scripted_block_store.hpp
 * @brief Test store with scripted failures and a gate for holding flushes
 */

#pragma once

#include <storage/memory_block_store.hpp>
#include <dag/flush_workers.hpp>
#include <dag/node.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace Dagstore::testing {

class ScriptedBlockStore : public BlockStore {
public:
    // Make the n-th put_many call (1-based, in arrival order) throw
    void fail_on_call(size_t n, std::string message = "disk full") {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_on_ = n;
        fail_message_ = std::move(message);
    }

    // Calls entering put_many wait until release()
    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    bool wait_for_active(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return active_ >= n; });
    }

    bool wait_for_finished(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return finished_ >= n; });
    }

    void put_many(const std::vector<Block>& blocks) override {
        size_t call;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            call = ++calls_;
            call_sizes_.push_back(blocks.size());
            ++active_;
            max_active_ = std::max(max_active_, active_);
            cv_.notify_all();
            cv_.wait(lock, [this] { return !held_; });
        }

        bool fail;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fail = (call == fail_on_);
        }
        if (!fail) {
            inner_.put_many(blocks);
        }

        std::string message;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
            ++finished_;
            message = fail_message_;
        }
        cv_.notify_all();

        if (fail) throw std::runtime_error(message);
    }

    bool has(const Cid& cid) override { return inner_.has(cid); }
    std::optional<Block> get(const Cid& cid) override { return inner_.get(cid); }
    size_t size() override { return inner_.size(); }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_;
    }

    size_t max_active() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_active_;
    }

    size_t finished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return finished_;
    }

    std::vector<size_t> call_sizes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return call_sizes_;
    }

    uint64_t bytes_written() const { return inner_.bytes_written(); }

private:
    MemoryBlockStore inner_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
    size_t fail_on_ = 0;
    std::string fail_message_ = "disk full";
    size_t calls_ = 0;
    size_t active_ = 0;
    size_t max_active_ = 0;
    size_t finished_ = 0;
    std::vector<size_t> call_sizes_;
};

// Counter a test thread can wait on instead of sleeping
class ProgressCounter {
public:
    void bump() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++value_;
        }
        cv_.notify_all();
    }

    bool wait_for(size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return value_ >= n; });
    }

    size_t value() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t value_ = 0;
};

// Lets the first `allowed` thread starts through, fails the next `failures`,
// then succeeds again.
inline FlushWorkers::ThreadFactory limited_threads(size_t allowed, size_t failures = SIZE_MAX) {
    auto starts = std::make_shared<std::atomic<size_t>>(0);
    return [=](std::function<void()> loop) {
        size_t n = (*starts)++;
        if (n >= allowed && n - allowed < failures) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread start refused");
        }
        return std::thread(std::move(loop));
    };
}

// Raw node of `size` bytes whose content is unique per seed
inline RawNode make_node(size_t size, uint32_t seed) {
    std::vector<uint8_t> data(size, static_cast<uint8_t>(seed & 0xFF));
    for (size_t i = 0; i < 4 && i < size; ++i) {
        data[i] = static_cast<uint8_t>((seed >> (i * 8)) & 0xFF);
    }
    if (size > 4) data[4] = 0xA5;
    return RawNode(std::move(data));
}

} // namespace Dagstore::testing
