#include <dag/flush_workers.hpp>
#include <stdexcept>
#include <utility>

namespace Dagstore {

FlushWorkers::FlushWorkers(size_t max_workers, ThreadFactory spawn)
    : max_workers_(max_workers), spawn_(std::move(spawn)) {
    if (max_workers_ == 0) {
        throw std::invalid_argument("FlushWorkers: max_workers must be at least 1");
    }
    if (!spawn_) {
        spawn_ = [](std::function<void()> loop) { return std::thread(std::move(loop)); };
    }
    workers_.reserve(max_workers_);
}

FlushWorkers::~FlushWorkers() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_)
        if (t.joinable()) t.join();
}

void FlushWorkers::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Start the thread first so a failure leaves the queue untouched.
        // The new worker blocks on mutex_ until the job is queued.
        if (queue_.size() + 1 > idle_ && workers_.size() < max_workers_)
            workers_.push_back(spawn_([this] { worker(); }));
        queue_.push(std::move(job));
    }
    cv_.notify_one();
}

size_t FlushWorkers::thread_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

void FlushWorkers::worker() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++idle_;
            cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
            --idle_;
            if (stop_ && queue_.empty()) break;
            job = std::move(queue_.front());
            queue_.pop();
        }
        job();
    }
}

} // namespace Dagstore
