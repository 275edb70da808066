#pragma once

#include <export.hpp>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace Dagstore {

/**
 * @brief Bounded pool of background threads running flush jobs.
 *
 * Threads are started on demand, up to max_workers, when a job arrives and no
 * idle worker can take it. Jobs must not throw. The destructor runs every job
 * already submitted, then joins.
 *
 * submit() is all-or-nothing: if a needed thread cannot be started the job is
 * not queued and the error propagates to the caller.
 */
class DAGSTORE_API FlushWorkers {
public:
    using Job = std::function<void()>;
    // Starts a thread running the given loop; may throw std::system_error
    using ThreadFactory = std::function<std::thread(std::function<void()>)>;

    explicit FlushWorkers(size_t max_workers, ThreadFactory spawn = {});
    ~FlushWorkers();

    FlushWorkers(const FlushWorkers&) = delete;
    FlushWorkers& operator=(const FlushWorkers&) = delete;

    void submit(Job job);

    // Threads started so far
    size_t thread_count() const;

private:
    void worker();

    const size_t max_workers_;
    ThreadFactory spawn_;
    std::queue<Job> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;
    size_t idle_ = 0;
    bool stop_ = false;
};

} // namespace Dagstore
