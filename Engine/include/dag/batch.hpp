/**
 * @file batch.hpp
 * @brief Buffered, concurrency-bounded writer of DAG nodes into a BlockStore
 */

#pragma once

#include <dag/batch_config.hpp>
#include <dag/completion_queue.hpp>
#include <dag/flush_workers.hpp>
#include <dag/node.hpp>
#include <storage/block_store.hpp>
#include <export.hpp>
#include <exception>
#include <vector>

namespace Dagstore {

/**
 * @brief Accumulates nodes and flushes them to a BlockStore in parallel.
 *
 * Nodes are buffered until the window passes max_bytes or max_blocks, then the
 * window is handed to a background flush and a fresh window starts at once.
 * At most max_parallel flushes run at a time; add() waits for a slot when the
 * bound is reached.
 *
 * The first flush failure is latched: every later add() throws BatchClosed
 * without buffering, and commit() rethrows the latched FlushFailed. Nothing
 * added since the batch was created is durable until commit() returns normally.
 *
 * Single producer: add() and commit() must not be called concurrently.
 * Destroying a batch drops its unflushed window; flushes already running are
 * waited for.
 */
class DAGSTORE_API Batch {
public:
    /**
     * @param spawn starts flush threads; defaults to plain std::thread
     * @throws std::invalid_argument if config.max_parallel is 0
     */
    explicit Batch(BlockStore& store, BatchConfig config = {},
                   FlushWorkers::ThreadFactory spawn = {});

    Batch(const Batch&) = delete;
    Batch& operator=(const Batch&) = delete;

    /**
     * @brief Buffer a node, flushing the window if it is now over a threshold.
     * @return the node's cid
     * @throws BatchClosed if a failure was already latched (node not buffered)
     * @throws FlushFailed if waiting for a flush slot surfaced a failure, or
     *         a flush thread could not be started (the batch is then closed)
     */
    Cid add(const Node& node);

    /**
     * @brief Flush the remaining window and wait for every outstanding flush.
     *
     * Calling it again is a no-op after success and rethrows after failure.
     * @throws FlushFailed with the first failure observed
     */
    void commit();

    size_t pending_bytes() const noexcept { return pending_bytes_; }
    size_t pending_blocks() const noexcept { return pending_.size(); }
    size_t in_flight() const noexcept { return in_flight_; }
    bool failed() const noexcept { return static_cast<bool>(error_); }
    const BatchConfig& config() const noexcept { return config_; }

private:
    // Non-blocking: account for flushes that have already finished
    void process_results();

    // Hand the current window to a flush worker, waiting for a slot if needed
    void async_commit();

    void record_result(std::exception_ptr result);
    bool over_threshold() const noexcept;

    BlockStore& store_;
    const BatchConfig config_;

    std::vector<Block> pending_;
    size_t pending_bytes_ = 0;

    size_t in_flight_ = 0;
    std::exception_ptr error_;

    CompletionQueue completions_;
    // Declared last: its destructor finishes running flushes while the
    // members above are still alive.
    FlushWorkers workers_;
};

} // namespace Dagstore
