#include <dag/batch.hpp>
#include <dag/batch_error.hpp>
#include <stdexcept>
#include <utility>

namespace Dagstore {

namespace {

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

const BatchConfig& validated(const BatchConfig& config) {
    if (config.max_parallel == 0) {
        throw std::invalid_argument("BatchConfig: max_parallel must be at least 1");
    }
    return config;
}

} // namespace

Batch::Batch(BlockStore& store, BatchConfig config, FlushWorkers::ThreadFactory spawn)
    : store_(store),
      config_(validated(config)),
      workers_(config_.max_parallel, std::move(spawn)) {}

Cid Batch::add(const Node& node) {
    // Not required for correctness; surfaces failures as early as possible.
    process_results();
    if (error_) {
        throw BatchClosed(describe(error_), error_);
    }

    Block block = node.to_block();
    Cid cid = block.cid();
    pending_bytes_ += block.size();
    pending_.push_back(std::move(block));

    if (over_threshold()) {
        async_commit();
        if (error_) std::rethrow_exception(error_);
    }
    return cid;
}

void Batch::commit() {
    async_commit();
    // Drain everything, even after a failure, so no flush outlives this call.
    while (in_flight_ > 0) {
        record_result(completions_.pop());
    }
    if (error_) std::rethrow_exception(error_);
}

void Batch::process_results() {
    while (in_flight_ > 0 && !error_) {
        auto result = completions_.try_pop();
        if (!result) return;
        record_result(std::move(*result));
    }
}

void Batch::async_commit() {
    if (pending_.empty() || error_) return;

    if (in_flight_ >= config_.max_parallel) {
        record_result(completions_.pop());
        if (error_) return;
    }

    size_t window = pending_.size();
    std::vector<Block> blocks = std::move(pending_);
    pending_.clear();
    pending_bytes_ = 0;

    try {
        workers_.submit([this, blocks = std::move(blocks)]() {
            std::exception_ptr result;
            try {
                store_.put_many(blocks);
            } catch (...) {
                result = std::current_exception();
            }
            completions_.push(std::move(result));
        });
    } catch (const std::exception& e) {
        // The window is gone; close the batch so commit() cannot report success.
        error_ = std::make_exception_ptr(
            FlushFailed(std::string("could not schedule flush: ") + e.what(),
                        std::current_exception()));
        return;
    }
    ++in_flight_;

    pending_.reserve(window);
}

void Batch::record_result(std::exception_ptr result) {
    --in_flight_;
    if (result && !error_) {
        error_ = std::make_exception_ptr(FlushFailed(describe(result), result));
    }
}

bool Batch::over_threshold() const noexcept {
    return (config_.max_bytes != 0 && pending_bytes_ > config_.max_bytes) ||
           (config_.max_blocks != 0 && pending_.size() > config_.max_blocks);
}

} // namespace Dagstore
