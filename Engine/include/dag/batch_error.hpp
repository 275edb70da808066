#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace Dagstore {

/**
 * @brief Base for errors raised by Batch::add() and Batch::commit().
 *
 * cause() holds the exception that led to this one, so callers can rethrow
 * and inspect the store's own error.
 */
class BatchError : public std::runtime_error {
public:
    BatchError(const std::string& what, std::exception_ptr cause)
        : std::runtime_error(what), cause_(std::move(cause)) {}

    const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

/**
 * @brief A bulk write to the block store failed. Terminal for the batch.
 */
class FlushFailed : public BatchError {
public:
    FlushFailed(const std::string& store_message, std::exception_ptr cause)
        : BatchError("Block flush failed: " + store_message, std::move(cause)) {}
};

/**
 * @brief add() was called after the batch latched a failure; the node was not buffered.
 *
 * cause() is the latched FlushFailed.
 */
class BatchClosed : public BatchError {
public:
    BatchClosed(const std::string& latched_message, std::exception_ptr latched)
        : BatchError("Batch closed after failure: " + latched_message, std::move(latched)) {}
};

} // namespace Dagstore
