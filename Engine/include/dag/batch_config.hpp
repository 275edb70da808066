#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <string>

namespace Dagstore {

/**
 * @brief Default bound on concurrent flushes: twice the hardware threads, at least 2.
 */
size_t default_parallel_commits();

/**
 * @brief Flush thresholds and concurrency bound for a Batch.
 *
 * A window is flushed once its byte total exceeds max_bytes or its block count
 * exceeds max_blocks. Zero on either axis disables that axis. max_parallel
 * must be at least 1.
 */
struct BatchConfig {
    size_t max_bytes = 8 << 20;
    size_t max_blocks = 128;
    size_t max_parallel = default_parallel_commits();

    /**
     * @brief Read max_bytes / max_blocks / max_parallel from a JSON object.
     * Missing keys keep their defaults.
     * @throws nlohmann::json::exception on wrong value types
     */
    static BatchConfig from_json(const nlohmann::json& json);
};

/**
 * @brief Load a BatchConfig from a JSON file
 * @throws std::runtime_error if the file cannot be opened
 */
BatchConfig load_batch_config(const std::string& path);

} // namespace Dagstore
