/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 hashing used to derive block content identifiers
 */

#pragma once

#include <vector>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Dagstore {

/**
 * @brief BLAKE3 hashing for content addressing
 *
 * Every block is named by the digest of its bytes:
 * SAME CONTENT = SAME CID = STORED ONCE
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = BLAKE3_OUT_LEN; // 256 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 32-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    static Hash hash(const std::vector<uint8_t>& data) {
        return hash(data.data(), data.size());
    }

    /**
     * @brief Batch hash multiple inputs (parallel)
     * @param inputs Vector of input buffers
     * @return Vector of hashes (same order)
     */
    static std::vector<Hash> hash_batch(const std::vector<std::vector<uint8_t>>& inputs);

    /**
     * @brief Convert hash to lowercase hex string
     */
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Convert hex string to hash
     * @throws std::invalid_argument on bad length or non-hex characters
     */
    static Hash from_hex(const std::string& hex);
};

} // namespace Dagstore
