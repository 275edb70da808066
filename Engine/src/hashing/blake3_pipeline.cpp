/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <sstream>
#include <iomanip>
#include <thread>
#include <algorithm>
#include <stdexcept>

namespace Dagstore {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::vector<BLAKE3Pipeline::Hash> BLAKE3Pipeline::hash_batch(const std::vector<std::vector<uint8_t>>& inputs) {
    std::vector<Hash> results(inputs.size());

    const size_t num_threads = std::min(
        (size_t)std::thread::hardware_concurrency(),
        inputs.size()
    );

    if (num_threads <= 1 || inputs.size() < 100) {
        // Serial for small batches
        for (size_t i = 0; i < inputs.size(); ++i) {
            results[i] = hash(inputs[i]);
        }
    } else {
        std::vector<std::thread> threads;
        size_t chunk_size = (inputs.size() + num_threads - 1) / num_threads;

        for (size_t t = 0; t < num_threads; ++t) {
            size_t start = t * chunk_size;
            size_t end = std::min(start + chunk_size, inputs.size());

            if (start >= inputs.size()) break;

            threads.emplace_back([&, start, end]() {
                for (size_t i = start; i < end; ++i) {
                    results[i] = hash(inputs[i]);
                }
            });
        }

        for (auto& thread : threads) {
            thread.join();
        }
    }

    return results;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << (int)byte;
    }

    return oss.str();
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    if (hex.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(hex.size()) +
                                    ". Expected " + std::to_string(HASH_SIZE * 2) + ".");
    }

    auto nibble = [&hex](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument("Invalid hex character in: " + hex);
    };

    Hash result = {0};
    for (size_t i = 0; i < HASH_SIZE; ++i) {
        result[i] = static_cast<uint8_t>((nibble(hex[i * 2]) << 4) | nibble(hex[i * 2 + 1]));
    }

    return result;
}

} // namespace Dagstore
