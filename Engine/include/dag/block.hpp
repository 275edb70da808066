/**
 * @file block.hpp
 * @brief Immutable content-addressed blocks
 */

#pragma once

#include <hashing/blake3_pipeline.hpp>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace Dagstore {

// A block's identifier: the BLAKE3 digest of its bytes.
using Cid = BLAKE3Pipeline::Hash;

struct CidHash {
    size_t operator()(const Cid& cid) const noexcept {
        // The digest is already uniformly distributed
        size_t h;
        std::memcpy(&h, cid.data(), sizeof(h));
        return h;
    }
};

inline std::string cid_to_string(const Cid& cid) {
    return BLAKE3Pipeline::to_hex(cid);
}

/**
 * @brief Immutable byte blob paired with its content identifier.
 *
 * Copies share the payload, so queuing a block for a flush never copies its bytes.
 */
class Block {
public:
    /**
     * @brief Build a block from raw bytes, deriving the cid
     */
    static Block from_data(std::vector<uint8_t> data);

    /**
     * @brief Build a block with a cid already computed by the caller (not re-verified)
     */
    Block(const Cid& cid, std::vector<uint8_t> data);

    const Cid& cid() const noexcept { return cid_; }
    const std::vector<uint8_t>& data() const noexcept { return *data_; }
    size_t size() const noexcept { return data_->size(); }

    // Recompute the digest and compare it with the stored cid
    bool verify() const;

private:
    Cid cid_;
    std::shared_ptr<const std::vector<uint8_t>> data_;
};

} // namespace Dagstore
