/**
 * @file block_store.hpp
 * @brief Persistent content-addressed block storage interface
 */

#pragma once

#include <dag/block.hpp>
#include <export.hpp>
#include <optional>
#include <vector>

namespace Dagstore {

/**
 * @brief Content-addressed block store.
 *
 * put_many() is the bulk write used by Batch flushes. It reports failure by
 * throwing; the exception type is the store's own and is preserved by callers.
 * Implementations must accept concurrent put_many() calls from several threads.
 */
class DAGSTORE_API BlockStore {
public:
    virtual ~BlockStore() = default;

    /**
     * @brief Persist a sequence of blocks. Blocks already present are skipped.
     * @throws on the first failure; blocks before it may or may not be stored
     */
    virtual void put_many(const std::vector<Block>& blocks) = 0;

    virtual bool has(const Cid& cid) = 0;
    virtual std::optional<Block> get(const Cid& cid) = 0;

    // Number of distinct blocks held
    virtual size_t size() = 0;

    void put(const Block& block) {
        put_many(std::vector<Block>{block});
    }
};

} // namespace Dagstore
