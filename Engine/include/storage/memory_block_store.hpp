#pragma once

#include <storage/block_store.hpp>
#include <mutex>
#include <unordered_map>

namespace Dagstore {

/**
 * @brief In-process block store.
 *
 * Used by the import tool's --memory mode and as the reference store in tests.
 * Also records how many bulk writes it served and how many bytes they carried.
 */
class MemoryBlockStore : public BlockStore {
public:
    void put_many(const std::vector<Block>& blocks) override;
    bool has(const Cid& cid) override;
    std::optional<Block> get(const Cid& cid) override;
    size_t size() override;

    size_t put_calls() const;
    // Bytes received across all put_many calls, duplicates included
    uint64_t bytes_written() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<Cid, Block, CidHash> blocks_;
    size_t put_calls_ = 0;
    uint64_t bytes_written_ = 0;
};

} // namespace Dagstore
