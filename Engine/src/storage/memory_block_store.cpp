#include <storage/memory_block_store.hpp>

namespace Dagstore {

void MemoryBlockStore::put_many(const std::vector<Block>& blocks) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++put_calls_;
    for (const auto& block : blocks) {
        bytes_written_ += block.size();
        blocks_.emplace(block.cid(), block);
    }
}

bool MemoryBlockStore::has(const Cid& cid) {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocks_.count(cid) > 0;
}

std::optional<Block> MemoryBlockStore::get(const Cid& cid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blocks_.find(cid);
    if (it == blocks_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryBlockStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocks_.size();
}

size_t MemoryBlockStore::put_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return put_calls_;
}

uint64_t MemoryBlockStore::bytes_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_written_;
}

} // namespace Dagstore
