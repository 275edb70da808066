#include <dag/block.hpp>
#include <utility>

namespace Dagstore {

Block Block::from_data(std::vector<uint8_t> data) {
    Cid cid = BLAKE3Pipeline::hash(data);
    return Block(cid, std::move(data));
}

Block::Block(const Cid& cid, std::vector<uint8_t> data)
    : cid_(cid), data_(std::make_shared<const std::vector<uint8_t>>(std::move(data))) {}

bool Block::verify() const {
    return BLAKE3Pipeline::hash(*data_) == cid_;
}

} // namespace Dagstore
