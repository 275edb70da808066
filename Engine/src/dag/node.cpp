#include <dag/node.hpp>
#include <utility>

namespace Dagstore {

RawNode::RawNode(std::vector<uint8_t> data)
    : block_(Block::from_data(std::move(data))) {}

RawNode::RawNode(std::string_view data)
    : block_(Block::from_data(std::vector<uint8_t>(data.begin(), data.end()))) {}

} // namespace Dagstore
