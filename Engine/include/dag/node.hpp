/**
 * @file node.hpp
 * @brief Graph vertices that can be stored as blocks
 */

#pragma once

#include <dag/block.hpp>
#include <string_view>
#include <vector>

namespace Dagstore {

/**
 * @brief A vertex of the Merkle DAG.
 *
 * The batch pipeline only needs the serialized bytes and the identifier;
 * how a node encodes its links is up to the implementation.
 */
class Node {
public:
    virtual ~Node() = default;

    virtual const std::vector<uint8_t>& raw_data() const = 0;
    virtual Cid cid() const = 0;

    virtual Block to_block() const {
        return Block(cid(), raw_data());
    }
};

/**
 * @brief Leaf node holding opaque bytes (a file chunk).
 */
class RawNode : public Node {
public:
    explicit RawNode(std::vector<uint8_t> data);
    explicit RawNode(std::string_view data);

    const std::vector<uint8_t>& raw_data() const override { return block_.data(); }
    Cid cid() const override { return block_.cid(); }
    Block to_block() const override { return block_; }

private:
    Block block_;
};

} // namespace Dagstore
