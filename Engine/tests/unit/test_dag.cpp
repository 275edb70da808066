/**
 * @file test_dag.cpp
 * @brief Unit tests for blocks and nodes
 */

#include <gtest/gtest.h>
#include <dag/node.hpp>
#include <unordered_set>

using namespace Dagstore;

TEST(BlockTest, CidIsDigestOfData) {
    std::vector<uint8_t> data = {'h', 'e', 'l', 'l', 'o'};
    auto block = Block::from_data(data);

    EXPECT_EQ(block.cid(), BLAKE3Pipeline::hash(data));
    EXPECT_EQ(block.size(), 5u);
    EXPECT_EQ(block.data(), data);
    EXPECT_TRUE(block.verify());
}

TEST(BlockTest, VerifyDetectsWrongCid) {
    Block block(BLAKE3Pipeline::hash("other"), {'x'});
    EXPECT_FALSE(block.verify());
}

TEST(BlockTest, CopiesSharePayload) {
    auto block = Block::from_data(std::vector<uint8_t>(1024, 7));
    Block copy = block;
    EXPECT_EQ(&copy.data(), &block.data());
    EXPECT_EQ(copy.cid(), block.cid());
}

TEST(BlockTest, CidHashUsableInSets) {
    std::unordered_set<Cid, CidHash> cids;
    cids.insert(Block::from_data({'a'}).cid());
    cids.insert(Block::from_data({'a'}).cid());
    cids.insert(Block::from_data({'b'}).cid());
    EXPECT_EQ(cids.size(), 2u);
}

TEST(RawNodeTest, SameContentSameCid) {
    RawNode a(std::string_view("chunk"));
    RawNode b(std::vector<uint8_t>{'c', 'h', 'u', 'n', 'k'});
    EXPECT_EQ(a.cid(), b.cid());
    EXPECT_EQ(a.raw_data(), b.raw_data());
}

TEST(RawNodeTest, ToBlockCarriesCidAndBytes) {
    RawNode node(std::string_view("payload"));
    Block block = node.to_block();
    EXPECT_EQ(block.cid(), node.cid());
    EXPECT_EQ(block.data(), node.raw_data());
    EXPECT_TRUE(block.verify());
}

namespace {

// Node with a cid supplied from outside, exercising the default to_block()
class PresetNode : public Node {
public:
    PresetNode(Cid cid, std::vector<uint8_t> data) : cid_(cid), data_(std::move(data)) {}
    const std::vector<uint8_t>& raw_data() const override { return data_; }
    Cid cid() const override { return cid_; }

private:
    Cid cid_;
    std::vector<uint8_t> data_;
};

} // namespace

TEST(NodeTest, DefaultToBlockUsesNodeCid) {
    Cid cid = BLAKE3Pipeline::hash("encoded elsewhere");
    PresetNode node(cid, {1, 2, 3});
    Block block = node.to_block();
    EXPECT_EQ(block.cid(), cid);
    EXPECT_EQ(block.size(), 3u);
}
