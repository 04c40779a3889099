#include <gtest/gtest.h>

#include "BookSideBuilder.hpp"
#include "BookSideLayout.hpp"
#include "BookWatchErrors.hpp"
#include "Endian.hpp"

#include <stdexcept>
#include <variant>

using namespace book_watch;
using book_watch::test_support::BookSideBuilder;
using book_watch::test_support::LeafFields;

TEST(BookSideCodec, DefaultAccountSize) {
    BookLayout layout;
    EXPECT_EQ(layout.node_capacity, 1024u);
    EXPECT_EQ(layout.account_size(), 90152u);
}

TEST(BookSideCodec, SizeMismatchReportsBothLengths) {
    BookLayout layout;
    std::vector<uint8_t> data(layout.account_size() - 1, 0);
    BookSideHeader header;
    std::vector<Node> nodes;

    try {
        decode_slab(data, layout, header, nodes);
        FAIL() << "expected DecodeSizeMismatch";
    } catch (const DecodeSizeMismatch& e) {
        EXPECT_EQ(e.actual(), 90151u);
        EXPECT_EQ(e.expected(), 90152u);
    }

    data.resize(layout.account_size() + 88, 0);
    EXPECT_THROW(decode_slab(data, layout, header, nodes), DecodeSizeMismatch);
}

TEST(BookSideCodec, HeaderFields) {
    BookSideBuilder builder(DataType::Asks, 8);
    builder.add_leaf(LeafFields{10, 1, 5, 0, 0, 0});
    builder.set_root(0).set_bump_index(3);

    BookSideHeader header;
    std::vector<Node> nodes;
    decode_slab(builder.build(), builder.layout(), header, nodes);

    EXPECT_EQ(header.meta_data.data_type, static_cast<uint8_t>(DataType::Asks));
    EXPECT_TRUE(header.meta_data.is_asks());
    EXPECT_FALSE(header.meta_data.is_bids());
    EXPECT_TRUE(header.meta_data.is_initialized);
    EXPECT_EQ(header.bump_index, 3u);
    EXPECT_EQ(header.root_node, 0u);
    EXPECT_EQ(header.leaf_count, 1u);
    EXPECT_EQ(nodes.size(), 8u);
}

TEST(BookSideCodec, LeafFieldsAtTheirOffsets) {
    BookSideBuilder builder(DataType::Bids, 4);
    builder.add_leaf(LeafFields{0x1234, 0xABCDEF, 0x8000000000000005, 99, 2, 0x11});

    BookSideHeader header;
    std::vector<Node> nodes;
    decode_slab(builder.build(), builder.layout(), header, nodes);

    ASSERT_TRUE(std::holds_alternative<LeafNode>(nodes[0]));
    const auto& leaf = std::get<LeafNode>(nodes[0]);
    EXPECT_EQ(leaf.price(), 0x1234u);
    EXPECT_EQ(leaf.sequence(), 0xABCDEFu);
    EXPECT_EQ(leaf.quantity, 0x8000000000000005u);
    EXPECT_EQ(leaf.client_order_id, 99u);
    EXPECT_EQ(leaf.order_type, 2);
    EXPECT_EQ(leaf.owner.bytes[0], 0x11);
    EXPECT_EQ(leaf.owner.bytes[31], 0x11);
}

TEST(BookSideCodec, InnerAndFreeNodes) {
    BookSideBuilder builder(DataType::Bids, 4);
    builder.add_inner(2, 3, 77);
    builder.add_free(3);
    builder.add_free(0, true);

    BookSideHeader header;
    std::vector<Node> nodes;
    decode_slab(builder.build(), builder.layout(), header, nodes);

    ASSERT_TRUE(std::holds_alternative<InnerNode>(nodes[0]));
    EXPECT_EQ(std::get<InnerNode>(nodes[0]).children[0], 2u);
    EXPECT_EQ(std::get<InnerNode>(nodes[0]).children[1], 3u);
    EXPECT_TRUE(std::get<InnerNode>(nodes[0]).key == 77);

    ASSERT_TRUE(std::holds_alternative<FreeNode>(nodes[1]));
    EXPECT_EQ(std::get<FreeNode>(nodes[1]).next, 3u);
    EXPECT_FALSE(std::get<FreeNode>(nodes[1]).last);
    ASSERT_TRUE(std::holds_alternative<FreeNode>(nodes[2]));
    EXPECT_TRUE(std::get<FreeNode>(nodes[2]).last);

    // Never written
    EXPECT_TRUE(std::holds_alternative<UninitializedNode>(nodes[3]));
}

TEST(BookSideCodec, UnknownTagDecodesAsUninitialized) {
    std::vector<uint8_t> raw(BookLayout::kNodeSize, 0);
    write_little_endian<uint32_t>(raw.data(), BookLayout::kNodeTagOffset, 42);
    EXPECT_TRUE(std::holds_alternative<UninitializedNode>(decode_node(raw.data())));
}

TEST(Endian, SignedValuesSurviveLittleEndianEncoding) {
    uint8_t buf[8] = {};
    write_little_endian<int64_t>(buf, 0, -2);
    EXPECT_EQ(buf[0], 0xFE);
    EXPECT_EQ(buf[7], 0xFF);
    EXPECT_EQ(read_little_endian<int64_t>(buf, 0), -2);
}

TEST(BookSideBuilder, RejectsEmptyTreeAndOverflow) {
    BookSideBuilder builder(DataType::Bids, 2);
    EXPECT_THROW(builder.add_tree({}), std::invalid_argument);

    builder.add_leaf(LeafFields{1, 1, 1, 0, 0, 0});
    builder.add_leaf(LeafFields{2, 2, 1, 0, 0, 0});
    EXPECT_THROW(builder.add_leaf(LeafFields{3, 3, 1, 0, 0, 0}), std::out_of_range);
}
