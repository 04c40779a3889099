/**
 * @file    BookSideCodec.cpp
 * @brief   Binary decoding of book-side slabs
 */

#include "BookSideLayout.hpp"
#include "BookWatchErrors.hpp"
#include "Endian.hpp"

#include <algorithm>

namespace book_watch {

    namespace {
        uint128_t read_u128(const uint8_t* data, size_t offset) {
            const uint64_t low = read_little_endian<uint64_t>(data, offset);
            const uint64_t high = read_little_endian<uint64_t>(data, offset + 8);
            return (static_cast<uint128_t>(high) << 64) | low;
        }
    }

    BookSideHeader decode_header(const uint8_t* data) {
        BookSideHeader header;

        header.meta_data.data_type = data[0];
        header.meta_data.version = data[1];
        header.meta_data.is_initialized = data[2] != 0;

        header.bump_index = read_little_endian<uint64_t>(data, BookLayout::kBumpIndexOffset);
        header.free_list_len = read_little_endian<uint64_t>(data, BookLayout::kFreeListLenOffset);
        header.free_list_head = read_little_endian<uint32_t>(data, BookLayout::kFreeListHeadOffset);
        header.root_node = read_little_endian<uint32_t>(data, BookLayout::kRootNodeOffset);
        header.leaf_count = read_little_endian<uint64_t>(data, BookLayout::kLeafCountOffset);

        return header;
    }

    Node decode_node(const uint8_t* data) {
        const auto tag = static_cast<NodeTag>(read_little_endian<uint32_t>(data, BookLayout::kNodeTagOffset));

        switch (tag) {
            case NodeTag::Inner: {
                InnerNode inner;
                inner.prefix_len = read_little_endian<uint32_t>(data, BookLayout::kInnerPrefixLenOffset);
                inner.key = read_u128(data, BookLayout::kInnerKeyOffset);
                inner.children[0] = read_little_endian<uint32_t>(data, BookLayout::kInnerChildrenOffset);
                inner.children[1] = read_little_endian<uint32_t>(data, BookLayout::kInnerChildrenOffset + 4);
                return inner;
            }
            case NodeTag::Leaf: {
                LeafNode leaf;
                leaf.owner_slot = data[BookLayout::kLeafOwnerSlotOffset];
                leaf.order_type = data[BookLayout::kLeafOrderTypeOffset];
                leaf.version = data[BookLayout::kLeafVersionOffset];
                leaf.time_in_force = data[BookLayout::kLeafTimeInForceOffset];
                leaf.key = read_u128(data, BookLayout::kLeafKeyOffset);
                std::copy_n(data + BookLayout::kLeafOwnerOffset, leaf.owner.bytes.size(), leaf.owner.bytes.begin());
                leaf.quantity = read_little_endian<uint64_t>(data, BookLayout::kLeafQuantityOffset);
                leaf.client_order_id = read_little_endian<uint64_t>(data, BookLayout::kLeafClientOrderIdOffset);
                leaf.best_initial = read_little_endian<int64_t>(data, BookLayout::kLeafBestInitialOffset);
                leaf.timestamp = read_little_endian<uint64_t>(data, BookLayout::kLeafTimestampOffset);
                return leaf;
            }
            case NodeTag::Free:
            case NodeTag::LastFree: {
                FreeNode free_node;
                free_node.next = read_little_endian<uint32_t>(data, BookLayout::kFreeNextOffset);
                free_node.last = tag == NodeTag::LastFree;
                return free_node;
            }
            case NodeTag::Uninitialized:
            default:
                return UninitializedNode{};
        }
    }

    void decode_slab(const std::vector<uint8_t>& data, const BookLayout& layout,
                     BookSideHeader& header, std::vector<Node>& nodes) {
        const size_t expected = layout.account_size();
        if (data.size() != expected) {
            throw DecodeSizeMismatch(data.size(), expected);
        }

        const uint8_t* raw = data.data();
        header = decode_header(raw);

        nodes.clear();
        nodes.reserve(layout.node_capacity);
        for (size_t i = 0; i < layout.node_capacity; ++i) {
            nodes.push_back(decode_node(raw + BookLayout::kHeaderSize + i * BookLayout::kNodeSize));
        }
    }

} // namespace book_watch
