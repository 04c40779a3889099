/**
 * @file    BookSideLayout.hpp
 * @brief   Wire layout of a book-side account and its decoded node types
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   A book side is a fixed-size slab: a 40-byte header followed by a
 *   fixed-capacity array of 88-byte nodes. Each node starts with a 32-bit
 *   tag selecting inner, leaf or free payloads. All integers are
 *   little-endian.
 */

#pragma once

#ifndef BOOK_SIDE_LAYOUT_HPP_
#define BOOK_SIDE_LAYOUT_HPP_

#include "BookWatchTypes.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace book_watch {

/**
 * @brief Node tags as written on the wire
 */
enum class NodeTag : uint32_t {
    Uninitialized = 0,
    Inner = 1,
    Leaf = 2,
    Free = 3,
    LastFree = 4
};

/**
 * @brief Sentinel root index of an empty tree
 */
constexpr uint32_t kEmptyRoot = 0xFFFFFFFFu;

/**
 * @brief Byte offsets and sizes of the slab
 */
struct BookLayout {
    static constexpr size_t kMetadataSize = 8;
    static constexpr size_t kBumpIndexOffset = 8;
    static constexpr size_t kFreeListLenOffset = 16;
    static constexpr size_t kFreeListHeadOffset = 24;
    static constexpr size_t kRootNodeOffset = 28;
    static constexpr size_t kLeafCountOffset = 32;
    static constexpr size_t kHeaderSize = 40;

    static constexpr size_t kNodeSize = 88;
    static constexpr size_t kDefaultNodeCapacity = 1024;

    // Offsets inside one node
    static constexpr size_t kNodeTagOffset = 0;
    static constexpr size_t kInnerPrefixLenOffset = 4;
    static constexpr size_t kInnerKeyOffset = 8;
    static constexpr size_t kInnerChildrenOffset = 24;
    static constexpr size_t kLeafOwnerSlotOffset = 4;
    static constexpr size_t kLeafOrderTypeOffset = 5;
    static constexpr size_t kLeafVersionOffset = 6;
    static constexpr size_t kLeafTimeInForceOffset = 7;
    static constexpr size_t kLeafKeyOffset = 8;
    static constexpr size_t kLeafOwnerOffset = 24;
    static constexpr size_t kLeafQuantityOffset = 56;
    static constexpr size_t kLeafClientOrderIdOffset = 64;
    static constexpr size_t kLeafBestInitialOffset = 72;
    static constexpr size_t kLeafTimestampOffset = 80;
    static constexpr size_t kFreeNextOffset = 4;

    size_t node_capacity = kDefaultNodeCapacity;

    size_t account_size() const { return kHeaderSize + node_capacity * kNodeSize; }
};

/**
 * @brief Metadata header common to venue accounts
 */
struct Metadata {
    uint8_t data_type = 0;
    uint8_t version = 0;
    bool is_initialized = false;

    bool is_bids() const { return data_type == static_cast<uint8_t>(DataType::Bids); }
    bool is_asks() const { return data_type == static_cast<uint8_t>(DataType::Asks); }
};

struct UninitializedNode {};

struct InnerNode {
    uint32_t prefix_len = 0;
    uint128_t key = 0;
    std::array<uint32_t, 2> children{};
};

/**
 * @brief Resting order stored in the slab
 *
 * The key's high 64 bits are the native price, the low 64 bits the
 * sequence number. The whole key is the order id.
 */
struct LeafNode {
    uint8_t owner_slot = 0;
    uint8_t order_type = 0;
    uint8_t version = 0;
    uint8_t time_in_force = 0;
    uint128_t key = 0;
    PublicKey owner;
    uint64_t quantity = 0;
    uint64_t client_order_id = 0;
    int64_t best_initial = 0;
    uint64_t timestamp = 0;

    uint64_t price() const { return static_cast<uint64_t>(key >> 64); }
    uint64_t sequence() const { return static_cast<uint64_t>(key); }
};

struct FreeNode {
    uint32_t next = 0;
    bool last = false;
};

using Node = std::variant<UninitializedNode, InnerNode, LeafNode, FreeNode>;

/**
 * @brief Fixed header fields of the slab
 */
struct BookSideHeader {
    Metadata meta_data;
    uint64_t bump_index = 0;
    uint64_t free_list_len = 0;
    uint32_t free_list_head = 0;
    uint32_t root_node = kEmptyRoot;
    uint64_t leaf_count = 0;
};

/**
 * @brief Decode the fixed header; `data` must hold at least kHeaderSize bytes
 */
BookSideHeader decode_header(const uint8_t* data);

/**
 * @brief Decode one node; `data` must hold at least kNodeSize bytes
 *
 * Unrecognised tags decode as UninitializedNode.
 */
Node decode_node(const uint8_t* data);

/**
 * @brief Decode header and node array after checking the exact size
 * @throws DecodeSizeMismatch when size differs from layout.account_size()
 */
void decode_slab(const std::vector<uint8_t>& data, const BookLayout& layout,
                 BookSideHeader& header, std::vector<Node>& nodes);

} // namespace book_watch

#endif /* BOOK_SIDE_LAYOUT_HPP_ */
