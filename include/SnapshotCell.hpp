/**
 * @file    SnapshotCell.hpp
 * @brief   Single-slot holder of the latest decoded value
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   One writer replaces the held value wholesale; any number of readers
 *   load the current immutable snapshot without taking a lock the writer
 *   waits on. Values are never mutated in place.
 */

#pragma once

#ifndef SNAPSHOT_CELL_HPP_
#define SNAPSHOT_CELL_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <utility>

namespace book_watch {

template <typename T>
class SnapshotCell {
public:
    using Snapshot = std::shared_ptr<const T>;

    explicit SnapshotCell(T initial)
        : value_(std::make_shared<const T>(std::move(initial))) {}

    SnapshotCell(const SnapshotCell&) = delete;
    SnapshotCell& operator=(const SnapshotCell&) = delete;

    /**
     * @brief Most recently written value; never empty
     */
    Snapshot read() const {
        return std::atomic_load_explicit(&value_, std::memory_order_acquire);
    }

    void write(T value) {
        auto next = std::make_shared<const T>(std::move(value));
        std::atomic_store_explicit(&value_, std::move(next), std::memory_order_release);
        version_.fetch_add(1, std::memory_order_relaxed);
    }

    /**
     * @brief Number of writes since construction
     */
    uint64_t version() const { return version_.load(std::memory_order_relaxed); }

private:
    Snapshot value_;
    std::atomic<uint64_t> version_{0};
};

} // namespace book_watch

#endif /* SNAPSHOT_CELL_HPP_ */
