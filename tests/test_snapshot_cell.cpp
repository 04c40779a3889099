#include <gtest/gtest.h>

#include "SnapshotCell.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace book_watch;

TEST(SnapshotCell, ReadReturnsInitialValue) {
    SnapshotCell<int> cell(41);
    EXPECT_EQ(*cell.read(), 41);
    EXPECT_EQ(cell.version(), 0u);
}

TEST(SnapshotCell, WriteReplacesAndOldSnapshotStaysValid) {
    SnapshotCell<std::vector<int>> cell(std::vector<int>{1, 2, 3});
    auto before = cell.read();

    cell.write(std::vector<int>{4});
    auto after = cell.read();

    EXPECT_EQ(*before, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(*after, (std::vector<int>{4}));
    EXPECT_EQ(cell.version(), 1u);
}

TEST(SnapshotCell, ReadersNeverSeeTornValues) {
    constexpr int kWrites = 2000;
    SnapshotCell<std::vector<int>> cell(std::vector<int>(64, 0));
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            int last_seen = 0;
            while (!done) {
                auto snapshot = cell.read();
                const int first = snapshot->front();
                if (!std::all_of(snapshot->begin(), snapshot->end(), [first](int v) { return v == first; })) {
                    torn++;
                }
                // Values only move forward for a single writer
                if (first < last_seen) torn++;
                last_seen = first;
            }
        });
    }

    for (int i = 1; i <= kWrites; ++i) {
        cell.write(std::vector<int>(64, i));
    }
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(cell.read()->front(), kWrites);
    EXPECT_EQ(cell.version(), static_cast<uint64_t>(kWrites));
}
