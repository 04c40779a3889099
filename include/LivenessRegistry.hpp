/**
 * @file    LivenessRegistry.hpp
 * @brief   Aggregated "last active" tracking across all live feeds
 *
 * Developer: Equix Technologies
 * Copyright: Equix Technologies Pty Ltd
 * Created: October 2026
 *
 * Description:
 *   Each watcher registers its feed here and records an activity event per
 *   delivered notification. The registry never touches the feeds; it only
 *   answers liveness queries for health reporting. It is an ordinary object
 *   owned by whoever wires the watchers together.
 */

#pragma once

#ifndef LIVENESS_REGISTRY_HPP_
#define LIVENESS_REGISTRY_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace book_watch {

using FeedId = uint64_t;

/**
 * @brief Point-in-time status of one feed
 */
struct FeedStatus {
    FeedId id = 0;
    std::string name;
    uint64_t message_count = 0;
    std::chrono::system_clock::time_point last_active;
    bool active = false;
};

class LivenessRegistry {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    LivenessRegistry();
    explicit LivenessRegistry(Clock clock);

    LivenessRegistry(const LivenessRegistry&) = delete;
    LivenessRegistry& operator=(const LivenessRegistry&) = delete;

    /**
     * @brief Register a feed; registration itself counts as activity
     */
    FeedId add(const std::string& name);

    void remove(FeedId id);

    /**
     * @brief Record that a notification arrived; unknown ids are ignored
     */
    void record_activity(FeedId id);

    /**
     * @brief Status of every feed, ordered by registration
     * @param threshold Feeds silent for longer than this are inactive
     */
    std::vector<FeedStatus> report(std::chrono::milliseconds threshold) const;

    bool all_active(std::chrono::milliseconds threshold) const;
    bool all_silent(std::chrono::milliseconds threshold) const;

    size_t feed_count() const;

private:
    struct FeedState {
        std::string name;
        std::atomic<uint64_t> message_count{0};
        std::atomic<int64_t> last_active_us{0};
    };

    int64_t now_us() const;

    Clock clock_;
    std::unordered_map<FeedId, std::unique_ptr<FeedState>> feeds_;
    mutable std::shared_mutex feeds_mutex_;
    std::atomic<FeedId> next_id_{1};
};

} // namespace book_watch

#endif /* LIVENESS_REGISTRY_HPP_ */
