/**
 * @file    LivenessRegistry.cpp
 * @brief   Feed liveness tracking implementation
 */

#include "LivenessRegistry.hpp"
#include "spdlog/spdlog.h"

#include <algorithm>

namespace book_watch {

    LivenessRegistry::LivenessRegistry()
        : LivenessRegistry([]() { return std::chrono::system_clock::now(); }) {
    }

    LivenessRegistry::LivenessRegistry(Clock clock)
        : clock_(std::move(clock)) {
    }

    FeedId LivenessRegistry::add(const std::string& name) {
        auto state = std::make_unique<FeedState>();
        state->name = name;
        state->last_active_us = now_us();

        const FeedId id = next_id_++;
        {
            std::unique_lock lock(feeds_mutex_);
            feeds_[id] = std::move(state);
        }

        SPDLOG_INFO("Liveness registry: added feed '{}' (id={})", name, id);
        return id;
    }

    void LivenessRegistry::remove(FeedId id) {
        std::unique_lock lock(feeds_mutex_);
        auto it = feeds_.find(id);
        if (it == feeds_.end()) {
            return;
        }
        SPDLOG_INFO("Liveness registry: removed feed '{}' (id={})", it->second->name, id);
        feeds_.erase(it);
    }

    void LivenessRegistry::record_activity(FeedId id) {
        std::shared_lock lock(feeds_mutex_);
        auto it = feeds_.find(id);
        if (it == feeds_.end()) {
            return;
        }
        it->second->message_count.fetch_add(1, std::memory_order_relaxed);
        it->second->last_active_us.store(now_us(), std::memory_order_relaxed);
    }

    std::vector<FeedStatus> LivenessRegistry::report(std::chrono::milliseconds threshold) const {
        const int64_t now = now_us();
        const int64_t threshold_us = std::chrono::duration_cast<std::chrono::microseconds>(threshold).count();

        std::vector<FeedStatus> result;
        {
            std::shared_lock lock(feeds_mutex_);
            result.reserve(feeds_.size());
            for (const auto& [id, state] : feeds_) {
                FeedStatus status;
                status.id = id;
                status.name = state->name;
                status.message_count = state->message_count.load(std::memory_order_relaxed);

                const int64_t last = state->last_active_us.load(std::memory_order_relaxed);
                status.last_active = std::chrono::system_clock::time_point(
                    std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(last)));
                status.active = now - last <= threshold_us;
                result.push_back(std::move(status));
            }
        }

        std::sort(result.begin(), result.end(),
                  [](const FeedStatus& a, const FeedStatus& b) { return a.id < b.id; });
        return result;
    }

    bool LivenessRegistry::all_active(std::chrono::milliseconds threshold) const {
        const auto statuses = report(threshold);
        return std::all_of(statuses.begin(), statuses.end(),
                           [](const FeedStatus& status) { return status.active; });
    }

    bool LivenessRegistry::all_silent(std::chrono::milliseconds threshold) const {
        const auto statuses = report(threshold);
        return std::none_of(statuses.begin(), statuses.end(),
                            [](const FeedStatus& status) { return status.active; });
    }

    size_t LivenessRegistry::feed_count() const {
        std::shared_lock lock(feeds_mutex_);
        return feeds_.size();
    }

    int64_t LivenessRegistry::now_us() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(clock_().time_since_epoch()).count();
    }

} // namespace book_watch
