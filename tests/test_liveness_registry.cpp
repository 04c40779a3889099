#include <gtest/gtest.h>

#include "LivenessRegistry.hpp"

#include <chrono>

using namespace book_watch;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
    std::chrono::system_clock::time_point now{std::chrono::seconds(1700000000)};

    LivenessRegistry::Clock fn() {
        return [this]() { return now; };
    }
};

} // namespace

TEST(LivenessRegistry, RegistrationCountsAsActivity) {
    FakeClock clock;
    LivenessRegistry registry(clock.fn());

    const FeedId id = registry.add("BTC-PERP_bids");
    const auto report = registry.report(1000ms);

    ASSERT_EQ(report.size(), 1u);
    EXPECT_EQ(report[0].id, id);
    EXPECT_EQ(report[0].name, "BTC-PERP_bids");
    EXPECT_EQ(report[0].message_count, 0u);
    EXPECT_TRUE(report[0].active);
    EXPECT_EQ(report[0].last_active, clock.now);
}

TEST(LivenessRegistry, SilenceBeyondThresholdIsInactive) {
    FakeClock clock;
    LivenessRegistry registry(clock.fn());
    const FeedId id = registry.add("feed");

    clock.now += 2s;
    EXPECT_FALSE(registry.report(1000ms)[0].active);
    EXPECT_TRUE(registry.all_silent(1000ms));

    registry.record_activity(id);
    const auto report = registry.report(1000ms);
    EXPECT_TRUE(report[0].active);
    EXPECT_EQ(report[0].message_count, 1u);
    EXPECT_TRUE(registry.all_active(1000ms));
}

TEST(LivenessRegistry, ThresholdBoundaryIsInclusive) {
    FakeClock clock;
    LivenessRegistry registry(clock.fn());
    registry.add("feed");

    clock.now += 1000ms;
    EXPECT_TRUE(registry.report(1000ms)[0].active);
    clock.now += 1ms;
    EXPECT_FALSE(registry.report(1000ms)[0].active);
}

TEST(LivenessRegistry, ReportIsOrderedByRegistration) {
    FakeClock clock;
    LivenessRegistry registry(clock.fn());
    const FeedId a = registry.add("a");
    const FeedId b = registry.add("b");
    const FeedId c = registry.add("c");

    clock.now += 10s;
    registry.record_activity(b);

    const auto report = registry.report(5s);
    ASSERT_EQ(report.size(), 3u);
    EXPECT_EQ(report[0].id, a);
    EXPECT_EQ(report[1].id, b);
    EXPECT_EQ(report[2].id, c);
    EXPECT_FALSE(report[0].active);
    EXPECT_TRUE(report[1].active);
    EXPECT_FALSE(report[2].active);
    EXPECT_FALSE(registry.all_active(5s));
    EXPECT_FALSE(registry.all_silent(5s));
}

TEST(LivenessRegistry, RemovedFeedDisappears) {
    FakeClock clock;
    LivenessRegistry registry(clock.fn());
    const FeedId a = registry.add("a");
    registry.add("b");

    registry.remove(a);
    EXPECT_EQ(registry.feed_count(), 1u);
    EXPECT_EQ(registry.report(1s)[0].name, "b");

    // Unknown ids are ignored
    registry.record_activity(a);
    registry.remove(a);
    EXPECT_EQ(registry.feed_count(), 1u);
}

TEST(LivenessRegistry, EmptyRegistryIsBothAllActiveAndAllSilent) {
    LivenessRegistry registry;
    EXPECT_TRUE(registry.report(1s).empty());
    EXPECT_TRUE(registry.all_active(1s));
    EXPECT_TRUE(registry.all_silent(1s));
}
