#include <gtest/gtest.h>

#include "HealthCheckReporter.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

using namespace book_watch;
using namespace std::chrono_literals;

namespace {

class HealthCheckReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "book_watch_healthcheck_test";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    std::chrono::system_clock::time_point now_{std::chrono::seconds(1700000000)};
};

} // namespace

TEST_F(HealthCheckReporterTest, TouchesOnlyActiveFeeds) {
    LivenessRegistry registry([this]() { return now_; });
    registry.add("stale");
    now_ += 120s;
    registry.add("fresh");

    HealthCheckConfig config;
    config.threshold_s = 60;
    config.healthcheck_dir = dir_.string();
    config.healthcheck_prefix = "bw_";
    HealthCheckReporter reporter(registry, config);

    EXPECT_EQ(reporter.report_once(), 1u);
    EXPECT_TRUE(std::filesystem::exists(dir_ / "bw_fresh"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "bw_stale"));
    EXPECT_EQ(reporter.touch_path("fresh"), (dir_ / "bw_fresh").string());
}

TEST_F(HealthCheckReporterTest, NoDirectoryMeansNoFiles) {
    LivenessRegistry registry([this]() { return now_; });
    registry.add("feed");

    HealthCheckConfig config;
    HealthCheckReporter reporter(registry, config);
    EXPECT_EQ(reporter.report_once(), 1u);
    EXPECT_FALSE(std::filesystem::exists(dir_));
}

TEST_F(HealthCheckReporterTest, StartAndStopRunsAReport) {
    LivenessRegistry registry([this]() { return now_; });
    registry.add("feed");

    HealthCheckConfig config;
    config.report_interval_s = 1;
    config.healthcheck_dir = dir_.string();
    HealthCheckReporter reporter(registry, config);

    reporter.start();
    // The first report runs before the first wait
    for (int i = 0; i < 100 && !std::filesystem::exists(reporter.touch_path("feed")); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    reporter.stop();

    EXPECT_TRUE(std::filesystem::exists(reporter.touch_path("feed")));
}
