/**
 * @file test_reachability_monitor.cpp
 * @brief Unit tests for reachability monitors
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/reachability/reachability_monitor.h>

#include <vector>

namespace kcenon::blob_transfer::test {

// =============================================================================
// manual_reachability_monitor Tests
// =============================================================================

class ManualReachabilityMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        monitor_.on_status_changed(
            [this](reachability_status status) { seen_.push_back(status); });
    }

    manual_reachability_monitor monitor_;
    std::vector<reachability_status> seen_;
};

TEST_F(ManualReachabilityMonitorTest, DefaultsToLan) {
    EXPECT_EQ(monitor_.status(), reachability_status::reachable_lan);
    EXPECT_FALSE(monitor_.is_listening());
}

TEST_F(ManualReachabilityMonitorTest, NotifiesWhileListening) {
    ASSERT_TRUE(monitor_.start_listening().has_value());
    EXPECT_TRUE(monitor_.is_listening());

    monitor_.set_status(reachability_status::unreachable);
    monitor_.set_status(reachability_status::reachable_wan);

    ASSERT_EQ(seen_.size(), 2u);
    EXPECT_EQ(seen_[0], reachability_status::unreachable);
    EXPECT_EQ(seen_[1], reachability_status::reachable_wan);
}

TEST_F(ManualReachabilityMonitorTest, SameStatusIsNotAChange) {
    ASSERT_TRUE(monitor_.start_listening().has_value());
    monitor_.set_status(reachability_status::reachable_lan);
    EXPECT_TRUE(seen_.empty());
}

TEST_F(ManualReachabilityMonitorTest, SilentWhenNotListening) {
    monitor_.set_status(reachability_status::unreachable);
    EXPECT_TRUE(seen_.empty());
    EXPECT_EQ(monitor_.status(), reachability_status::unreachable);

    ASSERT_TRUE(monitor_.start_listening().has_value());
    monitor_.stop_listening();
    monitor_.set_status(reachability_status::reachable_lan);
    EXPECT_TRUE(seen_.empty());
}

TEST_F(ManualReachabilityMonitorTest, StatusHelpers) {
    EXPECT_TRUE(is_reachable(reachability_status::reachable_lan));
    EXPECT_TRUE(is_reachable(reachability_status::reachable_wan));
    EXPECT_FALSE(is_reachable(reachability_status::unreachable));
    EXPECT_FALSE(is_reachable(reachability_status::unknown));
    EXPECT_EQ(to_string(reachability_status::reachable_wan), "reachable_wan");
}

// =============================================================================
// interface_reachability_monitor Tests
// =============================================================================

class InterfaceReachabilityMonitorTest : public ::testing::Test {};

TEST_F(InterfaceReachabilityMonitorTest, ClassifyNoInterfaces) {
    EXPECT_EQ(interface_reachability_monitor::classify({}),
              reachability_status::unreachable);
}

TEST_F(InterfaceReachabilityMonitorTest, ClassifyIgnoresDownInterfaces) {
    std::vector<network_interface> interfaces{{"eth0", "10.0.0.2", false, false, false}};
    EXPECT_EQ(interface_reachability_monitor::classify(interfaces),
              reachability_status::unreachable);
}

TEST_F(InterfaceReachabilityMonitorTest, ClassifyLanBeatsCellular) {
    std::vector<network_interface> interfaces{
        {"rmnet0", "100.64.0.1", true, false, true},
        {"wlan0", "192.168.1.5", true, true, false}};
    EXPECT_EQ(interface_reachability_monitor::classify(interfaces),
              reachability_status::reachable_lan);
}

TEST_F(InterfaceReachabilityMonitorTest, ClassifyCellularOnly) {
    std::vector<network_interface> interfaces{
        {"rmnet0", "100.64.0.1", true, false, true},
        {"eth0", "", false, false, false}};
    EXPECT_EQ(interface_reachability_monitor::classify(interfaces),
              reachability_status::reachable_wan);
}

TEST_F(InterfaceReachabilityMonitorTest, StartStop) {
    interface_monitor_config config;
    config.poll_interval = std::chrono::milliseconds(20);
    interface_reachability_monitor monitor(config);

    auto started = monitor.start_listening();
    if (!started) {
        EXPECT_EQ(started.error().code, error_code::not_initialized);
        GTEST_SKIP() << "interface enumeration unavailable";
    }
    EXPECT_TRUE(monitor.is_listening());
    EXPECT_NE(monitor.status(), reachability_status::unknown);

    monitor.stop_listening();
    EXPECT_FALSE(monitor.is_listening());
}

}  // namespace kcenon::blob_transfer::test
