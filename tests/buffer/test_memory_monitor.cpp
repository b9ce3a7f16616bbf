#include <gtest/gtest.h>
#include "buffer/memory_monitor.h"
#include <vector>

TEST(MemoryMonitorTest, DefaultThreshold) {
    termdock::MemoryMonitor monitor;
    EXPECT_EQ(monitor.threshold(), 400ull * 1024 * 1024);
    EXPECT_FALSE(monitor.under_pressure());
}

TEST(MemoryMonitorTest, CallbackFiresOnEnteringPressure) {
    termdock::MemoryMonitor monitor(100);
    std::vector<termdock::MemoryPressure> events;
    monitor.set_pressure_callback([&events](const termdock::MemoryPressure& p) {
        events.push_back(p);
    });
    
    EXPECT_FALSE(monitor.observe(50, 1));
    EXPECT_TRUE(monitor.observe(150, 2));
    EXPECT_TRUE(monitor.observe(200, 3));
    
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].total_bytes, 150u);
    EXPECT_EQ(events[0].buffer_count, 2u);
    EXPECT_EQ(monitor.warning_count(), 1u);
    
    EXPECT_FALSE(monitor.observe(80, 3));
    EXPECT_FALSE(monitor.under_pressure());
    
    EXPECT_TRUE(monitor.observe(101, 3));
    EXPECT_EQ(events.size(), 2u);
    EXPECT_EQ(monitor.warning_count(), 2u);
}

TEST(MemoryMonitorTest, ThresholdIsExclusive) {
    termdock::MemoryMonitor monitor(100);
    EXPECT_FALSE(monitor.observe(100, 1));
    EXPECT_TRUE(monitor.observe(101, 1));
}
