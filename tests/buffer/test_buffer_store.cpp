#include <gtest/gtest.h>
#include "buffer/buffer_store.h"
#include <chrono>
#include <thread>
#include <vector>

namespace {

std::vector<std::string> numbered_lines(size_t count) {
    std::vector<std::string> lines;
    lines.reserve(count);
    for (size_t i = 1; i <= count; ++i) {
        lines.push_back("Line " + std::to_string(i));
    }
    return lines;
}

}

TEST(BufferStoreTest, SaveAndGet) {
    termdock::BufferStore store;
    auto state = termdock::make_buffer_state("s1", {"hello", "world"}, {5, 1});
    
    store.save(state);
    
    EXPECT_TRUE(store.has("s1"));
    EXPECT_FALSE(store.has("s2"));
    auto stored = store.get("s1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->same_content(state));
    EXPECT_EQ(stored->timestamp, state.timestamp);
    EXPECT_FALSE(store.get("s2").has_value());
}

TEST(BufferStoreTest, LastWriteWins) {
    termdock::BufferStore store;
    store.save(termdock::make_buffer_state("s1", {"first"}));
    store.save(termdock::make_buffer_state("s1", {"second", "third"}));
    
    EXPECT_EQ(store.count(), 1u);
    auto stored = store.get("s1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->content, "second\nthird");
}

TEST(BufferStoreTest, TrimsOnSave) {
    termdock::BufferStore store;
    store.save(termdock::make_buffer_state("s1", numbered_lines(15000)));
    
    auto stored = store.get("s1");
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->scrollback.size(), 10000u);
    EXPECT_EQ(stored->scrollback.front(), "Line 5001");
    EXPECT_EQ(stored->scrollback.back(), "Line 15000");
    
    auto stats = store.memory_stats();
    EXPECT_EQ(stats.trim_operation_count, 1u);
    EXPECT_GT(stats.total_bytes_trimmed, 0u);
    
    store.reset_trim_stats();
    EXPECT_EQ(store.memory_stats().trim_operation_count, 0u);
    EXPECT_EQ(store.memory_stats().total_bytes_trimmed, 0u);
}

TEST(BufferStoreTest, CustomLimits) {
    termdock::BufferLimits limits;
    limits.max_lines = 3;
    termdock::BufferStore store(limits);
    
    store.save(termdock::make_buffer_state("s1", numbered_lines(10)));
    
    auto stored = store.get("s1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->scrollback, (std::vector<std::string>{"Line 8", "Line 9", "Line 10"}));
    EXPECT_EQ(store.limits().max_lines, 3u);
}

TEST(BufferStoreTest, TrimStatsDoesNotStore) {
    termdock::BufferStore store;
    auto state = termdock::make_buffer_state("s1", numbered_lines(12000));
    
    auto stats = store.trim_stats(state);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->lines_before, 12000u);
    EXPECT_EQ(stats->lines_after, 10000u);
    EXPECT_FALSE(store.has("s1"));
    
    EXPECT_FALSE(store.trim_stats(termdock::make_buffer_state("s2", {"short"})).has_value());
}

TEST(BufferStoreTest, RemoveAndClearAll) {
    termdock::BufferStore store;
    store.save(termdock::make_buffer_state("s1", {"a"}));
    store.save(termdock::make_buffer_state("s2", {"b"}));
    
    store.remove("s1");
    store.remove("missing");
    EXPECT_FALSE(store.has("s1"));
    EXPECT_TRUE(store.has("s2"));
    
    store.clear_all();
    EXPECT_EQ(store.count(), 0u);
    EXPECT_TRUE(store.all().empty());
}

TEST(BufferStoreTest, MemoryAccounting) {
    termdock::BufferStore store;
    store.save(termdock::make_buffer_state("s1", {"abcd", "ef"}));
    store.save(termdock::make_buffer_state("s2", {"0123456789"}));
    
    EXPECT_EQ(store.total_memory_usage(), 7u + 10u);
    
    auto info = store.buffer_memory_info("s1");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->size_bytes, 7u);
    EXPECT_EQ(info->line_count, 2u);
    EXPECT_DOUBLE_EQ(info->avg_line_size, 3.5);
    EXPECT_GT(info->percent_of_limit, 0.0);
    EXPECT_FALSE(store.buffer_memory_info("missing").has_value());
    
    auto stats = store.memory_stats();
    EXPECT_EQ(stats.buffer_count, 2u);
    EXPECT_EQ(stats.total_bytes, 17u);
    EXPECT_EQ(stats.max_buffer_size_bytes, 10u);
    EXPECT_EQ(stats.min_buffer_size_bytes, 7u);
    EXPECT_DOUBLE_EQ(stats.avg_buffer_size_bytes, 8.5);
    EXPECT_FALSE(stats.under_pressure);
    
    store.log_memory_report();
}

TEST(BufferStoreTest, PressureIsAdvisory) {
    termdock::BufferStore store(termdock::BufferLimits{}, 16);
    int warnings = 0;
    store.monitor().set_pressure_callback([&warnings](const termdock::MemoryPressure& p) {
        ++warnings;
        EXPECT_EQ(p.threshold_bytes, 16u);
    });
    
    store.save(termdock::make_buffer_state("s1", {"0123456789"}));
    EXPECT_FALSE(store.monitor().under_pressure());
    
    store.save(termdock::make_buffer_state("s2", {"0123456789"}));
    EXPECT_TRUE(store.monitor().under_pressure());
    EXPECT_TRUE(store.has("s2"));
    EXPECT_TRUE(store.memory_stats().under_pressure);
    EXPECT_EQ(warnings, 1);
}

TEST(BufferStoreTest, ConcurrentSaves) {
    termdock::BufferStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < 50; ++i) {
                std::string id = "s" + std::to_string(t);
                store.save(termdock::make_buffer_state(id, {"round " + std::to_string(i)}));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    
    EXPECT_EQ(store.count(), 4u);
    for (int t = 0; t < 4; ++t) {
        auto stored = store.get("s" + std::to_string(t));
        ASSERT_TRUE(stored.has_value());
        EXPECT_EQ(stored->content, "round 49");
    }
}

TEST(BufferStoreTest, SaveOfFullBufferIsFast) {
    termdock::BufferStore store;
    auto state = termdock::make_buffer_state("s1", numbered_lines(10000));
    
    auto start = std::chrono::steady_clock::now();
    store.save(std::move(state));
    auto elapsed = std::chrono::steady_clock::now() - start;
    
    // Target is 100 ms; the margin absorbs debug builds and loaded machines.
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));
    EXPECT_EQ(store.get("s1")->scrollback.size(), 10000u);
    EXPECT_EQ(store.memory_stats().trim_operation_count, 0u);
}

TEST(BufferStoreTest, TrimOfSixtyThousandLinesIsFastAndKeepsNewest) {
    termdock::BufferStore store;
    auto state = termdock::make_buffer_state("s1", numbered_lines(60000));
    
    auto start = std::chrono::steady_clock::now();
    store.save(std::move(state));
    auto elapsed = std::chrono::steady_clock::now() - start;
    
    // Target is 200 ms.
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    
    auto stored = store.get("s1");
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->scrollback.size(), 10000u);
    for (size_t i = 0; i < stored->scrollback.size(); ++i) {
        ASSERT_EQ(stored->scrollback[i], "Line " + std::to_string(50001 + i));
    }
    EXPECT_EQ(store.memory_stats().trim_operation_count, 1u);
}
