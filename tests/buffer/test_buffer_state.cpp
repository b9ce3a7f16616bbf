#include <gtest/gtest.h>
#include "buffer/buffer_state.h"
#include <nlohmann/json.hpp>

TEST(BufferStateTest, JoinedSizeCountsSeparators) {
    EXPECT_EQ(termdock::joined_size({}), 0u);
    EXPECT_EQ(termdock::joined_size({"abc"}), 3u);
    EXPECT_EQ(termdock::joined_size({"abc", "de", ""}), 7u);
    EXPECT_EQ(termdock::join_lines({"abc", "de", ""}), "abc\nde\n");
}

TEST(BufferStateTest, MakeBufferStateDerivesContent) {
    auto state = termdock::make_buffer_state("s1", {"one", "two"}, {3, 1}, {100, 30});
    
    EXPECT_EQ(state.session_id, "s1");
    EXPECT_EQ(state.content, "one\ntwo");
    EXPECT_EQ(state.size_bytes, 7u);
    EXPECT_EQ(state.line_count(), 2u);
    EXPECT_EQ(state.cursor, (termdock::CursorPos{3, 1}));
    EXPECT_EQ(state.dimensions, (termdock::Dimensions{100, 30}));
    EXPECT_NE(state.timestamp, termdock::TimePoint{});
}

TEST(BufferStateTest, SameContentIgnoresTimestamp) {
    auto a = termdock::make_buffer_state("s1", {"x"});
    auto b = a;
    b.timestamp += std::chrono::seconds(5);
    EXPECT_TRUE(a.same_content(b));
    
    b.cursor.x = 4;
    EXPECT_FALSE(a.same_content(b));
}

TEST(BufferStateTest, JsonRecordUsesWireKeys) {
    auto state = termdock::make_buffer_state("s1", {"a", "bc"}, {2, 1}, {90, 20});
    nlohmann::json j = state;
    
    EXPECT_EQ(j["sessionId"], "s1");
    EXPECT_EQ(j["content"], "a\nbc");
    EXPECT_EQ(j["scrollback"].size(), 2u);
    EXPECT_EQ(j["cursorX"], 2);
    EXPECT_EQ(j["cursorY"], 1);
    EXPECT_EQ(j["cols"], 90);
    EXPECT_EQ(j["rows"], 20);
    EXPECT_EQ(j["sizeBytes"], 4);
    EXPECT_EQ(j["timestamp"].get<int64_t>(), termdock::to_epoch_ms(state.timestamp));
    
    auto parsed = j.get<termdock::BufferState>();
    EXPECT_TRUE(parsed.same_content(state));
}

TEST(BufferStateTest, JsonDefaultsForMissingFields) {
    auto j = nlohmann::json::parse(R"({"sessionId": "s2", "content": "hello"})");
    auto state = j.get<termdock::BufferState>();
    
    EXPECT_EQ(state.session_id, "s2");
    EXPECT_TRUE(state.scrollback.empty());
    EXPECT_EQ(state.size_bytes, 5u);
    EXPECT_EQ(state.dimensions, (termdock::Dimensions{80, 24}));
    EXPECT_EQ(state.cursor, (termdock::CursorPos{0, 0}));
}
