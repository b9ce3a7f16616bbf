#pragma once

#include "core/types.h"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace termdock {

struct BufferLimits {
    static constexpr size_t kDefaultMaxLines = 10000;
    static constexpr uint64_t kDefaultMaxBytes = 50ull * 1024 * 1024;

    size_t max_lines = kDefaultMaxLines;
    uint64_t max_bytes = kDefaultMaxBytes;
};

struct BufferState {
    SessionId session_id;
    std::string content;
    std::vector<std::string> scrollback;
    CursorPos cursor;
    Dimensions dimensions;
    uint64_t size_bytes = 0;
    TimePoint timestamp{};

    size_t line_count() const { return scrollback.size(); }

    // Compares everything except the timestamp.
    bool same_content(const BufferState& other) const;
};

// Size of the lines joined with '\n', without materializing the join.
uint64_t joined_size(const std::vector<std::string>& lines);
std::string join_lines(const std::vector<std::string>& lines);

// Builds a consistent state: content and size_bytes derived from lines.
BufferState make_buffer_state(const SessionId& session_id,
                              std::vector<std::string> lines,
                              CursorPos cursor = {},
                              Dimensions dimensions = {});

void to_json(nlohmann::json& j, const BufferState& state);
void from_json(const nlohmann::json& j, BufferState& state);

}
