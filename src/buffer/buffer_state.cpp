#include "buffer/buffer_state.h"
#include <nlohmann/json.hpp>

namespace termdock {

bool BufferState::same_content(const BufferState& other) const {
    return session_id == other.session_id
        && content == other.content
        && scrollback == other.scrollback
        && cursor == other.cursor
        && dimensions == other.dimensions
        && size_bytes == other.size_bytes;
}

uint64_t joined_size(const std::vector<std::string>& lines) {
    if (lines.empty()) return 0;
    uint64_t total = lines.size() - 1;
    for (const auto& line : lines) {
        total += line.size();
    }
    return total;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string result;
    result.reserve(static_cast<size_t>(joined_size(lines)));
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) result += '\n';
        result += lines[i];
    }
    return result;
}

BufferState make_buffer_state(const SessionId& session_id,
                              std::vector<std::string> lines,
                              CursorPos cursor,
                              Dimensions dimensions) {
    BufferState state;
    state.session_id = session_id;
    state.content = join_lines(lines);
    state.size_bytes = state.content.size();
    state.scrollback = std::move(lines);
    state.cursor = cursor;
    state.dimensions = dimensions;
    state.timestamp = Clock::now();
    return state;
}

void to_json(nlohmann::json& j, const BufferState& state) {
    j = nlohmann::json{
        {"sessionId", state.session_id},
        {"content", state.content},
        {"scrollback", state.scrollback},
        {"cursorX", state.cursor.x},
        {"cursorY", state.cursor.y},
        {"cols", state.dimensions.cols},
        {"rows", state.dimensions.rows},
        {"timestamp", to_epoch_ms(state.timestamp)},
        {"sizeBytes", state.size_bytes},
    };
}

void from_json(const nlohmann::json& j, BufferState& state) {
    state.session_id = j.value("sessionId", std::string{});
    state.content = j.value("content", std::string{});
    if (j.contains("scrollback") && j["scrollback"].is_array()) {
        state.scrollback = j["scrollback"].get<std::vector<std::string>>();
    } else {
        state.scrollback.clear();
    }
    state.cursor.x = j.value("cursorX", 0);
    state.cursor.y = j.value("cursorY", 0);
    state.dimensions.cols = j.value("cols", 80);
    state.dimensions.rows = j.value("rows", 24);
    state.timestamp = from_epoch_ms(j.value("timestamp", int64_t{0}));
    state.size_bytes = j.contains("sizeBytes")
        ? j["sizeBytes"].get<uint64_t>()
        : static_cast<uint64_t>(state.content.size());
}

}
