#include "buffer/buffer_trimmer.h"
#include <cmath>
#include <spdlog/spdlog.h>

namespace termdock {

bool needs_trimming(const BufferState& state, const BufferLimits& limits) {
    return state.scrollback.size() > limits.max_lines || state.size_bytes > limits.max_bytes;
}

TrimResult trim_buffer(BufferState state, const BufferLimits& limits) {
    TrimResult result;
    result.stats.lines_before = state.scrollback.size();
    result.stats.bytes_before = state.size_bytes;

    if (!needs_trimming(state, limits)) {
        result.stats.lines_after = state.scrollback.size();
        result.stats.bytes_after = state.size_bytes;
        result.state = std::move(state);
        return result;
    }

    auto start = std::chrono::steady_clock::now();
    auto& lines = state.scrollback;

    if (lines.size() > limits.max_lines) {
        size_t drop = lines.size() - limits.max_lines;
        lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(drop));
        spdlog::debug("[BufferTrimmer] {} trimmed by line count: dropped={} remaining={}",
                      state.session_id, drop, lines.size());
    }

    uint64_t size = joined_size(lines);

    if (size > limits.max_bytes && !lines.empty()) {
        double avg_line_size = static_cast<double>(size) / static_cast<double>(lines.size());
        uint64_t over = size - limits.max_bytes;
        auto estimate = static_cast<size_t>(std::ceil(static_cast<double>(over) / avg_line_size));

        if (estimate > 0 && estimate < lines.size()) {
            lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(estimate));
            size = joined_size(lines);
            result.stats.estimated_lines_dropped = estimate;
            spdlog::debug("[BufferTrimmer] {} estimated trim: dropped={} bytes_over={}",
                          state.session_id, estimate, over);
        }

        // Precise pass, bounded by the estimation error above. Each dropped
        // line takes its separator with it unless it was the last one.
        size_t first = 0;
        while (size > limits.max_bytes && first < lines.size()) {
            size_t remaining = lines.size() - first;
            size -= lines[first].size() + (remaining > 1 ? 1 : 0);
            ++first;
        }
        if (first > 0) {
            lines.erase(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(first));
            result.stats.fine_tune_lines_dropped = first;
        }
    }

    state.content = join_lines(lines);
    state.size_bytes = state.content.size();
    state.timestamp = Clock::now();

    result.stats.lines_after = lines.size();
    result.stats.bytes_after = state.size_bytes;
    result.stats.bytes_removed = result.stats.bytes_before > state.size_bytes
        ? result.stats.bytes_before - state.size_bytes
        : 0;
    result.stats.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    result.stats.timestamp = state.timestamp;
    result.state = std::move(state);
    return result;
}

}
