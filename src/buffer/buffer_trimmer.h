#pragma once

#include "buffer/buffer_state.h"
#include <chrono>
#include <cstdint>

namespace termdock {

struct TrimStats {
    size_t lines_before = 0;
    size_t lines_after = 0;
    uint64_t bytes_before = 0;
    uint64_t bytes_after = 0;
    uint64_t bytes_removed = 0;
    size_t estimated_lines_dropped = 0;
    size_t fine_tune_lines_dropped = 0;
    std::chrono::microseconds duration{0};
    TimePoint timestamp{};
};

struct TrimResult {
    BufferState state;
    TrimStats stats;
};

bool needs_trimming(const BufferState& state, const BufferLimits& limits);

// Two-phase FIFO trim. Oldest lines go first; the newest content is always
// kept. Never fails: a pathological input (every line larger than the byte
// budget) ends with zero lines. A state already within both limits comes
// back unchanged, timestamp included.
TrimResult trim_buffer(BufferState state, const BufferLimits& limits);

}
