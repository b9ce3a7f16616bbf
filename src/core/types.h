#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace termdock {

using SessionId = std::string;
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct Dimensions {
    int cols = 80;
    int rows = 24;

    bool operator==(const Dimensions& other) const {
        return cols == other.cols && rows == other.rows;
    }
    bool operator!=(const Dimensions& other) const { return !(*this == other); }
};

// Zero-based, relative to the top of the visible screen.
struct CursorPos {
    int x = 0;
    int y = 0;

    bool operator==(const CursorPos& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const CursorPos& other) const { return !(*this == other); }
};

inline int64_t to_epoch_ms(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline TimePoint from_epoch_ms(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

}
