#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

namespace termdock {

struct MemoryPressure {
    uint64_t total_bytes = 0;
    size_t buffer_count = 0;
    uint64_t threshold_bytes = 0;
};

// Advisory only: observations never block or fail a write.
class MemoryMonitor {
public:
    static constexpr uint64_t kDefaultWarningThreshold = 400ull * 1024 * 1024;

    using PressureCallback = std::function<void(const MemoryPressure&)>;

    explicit MemoryMonitor(uint64_t warning_threshold_bytes = kDefaultWarningThreshold);

    // Returns true while total usage is above the threshold.
    bool observe(uint64_t total_bytes, size_t buffer_count);

    bool under_pressure() const;
    uint64_t threshold() const { return threshold_; }
    size_t warning_count() const;

    void set_pressure_callback(PressureCallback cb);

private:
    uint64_t threshold_;
    mutable std::mutex mutex_;
    bool under_pressure_ = false;
    size_t warning_count_ = 0;
    PressureCallback pressure_cb_;
};

}
