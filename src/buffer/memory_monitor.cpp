#include "buffer/memory_monitor.h"
#include <spdlog/spdlog.h>

namespace termdock {

namespace {

double to_mib(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

}

MemoryMonitor::MemoryMonitor(uint64_t warning_threshold_bytes)
    : threshold_(warning_threshold_bytes)
{
}

bool MemoryMonitor::observe(uint64_t total_bytes, size_t buffer_count) {
    PressureCallback cb;
    MemoryPressure pressure{total_bytes, buffer_count, threshold_};
    bool over = total_bytes > threshold_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (over && !under_pressure_) {
            ++warning_count_;
            cb = pressure_cb_;
        }
        if (!over && under_pressure_) {
            spdlog::info("[MemoryMonitor] Memory pressure relieved: {:.2f} MiB across {} buffers",
                         to_mib(total_bytes), buffer_count);
        }
        under_pressure_ = over;
    }

    if (over) {
        double avg = buffer_count > 0 ? to_mib(total_bytes) / static_cast<double>(buffer_count) : 0.0;
        spdlog::warn("[MemoryMonitor] Memory pressure detected: {:.2f} MiB across {} buffers "
                     "(threshold {:.2f} MiB, avg {:.2f} MiB)",
                     to_mib(total_bytes), buffer_count, to_mib(threshold_), avg);
    } else {
        spdlog::debug("[MemoryMonitor] Memory status normal: {:.2f} MiB across {} buffers",
                      to_mib(total_bytes), buffer_count);
    }

    if (cb) {
        cb(pressure);
    }
    return over;
}

bool MemoryMonitor::under_pressure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return under_pressure_;
}

size_t MemoryMonitor::warning_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warning_count_;
}

void MemoryMonitor::set_pressure_callback(PressureCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    pressure_cb_ = std::move(cb);
}

}
