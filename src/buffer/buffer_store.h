#pragma once

#include "buffer/buffer_state.h"
#include "buffer/buffer_trimmer.h"
#include "buffer/memory_monitor.h"
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace termdock {

struct BufferMemoryInfo {
    SessionId session_id;
    uint64_t size_bytes = 0;
    size_t line_count = 0;
    double avg_line_size = 0.0;
    double percent_of_limit = 0.0;
};

struct MemoryStats {
    uint64_t total_bytes = 0;
    size_t buffer_count = 0;
    double avg_buffer_size_bytes = 0.0;
    uint64_t max_buffer_size_bytes = 0;
    uint64_t min_buffer_size_bytes = 0;
    size_t trim_operation_count = 0;
    uint64_t total_bytes_trimmed = 0;
    bool under_pressure = false;
};

class BufferStore {
public:
    static constexpr auto kSaveWarnThreshold = std::chrono::milliseconds(100);
    static constexpr auto kTrimWarnThreshold = std::chrono::milliseconds(200);

    explicit BufferStore(BufferLimits limits = {},
                         uint64_t memory_warning_threshold = MemoryMonitor::kDefaultWarningThreshold);

    BufferStore(const BufferStore&) = delete;
    BufferStore& operator=(const BufferStore&) = delete;

    // Trims when over either limit, then replaces whatever was stored for
    // state.session_id. Never throws for oversized input.
    void save(BufferState state);

    std::optional<BufferState> get(const SessionId& session_id) const;
    bool has(const SessionId& session_id) const;
    void remove(const SessionId& session_id);
    void clear_all();

    size_t count() const;
    std::vector<BufferState> all() const;
    uint64_t total_memory_usage() const;

    // What save() would do to this state, without storing anything.
    std::optional<TrimStats> trim_stats(const BufferState& state) const;
    std::optional<BufferMemoryInfo> buffer_memory_info(const SessionId& session_id) const;
    MemoryStats memory_stats() const;
    void reset_trim_stats();
    void log_memory_report() const;

    const BufferLimits& limits() const { return limits_; }
    MemoryMonitor& monitor() { return monitor_; }
    const MemoryMonitor& monitor() const { return monitor_; }

private:
    uint64_t total_memory_usage_locked() const;

    BufferLimits limits_;
    MemoryMonitor monitor_;

    mutable std::mutex mutex_;
    std::unordered_map<SessionId, BufferState> buffers_;
    size_t trim_operation_count_ = 0;
    uint64_t total_bytes_trimmed_ = 0;
};

}
