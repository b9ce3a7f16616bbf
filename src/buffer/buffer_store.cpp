#include "buffer/buffer_store.h"
#include <algorithm>
#include <limits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace termdock {

BufferStore::BufferStore(BufferLimits limits, uint64_t memory_warning_threshold)
    : limits_(limits)
    , monitor_(memory_warning_threshold)
{
    spdlog::info("[BufferStore] Initialized: max_lines={} max_bytes={} warning_threshold={}",
                 limits_.max_lines, limits_.max_bytes, memory_warning_threshold);
}

void BufferStore::save(BufferState state) {
    auto start = std::chrono::steady_clock::now();
    SessionId session_id = state.session_id;
    bool trimmed = false;
    TrimStats stats;

    if (needs_trimming(state, limits_)) {
        spdlog::info("[BufferStore] Auto-trimming {} on save: lines={} bytes={}",
                     session_id, state.scrollback.size(), state.size_bytes);
        auto result = trim_buffer(std::move(state), limits_);
        state = std::move(result.state);
        stats = result.stats;
        trimmed = true;
    }

    size_t lines = state.scrollback.size();
    uint64_t total = 0;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (trimmed) {
            ++trim_operation_count_;
            total_bytes_trimmed_ += stats.bytes_removed;
        }
        buffers_[session_id] = std::move(state);
        total = total_memory_usage_locked();
        count = buffers_.size();
    }

    if (trimmed) {
        spdlog::info("[BufferStore] Trimmed {}: lines {} -> {}, bytes {} -> {} in {} us",
                     session_id, stats.lines_before, stats.lines_after,
                     stats.bytes_before, stats.bytes_after, stats.duration.count());
        if (stats.duration > kTrimWarnThreshold) {
            spdlog::warn("[BufferStore] Trim of {} exceeded {} ms ({} lines before)",
                         session_id, kTrimWarnThreshold.count(), stats.lines_before);
        }
    }

    monitor_.observe(total, count);

    auto elapsed = std::chrono::steady_clock::now() - start;
    if (elapsed > kSaveWarnThreshold) {
        spdlog::warn("[BufferStore] Save of {} exceeded {} ms ({} lines)",
                     session_id, kSaveWarnThreshold.count(), lines);
    } else {
        spdlog::debug("[BufferStore] Saved {}: lines={}", session_id, lines);
    }
}

std::optional<BufferState> BufferStore::get(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(session_id);
    if (it == buffers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool BufferStore::has(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffers_.count(session_id) > 0;
}

void BufferStore::remove(const SessionId& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffers_.erase(session_id) > 0) {
        spdlog::debug("[BufferStore] Removed {}", session_id);
    }
}

void BufferStore::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = buffers_.size();
    buffers_.clear();
    spdlog::info("[BufferStore] Cleared {} buffers", count);
}

size_t BufferStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffers_.size();
}

std::vector<BufferState> BufferStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BufferState> result;
    result.reserve(buffers_.size());
    for (const auto& [id, state] : buffers_) {
        result.push_back(state);
    }
    return result;
}

uint64_t BufferStore::total_memory_usage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_memory_usage_locked();
}

uint64_t BufferStore::total_memory_usage_locked() const {
    uint64_t total = 0;
    for (const auto& [id, state] : buffers_) {
        total += state.size_bytes;
    }
    return total;
}

std::optional<TrimStats> BufferStore::trim_stats(const BufferState& state) const {
    if (!needs_trimming(state, limits_)) {
        return std::nullopt;
    }
    return trim_buffer(state, limits_).stats;
}

std::optional<BufferMemoryInfo> BufferStore::buffer_memory_info(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(session_id);
    if (it == buffers_.end()) {
        return std::nullopt;
    }

    const auto& state = it->second;
    BufferMemoryInfo info;
    info.session_id = session_id;
    info.size_bytes = state.size_bytes;
    info.line_count = state.scrollback.size();
    info.avg_line_size = info.line_count > 0
        ? static_cast<double>(state.size_bytes) / static_cast<double>(info.line_count)
        : 0.0;
    info.percent_of_limit = limits_.max_bytes > 0
        ? static_cast<double>(state.size_bytes) * 100.0 / static_cast<double>(limits_.max_bytes)
        : 0.0;
    return info;
}

MemoryStats BufferStore::memory_stats() const {
    MemoryStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.buffer_count = buffers_.size();
        stats.trim_operation_count = trim_operation_count_;
        stats.total_bytes_trimmed = total_bytes_trimmed_;

        uint64_t min_size = std::numeric_limits<uint64_t>::max();
        for (const auto& [id, state] : buffers_) {
            stats.total_bytes += state.size_bytes;
            stats.max_buffer_size_bytes = std::max(stats.max_buffer_size_bytes, state.size_bytes);
            min_size = std::min(min_size, state.size_bytes);
        }
        stats.min_buffer_size_bytes = buffers_.empty() ? 0 : min_size;
    }

    stats.avg_buffer_size_bytes = stats.buffer_count > 0
        ? static_cast<double>(stats.total_bytes) / static_cast<double>(stats.buffer_count)
        : 0.0;
    stats.under_pressure = stats.total_bytes > monitor_.threshold();
    return stats;
}

void BufferStore::reset_trim_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    trim_operation_count_ = 0;
    total_bytes_trimmed_ = 0;
    spdlog::info("[BufferStore] Trim statistics reset");
}

void BufferStore::log_memory_report() const {
    auto stats = memory_stats();

    nlohmann::json report;
    report["totalBytes"] = stats.total_bytes;
    report["bufferCount"] = stats.buffer_count;
    report["avgBufferSizeBytes"] = stats.avg_buffer_size_bytes;
    report["underPressure"] = stats.under_pressure;
    report["trimOperations"] = stats.trim_operation_count;
    report["totalBytesTrimmed"] = stats.total_bytes_trimmed;

    nlohmann::json details = nlohmann::json::array();
    for (const auto& state : all()) {
        double percent = limits_.max_bytes > 0
            ? static_cast<double>(state.size_bytes) * 100.0 / static_cast<double>(limits_.max_bytes)
            : 0.0;
        details.push_back({
            {"sessionId", state.session_id},
            {"sizeBytes", state.size_bytes},
            {"lines", state.scrollback.size()},
            {"percentOfLimit", percent},
        });
    }
    report["buffers"] = details;

    spdlog::info("[BufferStore] Memory report: {}", report.dump());
}

}
