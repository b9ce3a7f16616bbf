#pragma once

#include "buffer/buffer_state.h"
#include "buffer/memory_monitor.h"
#include "core/logging.h"
#include "core/types.h"
#include <optional>
#include <string>
#include <toml++/toml.hpp>

namespace termdock {

struct SessionSettings {
    size_t max_sessions = 10;
    Dimensions default_dimensions;
    // Empty: the process host picks $SHELL.
    std::string shell;
    std::string working_dir;
};

struct CoreConfig {
    BufferLimits buffer;
    SessionSettings sessions;
    uint64_t memory_warning_threshold = MemoryMonitor::kDefaultWarningThreshold;
    LoggingConfig logging;

    // Missing keys keep their defaults; out-of-range values are ignored.
    static CoreConfig from_toml(const toml::table& tbl);
    toml::table to_toml() const;
};

std::string default_config_path();

// nullopt with error set when the file is unreadable or not valid TOML.
std::optional<CoreConfig> load_core_config(const std::string& path, std::string& error);

}
