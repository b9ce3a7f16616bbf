#pragma once

#include <cstddef>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace termdock {

struct LoggingConfig {
    std::string level = "info";
    // Empty: stderr only.
    std::string file;
    size_t max_file_bytes = 5 * 1024 * 1024;
    size_t max_files = 3;
};

// Installs the "termdock" logger as spdlog's default logger. Safe to call
// more than once; the last call wins.
std::shared_ptr<spdlog::logger> init_logging(const LoggingConfig& config);

}
