#include "core/logging.h"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace termdock {

std::shared_ptr<spdlog::logger> init_logging(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.max_file_bytes, config.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("[Logging] Cannot open log file {}: {}", config.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("termdock", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return logger;
}

}
