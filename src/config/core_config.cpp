#include "config/core_config.h"
#include <cstdlib>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace termdock {

namespace {

template<typename T>
void read_positive(const toml::table& tbl, const char* key, T& target) {
    auto v = tbl[key].value<int64_t>();
    if (!v) return;
    if (*v <= 0) {
        spdlog::warn("[CoreConfig] Ignoring non-positive {} = {}", key, *v);
        return;
    }
    target = static_cast<T>(*v);
}

}

CoreConfig CoreConfig::from_toml(const toml::table& tbl) {
    CoreConfig cfg;

    if (auto buffer_tbl = tbl["buffer"].as_table()) {
        read_positive(*buffer_tbl, "max_lines", cfg.buffer.max_lines);
        read_positive(*buffer_tbl, "max_bytes", cfg.buffer.max_bytes);
    }

    if (auto sessions_tbl = tbl["sessions"].as_table()) {
        read_positive(*sessions_tbl, "max_sessions", cfg.sessions.max_sessions);
        read_positive(*sessions_tbl, "default_cols", cfg.sessions.default_dimensions.cols);
        read_positive(*sessions_tbl, "default_rows", cfg.sessions.default_dimensions.rows);
        if (auto v = (*sessions_tbl)["shell"].value<std::string>()) cfg.sessions.shell = *v;
        if (auto v = (*sessions_tbl)["working_dir"].value<std::string>()) cfg.sessions.working_dir = *v;
    }

    if (auto memory_tbl = tbl["memory"].as_table()) {
        read_positive(*memory_tbl, "warning_threshold_bytes", cfg.memory_warning_threshold);
    }

    if (auto logging_tbl = tbl["logging"].as_table()) {
        if (auto v = (*logging_tbl)["level"].value<std::string>()) cfg.logging.level = *v;
        if (auto v = (*logging_tbl)["file"].value<std::string>()) cfg.logging.file = *v;
        read_positive(*logging_tbl, "max_file_bytes", cfg.logging.max_file_bytes);
        read_positive(*logging_tbl, "max_files", cfg.logging.max_files);
    }

    return cfg;
}

toml::table CoreConfig::to_toml() const {
    toml::table tbl;

    tbl.insert_or_assign("buffer", toml::table{
        {"max_lines", static_cast<int64_t>(buffer.max_lines)},
        {"max_bytes", static_cast<int64_t>(buffer.max_bytes)},
    });

    toml::table sessions_tbl{
        {"max_sessions", static_cast<int64_t>(sessions.max_sessions)},
        {"default_cols", static_cast<int64_t>(sessions.default_dimensions.cols)},
        {"default_rows", static_cast<int64_t>(sessions.default_dimensions.rows)},
    };
    if (!sessions.shell.empty()) sessions_tbl.insert_or_assign("shell", sessions.shell);
    if (!sessions.working_dir.empty()) sessions_tbl.insert_or_assign("working_dir", sessions.working_dir);
    tbl.insert_or_assign("sessions", std::move(sessions_tbl));

    tbl.insert_or_assign("memory", toml::table{
        {"warning_threshold_bytes", static_cast<int64_t>(memory_warning_threshold)},
    });

    toml::table logging_tbl{{"level", logging.level}};
    if (!logging.file.empty()) logging_tbl.insert_or_assign("file", logging.file);
    tbl.insert_or_assign("logging", std::move(logging_tbl));

    return tbl;
}

std::string default_config_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return (std::filesystem::path(xdg) / "termdock" / "config.toml").string();
    }
    const char* home = std::getenv("HOME");
    std::filesystem::path base = (home && *home) ? std::filesystem::path(home) / ".config" : std::filesystem::path("/tmp");
    return (base / "termdock" / "config.toml").string();
}

std::optional<CoreConfig> load_core_config(const std::string& path, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        error = "Config file not found: " + path;
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);
        return CoreConfig::from_toml(tbl);
    } catch (const toml::parse_error& e) {
        error = "Failed to parse " + path + ": " + std::string(e.description());
        return std::nullopt;
    }
}

}
