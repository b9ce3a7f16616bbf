#include <gtest/gtest.h>
#include "config/core_config.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(CoreConfigTest, DefaultsWhenEmpty) {
    auto cfg = termdock::CoreConfig::from_toml(toml::table{});
    
    EXPECT_EQ(cfg.buffer.max_lines, 10000u);
    EXPECT_EQ(cfg.buffer.max_bytes, 50ull * 1024 * 1024);
    EXPECT_EQ(cfg.sessions.max_sessions, 10u);
    EXPECT_EQ(cfg.sessions.default_dimensions, (termdock::Dimensions{80, 24}));
    EXPECT_TRUE(cfg.sessions.shell.empty());
    EXPECT_EQ(cfg.memory_warning_threshold, 400ull * 1024 * 1024);
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_TRUE(cfg.logging.file.empty());
}

TEST(CoreConfigTest, ParsesAllSections) {
    auto tbl = toml::parse(R"(
        [buffer]
        max_lines = 5000
        max_bytes = 1048576

        [sessions]
        max_sessions = 4
        default_cols = 120
        default_rows = 40
        shell = "/bin/zsh"
        working_dir = "/srv/work"

        [memory]
        warning_threshold_bytes = 2097152

        [logging]
        level = "debug"
        file = "/tmp/termdock.log"
    )");
    
    auto cfg = termdock::CoreConfig::from_toml(tbl);
    
    EXPECT_EQ(cfg.buffer.max_lines, 5000u);
    EXPECT_EQ(cfg.buffer.max_bytes, 1048576u);
    EXPECT_EQ(cfg.sessions.max_sessions, 4u);
    EXPECT_EQ(cfg.sessions.default_dimensions, (termdock::Dimensions{120, 40}));
    EXPECT_EQ(cfg.sessions.shell, "/bin/zsh");
    EXPECT_EQ(cfg.sessions.working_dir, "/srv/work");
    EXPECT_EQ(cfg.memory_warning_threshold, 2097152u);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.file, "/tmp/termdock.log");
}

TEST(CoreConfigTest, IgnoresNonPositiveValues) {
    auto tbl = toml::parse(R"(
        [buffer]
        max_lines = 0
        [sessions]
        max_sessions = -3
        default_cols = 100
    )");
    
    auto cfg = termdock::CoreConfig::from_toml(tbl);
    
    EXPECT_EQ(cfg.buffer.max_lines, 10000u);
    EXPECT_EQ(cfg.sessions.max_sessions, 10u);
    EXPECT_EQ(cfg.sessions.default_dimensions.cols, 100);
}

TEST(CoreConfigTest, ToTomlRoundTrip) {
    termdock::CoreConfig cfg;
    cfg.buffer.max_lines = 2000;
    cfg.sessions.max_sessions = 3;
    cfg.sessions.shell = "/bin/bash";
    cfg.logging.level = "warn";
    
    auto parsed = termdock::CoreConfig::from_toml(cfg.to_toml());
    
    EXPECT_EQ(parsed.buffer.max_lines, 2000u);
    EXPECT_EQ(parsed.sessions.max_sessions, 3u);
    EXPECT_EQ(parsed.sessions.shell, "/bin/bash");
    EXPECT_EQ(parsed.logging.level, "warn");
}

TEST(CoreConfigTest, LoadFromFile) {
    fs::path dir = fs::temp_directory_path() / "termdock_config_test";
    fs::create_directories(dir);
    fs::path path = dir / "config.toml";
    {
        std::ofstream out(path);
        out << "[sessions]\nmax_sessions = 6\n";
    }
    
    std::string error;
    auto cfg = termdock::load_core_config(path.string(), error);
    ASSERT_TRUE(cfg.has_value()) << error;
    EXPECT_EQ(cfg->sessions.max_sessions, 6u);
    
    fs::remove_all(dir);
}

TEST(CoreConfigTest, LoadReportsErrors) {
    std::string error;
    EXPECT_FALSE(termdock::load_core_config("/nonexistent/termdock.toml", error).has_value());
    EXPECT_NE(error.find("not found"), std::string::npos);
    
    fs::path dir = fs::temp_directory_path() / "termdock_config_bad";
    fs::create_directories(dir);
    fs::path path = dir / "config.toml";
    {
        std::ofstream out(path);
        out << "[sessions\nmax_sessions = ";
    }
    
    error.clear();
    EXPECT_FALSE(termdock::load_core_config(path.string(), error).has_value());
    EXPECT_NE(error.find("Failed to parse"), std::string::npos);
    
    fs::remove_all(dir);
}

TEST(CoreConfigTest, DefaultPathEndsInTermdockDir) {
    std::string path = termdock::default_config_path();
    EXPECT_NE(path.find("termdock"), std::string::npos);
    EXPECT_EQ(fs::path(path).filename().string(), "config.toml");
}
