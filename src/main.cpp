#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "buffer/buffer_store.h"
#include "config/core_config.h"
#include "core/errors.h"
#include "core/logging.h"
#include "process/pty_process_host.h"
#include "session/session_registry.h"
#include "terminal/instance_pool.h"
#include "terminal/vterm_surface.h"

namespace fs = std::filesystem;

static void print_usage(const char* argv0) {
    fprintf(stderr,
            "Usage: %s [--config PATH] [--command CMD] [--timeout SECONDS]\n"
            "Runs CMD in a pooled shell session, detaches halfway and prints the\n"
            "output replayed into a second surface.\n",
            argv0);
}

static termdock::CoreConfig load_config(const std::optional<std::string>& explicit_path) {
    std::string path = explicit_path ? *explicit_path : termdock::default_config_path();
    std::error_code ec;
    if (!explicit_path && !fs::exists(path, ec)) {
        return {};
    }

    std::string error;
    if (auto cfg = termdock::load_core_config(path, error)) {
        return *cfg;
    }
    fprintf(stderr, "%s; using defaults\n", error.c_str());
    return {};
}

static bool pump_until(termdock::InstancePool& pool, const termdock::SessionId& id,
                       std::chrono::steady_clock::time_point deadline, bool stop_on_output) {
    while (std::chrono::steady_clock::now() < deadline) {
        size_t handled = pool.process_events_for(std::chrono::milliseconds(50));
        auto session = pool.session(id);
        if (!session || session->status == termdock::SessionStatus::Stopped) {
            return true;
        }
        if (stop_on_output && handled > 0) {
            return true;
        }
    }
    return false;
}

int main(int argc, char** argv) {
    std::optional<std::string> config_path;
    std::string command = "echo termdock session ready; uname -s";
    int timeout_seconds = 10;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--command") == 0 && i + 1 < argc) {
            command = argv[++i];
        } else if (strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout_seconds = std::max(1, atoi(argv[++i]));
        } else {
            print_usage(argv[0]);
            return strcmp(argv[i], "--help") == 0 ? 0 : 2;
        }
    }

    termdock::CoreConfig config = load_config(config_path);
    termdock::init_logging(config.logging);

    // Surfaces outlive the pool that binds them.
    termdock::VTermSurface first(config.sessions.default_dimensions);
    termdock::VTermSurface second(config.sessions.default_dimensions);

    termdock::BufferStore buffers(config.buffer, config.memory_warning_threshold);
    termdock::SessionRegistry registry(buffers, config.sessions.max_sessions);
    termdock::PtyProcessHost host;
    termdock::InstancePool pool(registry, host);

    termdock::SessionDescriptor descriptor;
    descriptor.name = "demo";
    descriptor.shell = config.sessions.shell;
    descriptor.working_dir = config.sessions.working_dir;
    descriptor.dimensions = config.sessions.default_dimensions;

    try {
        auto adapter = pool.create_or_attach("", descriptor, first);
        termdock::SessionId id = adapter->session_id();
        pool.write(id, command + "\nexit\n");

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
        pump_until(pool, id, deadline, true);

        pool.detach(id);
        pool.create_or_attach(id, descriptor, second);

        if (!pump_until(pool, id, deadline, false)) {
            spdlog::warn("Session {} still running after {}s", id, timeout_seconds);
        }
    } catch (const termdock::SessionError& e) {
        spdlog::error("Session failed: {}", e.what());
        pool.clear_all();
        return 1;
    }

    for (const auto& line : second.lines()) {
        printf("%s\n", line.c_str());
    }

    buffers.log_memory_report();
    pool.clear_all();
    return 0;
}
