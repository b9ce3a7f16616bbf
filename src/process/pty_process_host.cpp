#include "process/pty_process_host.h"
#include <spdlog/spdlog.h>
#include <vector>

namespace termdock {

PtyProcessHost::PtyProcessHost() = default;

PtyProcessHost::~PtyProcessHost() {
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        output_callback_ = nullptr;
        exit_callback_ = nullptr;
    }

    std::unordered_map<SessionId, std::unique_ptr<ProcessRunner>> runners;
    {
        std::lock_guard<std::mutex> lock(runners_mutex_);
        runners.swap(runners_);
    }
    for (auto& [id, runner] : runners) {
        if (runner && runner->is_running()) {
            runner->stop();
        }
    }
    runners.clear();
}

bool PtyProcessHost::spawn(const SessionId& session_id, const ProcessSpec& spec) {
    std::unique_ptr<ProcessRunner> previous;
    {
        std::lock_guard<std::mutex> lock(runners_mutex_);
        auto it = runners_.find(session_id);
        if (it != runners_.end()) {
            if (it->second && it->second->is_running()) {
                spdlog::warn("[PtyProcessHost] {} already has a running process", session_id);
                return false;
            }
            previous = std::move(it->second);
            runners_.erase(it);
        }
    }
    previous.reset();

    auto runner = std::make_unique<ProcessRunner>();
    runner->set_output_callback([this, session_id](const std::string& data) {
        emit_output(session_id, data);
    });
    runner->set_exit_callback([this, session_id](int exit_code) {
        emit_exit(session_id, exit_code);
    });

    if (!runner->start(spec)) {
        spdlog::error("[PtyProcessHost] Failed to start process for {}", session_id);
        return false;
    }

    std::lock_guard<std::mutex> lock(runners_mutex_);
    runners_[session_id] = std::move(runner);
    return true;
}

bool PtyProcessHost::write(const SessionId& session_id, const std::string& data) {
    std::lock_guard<std::mutex> lock(runners_mutex_);
    auto it = runners_.find(session_id);
    if (it == runners_.end() || !it->second || !it->second->is_running()) {
        return false;
    }
    return it->second->write_stdin(data);
}

bool PtyProcessHost::resize(const SessionId& session_id, Dimensions dimensions) {
    std::lock_guard<std::mutex> lock(runners_mutex_);
    auto it = runners_.find(session_id);
    if (it == runners_.end() || !it->second || !it->second->is_running()) {
        return false;
    }
    return it->second->resize(dimensions);
}

void PtyProcessHost::kill(const SessionId& session_id) {
    std::unique_ptr<ProcessRunner> runner;
    {
        std::lock_guard<std::mutex> lock(runners_mutex_);
        auto it = runners_.find(session_id);
        if (it == runners_.end()) {
            return;
        }
        runner = std::move(it->second);
        runners_.erase(it);
    }
    if (runner && runner->is_running()) {
        runner->kill();
    }
    // Joins the I/O thread; its exit notification fires before this returns.
    runner.reset();
    spdlog::debug("[PtyProcessHost] {} process released", session_id);
}

bool PtyProcessHost::is_running(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(runners_mutex_);
    auto it = runners_.find(session_id);
    return it != runners_.end() && it->second && it->second->is_running();
}

void PtyProcessHost::set_output_callback(OutputCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    output_callback_ = std::move(cb);
}

void PtyProcessHost::set_exit_callback(ExitCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    exit_callback_ = std::move(cb);
}

void PtyProcessHost::stop_all() {
    std::lock_guard<std::mutex> lock(runners_mutex_);
    for (auto& [id, runner] : runners_) {
        if (runner && runner->is_running()) {
            runner->stop();
        }
    }
}

size_t PtyProcessHost::process_count() const {
    std::lock_guard<std::mutex> lock(runners_mutex_);
    return runners_.size();
}

void PtyProcessHost::emit_output(const SessionId& session_id, const std::string& data) {
    OutputCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        cb = output_callback_;
    }
    if (cb) {
        cb(session_id, data);
    }
}

void PtyProcessHost::emit_exit(const SessionId& session_id, int exit_code) {
    spdlog::info("[PtyProcessHost] {} process exited with code {}", session_id, exit_code);
    ExitCallback cb;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        cb = exit_callback_;
    }
    if (cb) {
        cb(session_id, exit_code);
    }
}

}
