#pragma once

#include "process/process_host.h"
#include "process/process_runner.h"
#include <memory>
#include <mutex>
#include <unordered_map>

namespace termdock {

// IProcessHost backed by one forkpty child per session.
class PtyProcessHost : public IProcessHost {
public:
    PtyProcessHost();
    ~PtyProcessHost() override;

    PtyProcessHost(const PtyProcessHost&) = delete;
    PtyProcessHost& operator=(const PtyProcessHost&) = delete;

    bool spawn(const SessionId& session_id, const ProcessSpec& spec) override;
    bool write(const SessionId& session_id, const std::string& data) override;
    bool resize(const SessionId& session_id, Dimensions dimensions) override;
    void kill(const SessionId& session_id) override;
    bool is_running(const SessionId& session_id) const override;

    void set_output_callback(OutputCallback cb) override;
    void set_exit_callback(ExitCallback cb) override;

    // Asks every child to terminate (SIGTERM to its process group).
    void stop_all();
    size_t process_count() const;

private:
    void emit_output(const SessionId& session_id, const std::string& data);
    void emit_exit(const SessionId& session_id, int exit_code);

    mutable std::mutex runners_mutex_;
    std::unordered_map<SessionId, std::unique_ptr<ProcessRunner>> runners_;

    std::mutex callbacks_mutex_;
    OutputCallback output_callback_;
    ExitCallback exit_callback_;
};

}
