#pragma once

#include "core/types.h"
#include <functional>
#include <string>
#include <vector>

namespace termdock {

struct ProcessSpec {
    // Empty: $SHELL, falling back to /bin/bash.
    std::string executable;
    std::vector<std::string> args;
    // Empty: $HOME, falling back to /tmp.
    std::string working_dir;
    Dimensions dimensions;
};

// Owns the shell processes behind sessions. Output and exit notifications
// may arrive on any thread.
class IProcessHost {
public:
    using OutputCallback = std::function<void(const SessionId& session_id, const std::string& data)>;
    using ExitCallback = std::function<void(const SessionId& session_id, int exit_code)>;

    virtual ~IProcessHost() = default;

    virtual bool spawn(const SessionId& session_id, const ProcessSpec& spec) = 0;
    virtual bool write(const SessionId& session_id, const std::string& data) = 0;
    virtual bool resize(const SessionId& session_id, Dimensions dimensions) = 0;
    virtual void kill(const SessionId& session_id) = 0;
    virtual bool is_running(const SessionId& session_id) const = 0;

    virtual void set_output_callback(OutputCallback cb) = 0;
    virtual void set_exit_callback(ExitCallback cb) = 0;
};

}
