#pragma once

#include "core/types.h"
#include <optional>
#include <string>

namespace termdock {

enum class SessionStatus {
    Running,
    Stopped
};

struct Session {
    SessionId id;
    std::string name;
    std::string context_id;
    std::string shell;
    std::string working_dir;
    Dimensions dimensions;
    SessionStatus status = SessionStatus::Running;
    TimePoint created_at{};
    TimePoint last_accessed{};
};

struct SessionDescriptor {
    // Empty: the registry assigns one.
    SessionId id;
    std::string name;
    std::string context_id;
    std::string shell;
    std::string working_dir;
    Dimensions dimensions;
};

struct SessionUpdate {
    std::optional<std::string> name;
    std::optional<std::string> context_id;
    std::optional<Dimensions> dimensions;
    std::optional<SessionStatus> status;
};

inline const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Running: return "running";
        case SessionStatus::Stopped: return "stopped";
    }
    return "unknown";
}

}
