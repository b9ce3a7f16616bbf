#pragma once

#include "core/types.h"
#include <stdexcept>
#include <string>

namespace termdock {

class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message)
        : std::runtime_error(message) {}
};

// Raised by SessionRegistry::create at the global session cap.
class CapacityExceededError : public SessionError {
public:
    explicit CapacityExceededError(size_t max_sessions)
        : SessionError("Maximum terminal sessions reached (" + std::to_string(max_sessions) + ")")
        , max_sessions_(max_sessions) {}

    size_t max_sessions() const { return max_sessions_; }

private:
    size_t max_sessions_;
};

class NotFoundError : public SessionError {
public:
    explicit NotFoundError(const SessionId& session_id)
        : SessionError("Session not found: " + session_id)
        , session_id_(session_id) {}

    const SessionId& session_id() const { return session_id_; }

private:
    SessionId session_id_;
};

class DisposedError : public SessionError {
public:
    DisposedError(const SessionId& session_id, const std::string& operation)
        : SessionError("Cannot " + operation + " disposed terminal: " + session_id)
        , session_id_(session_id) {}

    const SessionId& session_id() const { return session_id_; }

private:
    SessionId session_id_;
};

// Process write/resize/spawn failure. The session stays alive.
class IoError : public SessionError {
public:
    IoError(const SessionId& session_id, const std::string& what)
        : SessionError(what + " (session " + session_id + ")")
        , session_id_(session_id) {}

    const SessionId& session_id() const { return session_id_; }

private:
    SessionId session_id_;
};

}
