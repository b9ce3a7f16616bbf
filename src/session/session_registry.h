#pragma once

#include "session/session.h"
#include "buffer/buffer_store.h"
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace termdock {

class SessionRegistry {
public:
    static constexpr size_t kDefaultMaxSessions = 10;

    using DestroyListener = std::function<void(const SessionId&)>;
    using ListenerId = size_t;

    explicit SessionRegistry(BufferStore& buffers, size_t max_sessions = kDefaultMaxSessions);

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Throws CapacityExceededError at the cap, SessionError on a duplicate id.
    Session create(const SessionDescriptor& descriptor);

    std::optional<Session> get(const SessionId& session_id) const;
    bool has(const SessionId& session_id) const;

    // Throws NotFoundError. Bumps last_accessed even for an empty update.
    void update(const SessionId& session_id, const SessionUpdate& update);

    // Throws NotFoundError. Removes the buffer, then notifies listeners.
    void destroy(const SessionId& session_id);

    // Throws NotFoundError if the session is unknown.
    void save_state(const SessionId& session_id, BufferState state);
    std::optional<BufferState> restore_state(const SessionId& session_id) const;

    size_t count() const;
    std::vector<Session> all() const;
    void clear_all();

    size_t max_sessions() const { return max_sessions_; }
    BufferStore& buffers() { return buffers_; }

    // Listeners run after the registry lock is released.
    ListenerId add_destroy_listener(DestroyListener listener);
    void remove_destroy_listener(ListenerId id);

private:
    Session insert_locked(const SessionDescriptor& descriptor);
    // Saves without holding mutex_, then checks the session survived the
    // save. Returns false (and drops the buffer) if it did not.
    bool store_buffer(BufferState state, bool touch);
    std::vector<DestroyListener> snapshot_listeners() const;

    BufferStore& buffers_;
    size_t max_sessions_;

    mutable std::mutex mutex_;
    std::unordered_map<SessionId, Session> sessions_;
    uint64_t next_session_number_ = 1;

    mutable std::mutex listeners_mutex_;
    std::unordered_map<ListenerId, DestroyListener> listeners_;
    ListenerId next_listener_id_ = 1;
};

}
