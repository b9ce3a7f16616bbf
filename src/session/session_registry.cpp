#include "session/session_registry.h"
#include "core/errors.h"
#include <spdlog/spdlog.h>

namespace termdock {

SessionRegistry::SessionRegistry(BufferStore& buffers, size_t max_sessions)
    : buffers_(buffers)
    , max_sessions_(max_sessions)
{
    spdlog::info("[SessionRegistry] Initialized: max_sessions={}", max_sessions_);
}

Session SessionRegistry::create(const SessionDescriptor& descriptor) {
    Session session;
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = insert_locked(descriptor);
        total = sessions_.size();
    }

    // Outside the lock: a save may run the memory pressure callback.
    store_buffer(make_buffer_state(session.id, {}, {}, session.dimensions), false);

    spdlog::info("[SessionRegistry] Session created: {} (total {})", session.id, total);
    return session;
}

Session SessionRegistry::insert_locked(const SessionDescriptor& descriptor) {
    if (sessions_.size() >= max_sessions_) {
        spdlog::warn("[SessionRegistry] Capacity reached ({}), rejecting new session", max_sessions_);
        throw CapacityExceededError(max_sessions_);
    }

    Session session;
    session.id = descriptor.id;
    if (session.id.empty()) {
        do {
            session.id = "session-" + std::to_string(next_session_number_++);
        } while (sessions_.count(session.id) > 0);
    } else if (sessions_.count(session.id) > 0) {
        throw SessionError("Session already exists: " + session.id);
    }

    session.name = descriptor.name.empty() ? session.id : descriptor.name;
    session.context_id = descriptor.context_id;
    session.shell = descriptor.shell;
    session.working_dir = descriptor.working_dir;
    session.dimensions = descriptor.dimensions;
    session.status = SessionStatus::Running;
    session.created_at = Clock::now();
    session.last_accessed = session.created_at;

    sessions_.emplace(session.id, session);
    return session;
}

std::optional<Session> SessionRegistry::get(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SessionRegistry::has(const SessionId& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

void SessionRegistry::update(const SessionId& session_id, const SessionUpdate& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        throw NotFoundError(session_id);
    }

    Session& session = it->second;
    if (update.name) session.name = *update.name;
    if (update.context_id) session.context_id = *update.context_id;
    if (update.dimensions) session.dimensions = *update.dimensions;
    if (update.status) session.status = *update.status;
    session.last_accessed = Clock::now();

    spdlog::debug("[SessionRegistry] Session updated: {}", session_id);
}

void SessionRegistry::destroy(const SessionId& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            throw NotFoundError(session_id);
        }
        buffers_.remove(session_id);
        sessions_.erase(it);
        spdlog::info("[SessionRegistry] Session destroyed: {} (remaining {})",
                     session_id, sessions_.size());
    }

    for (const auto& listener : snapshot_listeners()) {
        listener(session_id);
    }
}

void SessionRegistry::save_state(const SessionId& session_id, BufferState state) {
    if (!has(session_id)) {
        throw NotFoundError(session_id);
    }

    state.session_id = session_id;
    size_t lines = state.scrollback.size();
    if (!store_buffer(std::move(state), true)) {
        throw NotFoundError(session_id);
    }

    spdlog::debug("[SessionRegistry] State saved for {}: {} lines", session_id, lines);
}

bool SessionRegistry::store_buffer(BufferState state, bool touch) {
    SessionId session_id = state.session_id;
    buffers_.save(std::move(state));

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end()) {
            if (touch) {
                it->second.last_accessed = Clock::now();
            }
            return true;
        }
    }

    // Destroyed while the save ran; drop the buffer it left behind.
    buffers_.remove(session_id);
    spdlog::debug("[SessionRegistry] {} destroyed during save, buffer dropped", session_id);
    return false;
}

std::optional<BufferState> SessionRegistry::restore_state(const SessionId& session_id) const {
    auto state = buffers_.get(session_id);
    if (state) {
        spdlog::debug("[SessionRegistry] State restored for {}: {} lines",
                      session_id, state->scrollback.size());
    }
    return state;
}

size_t SessionRegistry::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<Session> SessionRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Session> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

void SessionRegistry::clear_all() {
    std::vector<SessionId> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            removed.push_back(id);
        }
        sessions_.clear();
        buffers_.clear_all();
        spdlog::info("[SessionRegistry] All sessions cleared: {}", removed.size());
    }

    auto listeners = snapshot_listeners();
    for (const auto& id : removed) {
        for (const auto& listener : listeners) {
            listener(id);
        }
    }
}

SessionRegistry::ListenerId SessionRegistry::add_destroy_listener(DestroyListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    ListenerId id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void SessionRegistry::remove_destroy_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

std::vector<SessionRegistry::DestroyListener> SessionRegistry::snapshot_listeners() const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    std::vector<DestroyListener> result;
    result.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_) {
        result.push_back(listener);
    }
    return result;
}

}
