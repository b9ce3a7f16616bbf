#pragma once

#include "core/event_queue.h"
#include "core/session_events.h"
#include "process/process_host.h"
#include "session/session_registry.h"
#include "terminal/terminal_adapter.h"
#include <chrono>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace termdock {

enum class Attachment {
    Attached,
    Detached
};

struct PoolEntry {
    std::shared_ptr<TerminalAdapter> adapter;
    Attachment attachment = Attachment::Attached;
    IRenderSurface* surface = nullptr;
};

// Live adapters keyed by session id. Owned and driven by a single thread;
// only the process host callbacks cross threads, through the event queue.
class InstancePool {
public:
    InstancePool(SessionRegistry& registry, IProcessHost& host,
                 size_t scrollback_lines = VTerminal::kDefaultMaxScrollback);
    ~InstancePool();

    InstancePool(const InstancePool&) = delete;
    InstancePool& operator=(const InstancePool&) = delete;

    // Creates the session and its process when the id is unknown (an empty
    // id lets the registry pick one), then binds the surface. A detached
    // entry is replayed into the surface; an attached one is rebound. A
    // surface bound to another session is detached from it first.
    // Throws CapacityExceededError, or IoError if the process cannot start.
    std::shared_ptr<TerminalAdapter> create_or_attach(const SessionId& session_id,
                                                      const SessionDescriptor& descriptor,
                                                      IRenderSurface& surface);

    // Saves the captured buffer state and unbinds the surface.
    void detach(const SessionId& session_id);

    std::shared_ptr<TerminalAdapter> get(const SessionId& session_id) const;
    bool has(const SessionId& session_id) const;
    std::optional<Attachment> attachment(const SessionId& session_id) const;

    void resize(const SessionId& session_id, int cols, int rows);
    void write(const SessionId& session_id, const std::string& data);
    void destroy(const SessionId& session_id);

    void focus(const SessionId& session_id);
    void blur(const SessionId& session_id);
    void fit(const SessionId& session_id);
    void scroll_to_top(const SessionId& session_id);
    void scroll_to_bottom(const SessionId& session_id);

    // Feeds queued process output and exits into the adapters. Returns the
    // number of events handled.
    size_t process_events();
    // Same, but waits up to timeout for the first event.
    size_t process_events_for(std::chrono::milliseconds timeout);

    std::vector<SessionId> session_ids() const;
    size_t size() const { return entries_.size(); }
    std::optional<Session> session(const SessionId& session_id) const;
    void clear_all();

private:
    PoolEntry& entry_or_throw(const SessionId& session_id);
    TerminalAdapter* attached_adapter(const SessionId& session_id, const char* operation);
    void wire_adapter(TerminalAdapter& adapter);
    void claim_surface(IRenderSurface& surface, const SessionId& session_id);
    void bind_surface(const SessionId& session_id, PoolEntry& entry, IRenderSurface& surface);
    void release_surface(PoolEntry& entry);
    void spawn_process(const Session& session, bool rollback_on_failure);
    void on_session_destroyed(const SessionId& session_id);
    size_t handle_events(std::vector<ProcessEvent> events);

    SessionRegistry& registry_;
    IProcessHost& host_;
    size_t scrollback_lines_;

    std::unordered_map<SessionId, PoolEntry> entries_;
    std::unordered_map<const IRenderSurface*, SessionId> surface_owners_;
    EventQueue<ProcessEvent> events_;
    SessionRegistry::ListenerId destroy_listener_ = 0;
};

const char* attachment_name(Attachment attachment);

}
