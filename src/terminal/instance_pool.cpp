#include "terminal/instance_pool.h"
#include "core/errors.h"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <type_traits>
#include <unordered_set>
#include <variant>

namespace termdock {

const char* attachment_name(Attachment attachment) {
    switch (attachment) {
        case Attachment::Attached: return "attached";
        case Attachment::Detached: return "detached";
    }
    return "unknown";
}

InstancePool::InstancePool(SessionRegistry& registry, IProcessHost& host, size_t scrollback_lines)
    : registry_(registry)
    , host_(host)
    , scrollback_lines_(scrollback_lines)
{
    host_.set_output_callback([this](const SessionId& session_id, const std::string& data) {
        events_.push(OutputEvent{session_id, data});
    });
    host_.set_exit_callback([this](const SessionId& session_id, int exit_code) {
        events_.push(ExitEvent{session_id, exit_code});
    });
    destroy_listener_ = registry_.add_destroy_listener([this](const SessionId& session_id) {
        on_session_destroyed(session_id);
    });
}

InstancePool::~InstancePool() {
    registry_.remove_destroy_listener(destroy_listener_);
    host_.set_output_callback(nullptr);
    host_.set_exit_callback(nullptr);
    for (auto& [id, entry] : entries_) {
        // Joins the process's I/O thread, so no callback copy outlives events_.
        host_.kill(id);
        if (entry.adapter && !entry.adapter->is_disposed()) {
            entry.adapter->detach();
            entry.adapter->register_event_handlers({});
        }
    }
    entries_.clear();
    surface_owners_.clear();
}

std::shared_ptr<TerminalAdapter> InstancePool::create_or_attach(const SessionId& session_id,
                                                                const SessionDescriptor& descriptor,
                                                                IRenderSurface& surface) {
    std::optional<Session> session = session_id.empty() ? std::nullopt : registry_.get(session_id);
    bool created = false;
    if (!session) {
        SessionDescriptor request = descriptor;
        if (!session_id.empty()) {
            request.id = session_id;
        }
        session = registry_.create(request);
        created = true;
    }
    const SessionId& id = session->id;

    auto it = entries_.find(id);
    if (it != entries_.end()) {
        PoolEntry& entry = it->second;
        bool was_detached = entry.attachment == Attachment::Detached;
        claim_surface(surface, id);
        bind_surface(id, entry, surface);
        registry_.update(id, {});
        spdlog::info("[InstancePool] {} {}", id, was_detached ? "reattached" : "rebound");
        return entry.adapter;
    }

    if (created || !host_.is_running(id)) {
        spawn_process(*session, created);
    }

    auto adapter = std::make_shared<TerminalAdapter>(id, AdapterConfig{session->dimensions, scrollback_lines_});
    if (auto retained = registry_.restore_state(id); retained && !retained->scrollback.empty()) {
        adapter->restore_buffer_state(*retained);
    }
    wire_adapter(*adapter);
    claim_surface(surface, id);

    PoolEntry& entry = entries_.emplace(id, PoolEntry{adapter, Attachment::Detached, nullptr}).first->second;
    bind_surface(id, entry, surface);
    registry_.update(id, {});
    spdlog::info("[InstancePool] {} created (pool size {})", id, entries_.size());
    return adapter;
}

void InstancePool::spawn_process(const Session& session, bool rollback_on_failure) {
    ProcessSpec spec;
    spec.executable = session.shell;
    spec.working_dir = session.working_dir;
    spec.dimensions = session.dimensions;

    if (host_.spawn(session.id, spec)) {
        return;
    }
    spdlog::error("[InstancePool] {} process failed to start", session.id);
    if (rollback_on_failure) {
        registry_.destroy(session.id);
    }
    throw IoError(session.id, "Failed to start process");
}

void InstancePool::claim_surface(IRenderSurface& surface, const SessionId& session_id) {
    auto owner = surface_owners_.find(&surface);
    if (owner == surface_owners_.end() || owner->second == session_id) {
        return;
    }
    SessionId previous = owner->second;
    spdlog::info("[InstancePool] Surface moves from {} to {}", previous, session_id);
    detach(previous);
}

void InstancePool::bind_surface(const SessionId& session_id, PoolEntry& entry, IRenderSurface& surface) {
    if (entry.surface != &surface) {
        release_surface(entry);
    }
    entry.adapter->attach(surface);
    entry.attachment = Attachment::Attached;
    entry.surface = &surface;
    surface_owners_[&surface] = session_id;
}

void InstancePool::release_surface(PoolEntry& entry) {
    if (entry.surface) {
        surface_owners_.erase(entry.surface);
        entry.surface = nullptr;
    }
}

void InstancePool::wire_adapter(TerminalAdapter& adapter) {
    SessionId id = adapter.session_id();
    TerminalEventHandlers handlers;
    handlers.on_data = [this, id](const std::string& data) {
        if (!host_.write(id, data)) {
            spdlog::warn("[InstancePool] {} dropped {} bytes of input: process not writable", id, data.size());
        }
    };
    handlers.on_resize = [this, id](Dimensions dimensions) {
        if (registry_.has(id)) {
            SessionUpdate update;
            update.dimensions = dimensions;
            registry_.update(id, update);
        }
        if (host_.is_running(id) && !host_.resize(id, dimensions)) {
            spdlog::warn("[InstancePool] {} process resize to {}x{} failed", id, dimensions.cols, dimensions.rows);
        }
    };
    handlers.on_title_change = [id](const std::string& title) {
        spdlog::debug("[InstancePool] {} title: {}", id, title);
    };
    adapter.register_event_handlers(std::move(handlers));
}

void InstancePool::detach(const SessionId& session_id) {
    PoolEntry& entry = entry_or_throw(session_id);
    if (entry.attachment == Attachment::Detached) {
        spdlog::debug("[InstancePool] {} already detached", session_id);
        return;
    }
    registry_.save_state(session_id, entry.adapter->capture_buffer_state());
    entry.adapter->detach();
    entry.attachment = Attachment::Detached;
    release_surface(entry);
    spdlog::info("[InstancePool] {} detached", session_id);
}

std::shared_ptr<TerminalAdapter> InstancePool::get(const SessionId& session_id) const {
    auto it = entries_.find(session_id);
    return it != entries_.end() ? it->second.adapter : nullptr;
}

bool InstancePool::has(const SessionId& session_id) const {
    return entries_.count(session_id) > 0;
}

std::optional<Attachment> InstancePool::attachment(const SessionId& session_id) const {
    auto it = entries_.find(session_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.attachment;
}

void InstancePool::resize(const SessionId& session_id, int cols, int rows) {
    PoolEntry& entry = entry_or_throw(session_id);
    entry.adapter->resize(Dimensions{cols, rows});
    Dimensions applied = entry.adapter->dimensions();

    SessionUpdate update;
    update.dimensions = applied;
    registry_.update(session_id, update);

    if (host_.is_running(session_id) && !host_.resize(session_id, applied)) {
        spdlog::warn("[InstancePool] {} process resize to {}x{} failed", session_id, applied.cols, applied.rows);
        throw IoError(session_id, "Failed to resize process");
    }
}

void InstancePool::write(const SessionId& session_id, const std::string& data) {
    if (!registry_.has(session_id)) {
        throw NotFoundError(session_id);
    }
    if (!host_.write(session_id, data)) {
        spdlog::warn("[InstancePool] {} write of {} bytes failed", session_id, data.size());
        throw IoError(session_id, "Failed to write to process");
    }
}

void InstancePool::destroy(const SessionId& session_id) {
    if (registry_.has(session_id)) {
        // The registry's destroy listener tears down the pool entry.
        registry_.destroy(session_id);
        return;
    }
    if (!has(session_id)) {
        throw NotFoundError(session_id);
    }
    on_session_destroyed(session_id);
}

void InstancePool::on_session_destroyed(const SessionId& session_id) {
    host_.kill(session_id);

    auto it = entries_.find(session_id);
    if (it == entries_.end()) {
        return;
    }
    release_surface(it->second);
    std::shared_ptr<TerminalAdapter> adapter = std::move(it->second.adapter);
    entries_.erase(it);
    if (adapter && !adapter->is_disposed()) {
        adapter->dispose();
    }
    spdlog::info("[InstancePool] {} destroyed (pool size {})", session_id, entries_.size());
}

TerminalAdapter* InstancePool::attached_adapter(const SessionId& session_id, const char* operation) {
    auto it = entries_.find(session_id);
    if (it == entries_.end()) {
        spdlog::debug("[InstancePool] {} ignored: no instance for {}", operation, session_id);
        return nullptr;
    }
    if (it->second.attachment != Attachment::Attached) {
        spdlog::debug("[InstancePool] {} ignored: {} is detached", operation, session_id);
        return nullptr;
    }
    return it->second.adapter.get();
}

void InstancePool::focus(const SessionId& session_id) {
    if (auto* adapter = attached_adapter(session_id, "focus")) {
        adapter->focus();
    }
}

void InstancePool::blur(const SessionId& session_id) {
    if (auto* adapter = attached_adapter(session_id, "blur")) {
        adapter->blur();
    }
}

void InstancePool::fit(const SessionId& session_id) {
    if (auto* adapter = attached_adapter(session_id, "fit")) {
        adapter->fit();
    }
}

void InstancePool::scroll_to_top(const SessionId& session_id) {
    if (auto* adapter = attached_adapter(session_id, "scroll_to_top")) {
        adapter->scroll_to_top();
    }
}

void InstancePool::scroll_to_bottom(const SessionId& session_id) {
    if (auto* adapter = attached_adapter(session_id, "scroll_to_bottom")) {
        adapter->scroll_to_bottom();
    }
}

size_t InstancePool::process_events() {
    return handle_events(events_.drain());
}

size_t InstancePool::process_events_for(std::chrono::milliseconds timeout) {
    auto first = events_.wait_pop_for(timeout);
    if (!first) {
        return 0;
    }
    std::vector<ProcessEvent> events;
    events.push_back(std::move(*first));
    for (auto& event : events_.drain()) {
        events.push_back(std::move(event));
    }
    return handle_events(std::move(events));
}

size_t InstancePool::handle_events(std::vector<ProcessEvent> events) {
    std::unordered_set<SessionId> touched;

    for (auto& event : events) {
        std::visit([this, &touched](auto&& evt) {
            using T = std::decay_t<decltype(evt)>;

            auto it = entries_.find(evt.session_id);
            if (it == entries_.end()) {
                spdlog::debug("[InstancePool] Dropping event for unknown session {}", evt.session_id);
                return;
            }
            TerminalAdapter& adapter = *it->second.adapter;

            if constexpr (std::is_same_v<T, OutputEvent>) {
                adapter.write(evt.data);
                touched.insert(evt.session_id);
            }
            else if constexpr (std::is_same_v<T, ExitEvent>) {
                adapter.write("\r\n[Process exited with code " + std::to_string(evt.exit_code) + "]\r\n");
                touched.insert(evt.session_id);
                SessionUpdate update;
                update.status = SessionStatus::Stopped;
                registry_.update(evt.session_id, update);
            }
        }, event);
    }

    for (const auto& id : touched) {
        auto it = entries_.find(id);
        if (it != entries_.end() && registry_.has(id)) {
            registry_.save_state(id, it->second.adapter->capture_buffer_state());
        }
    }
    return events.size();
}

std::vector<SessionId> InstancePool::session_ids() const {
    std::vector<SessionId> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<Session> InstancePool::session(const SessionId& session_id) const {
    return registry_.get(session_id);
}

void InstancePool::clear_all() {
    for (const auto& id : session_ids()) {
        destroy(id);
    }
    spdlog::info("[InstancePool] All instances cleared");
}

PoolEntry& InstancePool::entry_or_throw(const SessionId& session_id) {
    auto it = entries_.find(session_id);
    if (it == entries_.end()) {
        throw NotFoundError(session_id);
    }
    return it->second;
}

}
