#pragma once

#include "buffer/buffer_state.h"
#include "terminal/render_surface.h"
#include "terminal/vterminal.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace termdock {

enum class AdapterState {
    Uninitialized,
    Attached,
    Detached,
    Disposed
};

struct AdapterConfig {
    Dimensions dimensions;
    size_t scrollback = VTerminal::kDefaultMaxScrollback;
};

struct TerminalEventHandlers {
    std::function<void(const std::string& data)> on_data;
    std::function<void(Dimensions dimensions)> on_resize;
    std::function<void(const std::string& title)> on_title_change;
    std::function<void()> on_bell;
};

struct SearchMatch {
    size_t line = 0;
    size_t column = 0;
};

class TerminalAdapter {
public:
    TerminalAdapter(SessionId session_id, AdapterConfig config);
    ~TerminalAdapter();

    TerminalAdapter(const TerminalAdapter&) = delete;
    TerminalAdapter& operator=(const TerminalAdapter&) = delete;

    const SessionId& session_id() const { return session_id_; }
    AdapterState state() const { return state_; }
    bool is_disposed() const { return state_ == AdapterState::Disposed; }
    bool is_attached() const { return state_ == AdapterState::Attached; }
    IRenderSurface* surface() const { return surface_; }

    // Binds a surface and replays scrollback, screen and cursor into it.
    // A previously bound surface is unbound first.
    void attach(IRenderSurface& surface);
    // Unbinds the surface. Emulation state stays.
    void detach();

    // Output destined for the display (process output, local echo).
    void write(const std::string& data);
    void writeln(const std::string& data);

    void resize(Dimensions dimensions);
    void clear();
    void reset();

    // Forwarded to the bound surface; logged no-ops while detached.
    void focus();
    void blur();
    void fit();
    void scroll_to_top();
    void scroll_to_bottom();

    Dimensions dimensions() const;
    CursorPos cursor() const;
    std::string title() const;

    BufferState capture_buffer_state() const;
    void restore_buffer_state(const BufferState& state);

    void register_event_handlers(TerminalEventHandlers handlers);

    std::vector<SearchMatch> search(const std::string& term, bool case_sensitive = true) const;

    void dispose();

private:
    void ensure_alive(const char* operation) const;
    void unbind_surface();
    void handle_surface_resize(Dimensions dimensions);
    std::vector<std::string> all_lines() const;

    SessionId session_id_;
    std::unique_ptr<VTerminal> emulator_;
    IRenderSurface* surface_ = nullptr;
    AdapterState state_ = AdapterState::Uninitialized;
    TerminalEventHandlers handlers_;
};

const char* adapter_state_name(AdapterState state);

// Byte stream that rebuilds the given lines and cursor on a freshly reset
// screen of the same size.
std::string build_replay_stream(const std::vector<std::string>& lines, CursorPos cursor);

}
