#include "terminal/terminal_adapter.h"
#include "core/errors.h"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace termdock {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool valid_dimensions(Dimensions d) {
    return d.cols > 0 && d.rows > 0;
}

}

const char* adapter_state_name(AdapterState state) {
    switch (state) {
        case AdapterState::Uninitialized: return "Uninitialized";
        case AdapterState::Attached:      return "Attached";
        case AdapterState::Detached:      return "Detached";
        case AdapterState::Disposed:      return "Disposed";
    }
    return "Unknown";
}

std::string build_replay_stream(const std::vector<std::string>& lines, CursorPos cursor) {
    std::string stream;
    stream.reserve(static_cast<size_t>(joined_size(lines)) + lines.size() + 16);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) stream += "\r\n";
        stream += lines[i];
    }
    stream += "\x1b[" + std::to_string(cursor.y + 1) + ";" + std::to_string(cursor.x + 1) + "H";
    return stream;
}

TerminalAdapter::TerminalAdapter(SessionId session_id, AdapterConfig config)
    : session_id_(std::move(session_id))
    , emulator_(std::make_unique<VTerminal>(config.dimensions, config.scrollback))
{
    spdlog::debug("[TerminalAdapter] Created {} ({}x{}, scrollback {})",
                  session_id_, config.dimensions.cols, config.dimensions.rows, config.scrollback);
}

TerminalAdapter::~TerminalAdapter() {
    unbind_surface();
}

void TerminalAdapter::ensure_alive(const char* operation) const {
    if (state_ == AdapterState::Disposed) {
        throw DisposedError(session_id_, operation);
    }
}

void TerminalAdapter::attach(IRenderSurface& surface) {
    ensure_alive("attach");

    if (surface_ == &surface && state_ == AdapterState::Attached) {
        spdlog::debug("[TerminalAdapter] {} already attached to this surface", session_id_);
        return;
    }
    if (surface_) {
        spdlog::info("[TerminalAdapter] {} displacing previously bound surface", session_id_);
        unbind_surface();
    }

    surface_ = &surface;
    surface.bind();
    surface.reset();
    surface.resize(emulator_->dimensions());
    surface.write(build_replay_stream(all_lines(), emulator_->cursor()));

    surface.on_data([this](const std::string& data) {
        if (handlers_.on_data) {
            handlers_.on_data(data);
        }
    });
    surface.on_resize([this](Dimensions dimensions) {
        handle_surface_resize(dimensions);
    });

    state_ = AdapterState::Attached;
    spdlog::info("[TerminalAdapter] {} attached ({} scrollback lines replayed)",
                 session_id_, emulator_->scrollback_size());
}

void TerminalAdapter::detach() {
    ensure_alive("detach");
    if (state_ != AdapterState::Attached) {
        spdlog::debug("[TerminalAdapter] {} detach ignored in state {}", session_id_, adapter_state_name(state_));
        return;
    }
    unbind_surface();
    state_ = AdapterState::Detached;
    spdlog::info("[TerminalAdapter] {} detached (instance preserved)", session_id_);
}

void TerminalAdapter::unbind_surface() {
    if (!surface_) return;
    surface_->on_data(nullptr);
    surface_->on_resize(nullptr);
    surface_->unbind();
    surface_ = nullptr;
}

void TerminalAdapter::write(const std::string& data) {
    ensure_alive("write to");
    emulator_->write(data);
    if (surface_) {
        surface_->write(data);
    }
}

void TerminalAdapter::writeln(const std::string& data) {
    write(data + "\r\n");
}

void TerminalAdapter::resize(Dimensions dimensions) {
    ensure_alive("resize");
    if (!valid_dimensions(dimensions)) {
        spdlog::warn("[TerminalAdapter] {} ignoring invalid size {}x{}",
                     session_id_, dimensions.cols, dimensions.rows);
        return;
    }
    emulator_->resize(dimensions);
    if (surface_) {
        surface_->resize(dimensions);
    }
    spdlog::debug("[TerminalAdapter] {} resized to {}x{}", session_id_, dimensions.cols, dimensions.rows);
}

void TerminalAdapter::handle_surface_resize(Dimensions dimensions) {
    if (state_ == AdapterState::Disposed || !valid_dimensions(dimensions)) return;
    emulator_->resize(dimensions);
    if (handlers_.on_resize) {
        handlers_.on_resize(dimensions);
    }
}

void TerminalAdapter::clear() {
    write("\x1b[H\x1b[2J\x1b[3J");
}

void TerminalAdapter::reset() {
    ensure_alive("reset");
    emulator_->reset();
    if (surface_) {
        surface_->reset();
    }
}

void TerminalAdapter::focus() {
    ensure_alive("focus");
    if (!surface_) {
        spdlog::debug("[TerminalAdapter] {} focus ignored: no surface bound", session_id_);
        return;
    }
    surface_->focus();
}

void TerminalAdapter::blur() {
    ensure_alive("blur");
    if (!surface_) {
        spdlog::debug("[TerminalAdapter] {} blur ignored: no surface bound", session_id_);
        return;
    }
    surface_->blur();
}

void TerminalAdapter::fit() {
    ensure_alive("fit");
    if (!surface_) {
        spdlog::debug("[TerminalAdapter] {} fit ignored: no surface bound", session_id_);
        return;
    }
    surface_->fit();
}

void TerminalAdapter::scroll_to_top() {
    ensure_alive("scroll");
    if (!surface_) {
        spdlog::debug("[TerminalAdapter] {} scroll ignored: no surface bound", session_id_);
        return;
    }
    surface_->scroll_to_top();
}

void TerminalAdapter::scroll_to_bottom() {
    ensure_alive("scroll");
    if (!surface_) {
        spdlog::debug("[TerminalAdapter] {} scroll ignored: no surface bound", session_id_);
        return;
    }
    surface_->scroll_to_bottom();
}

Dimensions TerminalAdapter::dimensions() const {
    ensure_alive("query");
    return emulator_->dimensions();
}

CursorPos TerminalAdapter::cursor() const {
    ensure_alive("query");
    return emulator_->cursor();
}

std::string TerminalAdapter::title() const {
    ensure_alive("query");
    return emulator_->title();
}

std::vector<std::string> TerminalAdapter::all_lines() const {
    std::vector<std::string> lines = emulator_->scrollback_lines();
    std::vector<std::string> screen = emulator_->screen_lines();
    lines.insert(lines.end(), std::make_move_iterator(screen.begin()), std::make_move_iterator(screen.end()));
    return lines;
}

BufferState TerminalAdapter::capture_buffer_state() const {
    ensure_alive("get buffer state from");
    BufferState state = make_buffer_state(session_id_, all_lines(), emulator_->cursor(), emulator_->dimensions());
    spdlog::debug("[TerminalAdapter] {} captured {} lines, cursor {},{}",
                  session_id_, state.scrollback.size(), state.cursor.x, state.cursor.y);
    return state;
}

void TerminalAdapter::restore_buffer_state(const BufferState& state) {
    ensure_alive("restore buffer state to");

    Dimensions dimensions = valid_dimensions(state.dimensions) ? state.dimensions : emulator_->dimensions();
    std::string stream = build_replay_stream(state.scrollback, state.cursor);

    emulator_->reset();
    emulator_->resize(dimensions);
    emulator_->write(stream);

    if (surface_) {
        surface_->reset();
        surface_->resize(dimensions);
        surface_->write(stream);
    }
    spdlog::info("[TerminalAdapter] {} restored {} lines", session_id_, state.scrollback.size());
}

void TerminalAdapter::register_event_handlers(TerminalEventHandlers handlers) {
    ensure_alive("register handlers on");
    handlers_ = std::move(handlers);

    emulator_->set_title_callback([this](const std::string& title) {
        if (handlers_.on_title_change) {
            handlers_.on_title_change(title);
        }
    });
    emulator_->set_bell_callback([this]() {
        if (handlers_.on_bell) {
            handlers_.on_bell();
        }
    });
}

std::vector<SearchMatch> TerminalAdapter::search(const std::string& term, bool case_sensitive) const {
    ensure_alive("search in");
    std::vector<SearchMatch> matches;
    if (term.empty()) return matches;

    std::string needle = case_sensitive ? term : to_lower(term);
    std::vector<std::string> lines = all_lines();
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string hay = case_sensitive ? lines[i] : to_lower(lines[i]);
        size_t pos = hay.find(needle);
        while (pos != std::string::npos) {
            matches.push_back({i, pos});
            pos = hay.find(needle, pos + 1);
        }
    }
    return matches;
}

void TerminalAdapter::dispose() {
    if (state_ == AdapterState::Disposed) {
        spdlog::warn("[TerminalAdapter] {} already disposed", session_id_);
        return;
    }
    unbind_surface();
    handlers_ = {};
    emulator_.reset();
    state_ = AdapterState::Disposed;
    spdlog::info("[TerminalAdapter] {} disposed", session_id_);
}

}
