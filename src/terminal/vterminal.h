#pragma once

#include "core/types.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace termdock {

constexpr int TERMINAL_MAX_CHARS_PER_CELL = 6;

// Text only; attributes are not kept.
struct TerminalCell {
    uint32_t chars[TERMINAL_MAX_CHARS_PER_CELL];
    uint8_t width;
};

class VTerminalImpl;

// libvterm screen plus our own scrollback. Everything the adapter knows about
// a session's emulation state lives here.
class VTerminal {
public:
    static constexpr size_t kDefaultMaxScrollback = 10000;

    explicit VTerminal(Dimensions dimensions, size_t max_scrollback = kDefaultMaxScrollback);
    ~VTerminal();
    
    VTerminal(const VTerminal&) = delete;
    VTerminal& operator=(const VTerminal&) = delete;
    
    void resize(Dimensions dimensions);
    void write(const char* data, size_t len);
    void write(const std::string& data) { write(data.data(), data.size()); }
    
    // Hard reset: screen, modes and scrollback.
    void reset();
    
    int rows() const { return rows_; }
    int cols() const { return cols_; }
    Dimensions dimensions() const { return {cols_, rows_}; }
    
    TerminalCell get_cell(int row, int col) const;
    CursorPos cursor() const { return cursor_; }
    
    std::string row_text(int row) const;
    std::vector<std::string> scrollback_lines() const;
    std::vector<std::string> screen_lines() const;
    // Scrollback followed by the screen, up to the last row holding text or
    // the cursor, whichever is lower.
    std::vector<std::string> lines() const;
    
    std::string get_output();
    
    // Encodes a VTermKey for the current terminal mode; read it with get_output().
    void keyboard_key(int key);
    
    using TitleCallback = std::function<void(const std::string&)>;
    using BellCallback = std::function<void()>;
    void set_title_callback(TitleCallback cb) { title_cb_ = std::move(cb); }
    void set_bell_callback(BellCallback cb) { bell_cb_ = std::move(cb); }
    
    const std::string& title() const { return title_; }
    size_t scrollback_size() const { return scrollback_.size(); }
    size_t max_scrollback() const { return max_scrollback_; }

private:
    friend class VTerminalImpl;
    
    std::string cells_to_text(const std::vector<TerminalCell>& cells) const;
    
    std::unique_ptr<VTerminalImpl> impl_;
    int rows_;
    int cols_;
    size_t max_scrollback_;
    
    CursorPos cursor_;
    
    // Cells and their rendered text, kept in step.
    std::deque<std::vector<TerminalCell>> scrollback_;
    std::deque<std::string> scrollback_text_;
    
    std::string title_;
    std::string pending_title_;
    TitleCallback title_cb_;
    BellCallback bell_cb_;
};

}
