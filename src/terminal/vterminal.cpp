#include "terminal/vterminal.h"

extern "C" {
#include <vterm.h>
}

#include <algorithm>
#include <cstring>

namespace termdock {

namespace {

constexpr uint32_t kWideContinuation = 0xFFFFFFFF;

void convert_vterm_cell(const VTermScreenCell* src, TerminalCell* dst) {
    for (int i = 0; i < TERMINAL_MAX_CHARS_PER_CELL; ++i) {
        dst->chars[i] = 0;
    }
    for (int i = 0; i < TERMINAL_MAX_CHARS_PER_CELL && i < VTERM_MAX_CHARS_PER_CELL; ++i) {
        dst->chars[i] = src->chars[i];
        if (src->chars[i] == 0) break;
    }
    dst->width = static_cast<uint8_t>(src->width);
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x110000) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

}

class VTerminalImpl {
public:
    VTerm* vt = nullptr;
    VTermScreen* screen = nullptr;
    VTerminal* owner;
    
    VTerminalImpl(VTerminal* o, int rows, int cols) : owner(o) {
        vt = vterm_new(rows, cols);
        vterm_set_utf8(vt, 1);
        
        screen = vterm_obtain_screen(vt);
        
        static const VTermScreenCallbacks screen_cbs = {
            .damage = on_damage,
            .moverect = nullptr,
            .movecursor = on_movecursor,
            .settermprop = on_settermprop,
            .bell = on_bell,
            .resize = nullptr,
            .sb_pushline = on_sb_pushline,
            .sb_popline = on_sb_popline,
            .sb_clear = on_sb_clear,
        };
        
        vterm_screen_set_callbacks(screen, &screen_cbs, this);
        vterm_screen_set_damage_merge(screen, VTERM_DAMAGE_SCROLL);
        vterm_screen_enable_altscreen(screen, 1);
        vterm_screen_reset(screen, 1);
    }
    
    ~VTerminalImpl() {
        if (vt) {
            vterm_free(vt);
        }
    }
    
    static int on_damage(VTermRect rect, void* user) {
        (void)rect;
        (void)user;
        return 1;
    }
    
    static int on_movecursor(VTermPos pos, VTermPos oldpos, int visible, void* user) {
        (void)oldpos;
        (void)visible;
        auto* impl = static_cast<VTerminalImpl*>(user);
        impl->owner->cursor_ = CursorPos{pos.col, pos.row};
        return 1;
    }
    
    static int on_settermprop(VTermProp prop, VTermValue* val, void* user) {
        auto* owner = static_cast<VTerminalImpl*>(user)->owner;
        if (prop == VTERM_PROP_TITLE) {
            if (val->string.initial) {
                owner->pending_title_.clear();
            }
            owner->pending_title_.append(val->string.str, val->string.len);
            if (val->string.final) {
                owner->title_ = owner->pending_title_;
                if (owner->title_cb_) {
                    owner->title_cb_(owner->title_);
                }
            }
        }
        return 1;
    }
    
    static int on_bell(void* user) {
        auto* owner = static_cast<VTerminalImpl*>(user)->owner;
        if (owner->bell_cb_) {
            owner->bell_cb_();
        }
        return 1;
    }
    
    static int on_sb_pushline(int cols, const VTermScreenCell* cells, void* user) {
        auto* impl = static_cast<VTerminalImpl*>(user);
        auto* owner = impl->owner;
        
        std::vector<TerminalCell> line;
        line.reserve(static_cast<size_t>(cols));
        
        for (int i = 0; i < cols; ++i) {
            TerminalCell tc{};
            convert_vterm_cell(&cells[i], &tc);
            line.push_back(tc);
        }
        
        owner->scrollback_text_.push_back(owner->cells_to_text(line));
        owner->scrollback_.push_back(std::move(line));
        
        while (owner->scrollback_.size() > owner->max_scrollback_) {
            owner->scrollback_.pop_front();
            owner->scrollback_text_.pop_front();
        }
        
        return 1;
    }
    
    static int on_sb_popline(int cols, VTermScreenCell* cells, void* user) {
        auto* impl = static_cast<VTerminalImpl*>(user);
        auto* owner = impl->owner;
        
        if (owner->scrollback_.empty()) {
            return 0;
        }
        
        VTermColor default_fg;
        VTermColor default_bg;
        vterm_state_get_default_colors(vterm_obtain_state(impl->vt), &default_fg, &default_bg);
        
        const auto& line = owner->scrollback_.back();
        int copy_cols = std::min(cols, static_cast<int>(line.size()));
        
        for (int i = 0; i < copy_cols; ++i) {
            const auto& tc = line[i];
            std::memset(&cells[i], 0, sizeof(VTermScreenCell));
            
            for (int j = 0; j < VTERM_MAX_CHARS_PER_CELL && j < TERMINAL_MAX_CHARS_PER_CELL && tc.chars[j]; ++j) {
                cells[i].chars[j] = tc.chars[j];
            }
            cells[i].width = tc.width ? tc.width : 1;
            cells[i].fg = default_fg;
            cells[i].bg = default_bg;
        }
        
        for (int i = copy_cols; i < cols; ++i) {
            std::memset(&cells[i], 0, sizeof(VTermScreenCell));
            cells[i].chars[0] = ' ';
            cells[i].width = 1;
            cells[i].fg = default_fg;
            cells[i].bg = default_bg;
        }
        
        owner->scrollback_.pop_back();
        owner->scrollback_text_.pop_back();
        return 1;
    }
    
    static int on_sb_clear(void* user) {
        auto* owner = static_cast<VTerminalImpl*>(user)->owner;
        owner->scrollback_.clear();
        owner->scrollback_text_.clear();
        return 1;
    }
};

VTerminal::VTerminal(Dimensions dimensions, size_t max_scrollback)
    : rows_(dimensions.rows)
    , cols_(dimensions.cols)
    , max_scrollback_(max_scrollback)
{
    impl_ = std::make_unique<VTerminalImpl>(this, rows_, cols_);
}

VTerminal::~VTerminal() = default;

void VTerminal::resize(Dimensions dimensions) {
    if (dimensions.rows == rows_ && dimensions.cols == cols_) return;
    
    rows_ = dimensions.rows;
    cols_ = dimensions.cols;
    vterm_set_size(impl_->vt, rows_, cols_);
    vterm_screen_flush_damage(impl_->screen);
}

void VTerminal::write(const char* data, size_t len) {
    vterm_input_write(impl_->vt, data, len);
    vterm_screen_flush_damage(impl_->screen);
}

void VTerminal::reset() {
    vterm_screen_reset(impl_->screen, 1);
    scrollback_.clear();
    scrollback_text_.clear();
    cursor_ = CursorPos{};
    title_.clear();
    pending_title_.clear();
}

TerminalCell VTerminal::get_cell(int row, int col) const {
    TerminalCell result{};
    
    VTermPos pos = { .row = row, .col = col };
    VTermScreenCell cell{};
    
    if (vterm_screen_get_cell(impl_->screen, pos, &cell)) {
        convert_vterm_cell(&cell, &result);
    }
    
    return result;
}

std::string VTerminal::cells_to_text(const std::vector<TerminalCell>& cells) const {
    std::string text;
    text.reserve(cells.size());
    for (const auto& cell : cells) {
        if (cell.chars[0] == kWideContinuation) continue;
        if (cell.chars[0] == 0) {
            text += ' ';
            continue;
        }
        for (int i = 0; i < TERMINAL_MAX_CHARS_PER_CELL && cell.chars[i]; ++i) {
            append_utf8(text, cell.chars[i]);
        }
    }
    while (!text.empty() && text.back() == ' ') {
        text.pop_back();
    }
    return text;
}

std::string VTerminal::row_text(int row) const {
    std::vector<TerminalCell> cells;
    cells.reserve(static_cast<size_t>(cols_));
    for (int col = 0; col < cols_; ++col) {
        cells.push_back(get_cell(row, col));
    }
    return cells_to_text(cells);
}

std::vector<std::string> VTerminal::scrollback_lines() const {
    return std::vector<std::string>(scrollback_text_.begin(), scrollback_text_.end());
}

std::vector<std::string> VTerminal::screen_lines() const {
    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(rows_));
    for (int row = 0; row < rows_; ++row) {
        result.push_back(row_text(row));
    }
    return result;
}

std::vector<std::string> VTerminal::lines() const {
    std::vector<std::string> result = scrollback_lines();
    std::vector<std::string> screen = screen_lines();
    
    int last = std::min(cursor_.y, rows_ - 1);
    for (int row = rows_ - 1; row > last; --row) {
        if (!screen[static_cast<size_t>(row)].empty()) {
            last = row;
            break;
        }
    }
    for (int row = 0; row <= last; ++row) {
        result.push_back(std::move(screen[static_cast<size_t>(row)]));
    }
    return result;
}

std::string VTerminal::get_output() {
    std::string result;
    size_t len = vterm_output_get_buffer_current(impl_->vt);
    if (len > 0) {
        result.resize(len);
        vterm_output_read(impl_->vt, result.data(), len);
    }
    return result;
}

void VTerminal::keyboard_key(int key) {
    vterm_keyboard_key(impl_->vt, static_cast<VTermKey>(key), VTERM_MOD_NONE);
}

}
