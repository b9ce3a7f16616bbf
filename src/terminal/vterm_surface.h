#pragma once

#include "terminal/render_surface.h"
#include "terminal/vterminal.h"
#include <memory>

namespace termdock {

// Headless surface backed by its own libvterm screen. Used where no GUI
// is present and as the reference surface in tests.
class VTermSurface : public IRenderSurface {
public:
    explicit VTermSurface(Dimensions dimensions = {}, size_t max_scrollback = VTerminal::kDefaultMaxScrollback);

    void bind() override;
    void unbind() override;
    void write(const std::string& data) override;
    void on_data(DataCallback cb) override;
    void on_resize(ResizeCallback cb) override;
    std::vector<std::string> lines() const override;
    CursorPos cursor() const override;
    Dimensions dimensions() const override;
    void resize(Dimensions dimensions) override;
    void reset() override;
    void focus() override;
    void blur() override;
    void fit() override;
    void scroll_to_top() override;
    void scroll_to_bottom() override;
    void dispose() override;

    // Simulated user input.
    void type_text(const std::string& text);
    void press_key(int vterm_key);

    // Size fit() adopts, as a container layout would report it.
    void set_container_size(Dimensions dimensions) { container_ = dimensions; }

    bool is_bound() const { return bound_; }
    bool is_focused() const { return focused_; }
    bool is_disposed() const { return disposed_; }
    // Lines scrolled up from the bottom; 0 follows live output.
    size_t scroll_offset() const { return scroll_offset_; }
    const VTerminal& terminal() const { return *terminal_; }

private:
    void emit_input(const std::string& data);

    std::unique_ptr<VTerminal> terminal_;
    Dimensions container_;
    DataCallback data_cb_;
    ResizeCallback resize_cb_;
    bool bound_ = false;
    bool focused_ = false;
    bool disposed_ = false;
    size_t scroll_offset_ = 0;
};

}
