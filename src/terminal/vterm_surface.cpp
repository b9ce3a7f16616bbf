#include "terminal/vterm_surface.h"
#include <spdlog/spdlog.h>

namespace termdock {

VTermSurface::VTermSurface(Dimensions dimensions, size_t max_scrollback)
    : terminal_(std::make_unique<VTerminal>(dimensions, max_scrollback))
    , container_(dimensions)
{
}

void VTermSurface::bind() {
    bound_ = true;
}

void VTermSurface::unbind() {
    bound_ = false;
    focused_ = false;
    data_cb_ = nullptr;
    resize_cb_ = nullptr;
}

void VTermSurface::write(const std::string& data) {
    if (disposed_) return;
    terminal_->write(data);
}

void VTermSurface::on_data(DataCallback cb) {
    data_cb_ = std::move(cb);
}

void VTermSurface::on_resize(ResizeCallback cb) {
    resize_cb_ = std::move(cb);
}

std::vector<std::string> VTermSurface::lines() const {
    return terminal_->lines();
}

CursorPos VTermSurface::cursor() const {
    return terminal_->cursor();
}

Dimensions VTermSurface::dimensions() const {
    return terminal_->dimensions();
}

void VTermSurface::resize(Dimensions dimensions) {
    terminal_->resize(dimensions);
}

void VTermSurface::reset() {
    terminal_->reset();
    scroll_offset_ = 0;
}

void VTermSurface::focus() {
    focused_ = true;
}

void VTermSurface::blur() {
    focused_ = false;
}

void VTermSurface::fit() {
    if (container_ == terminal_->dimensions()) return;
    terminal_->resize(container_);
    if (resize_cb_) {
        resize_cb_(container_);
    }
}

void VTermSurface::scroll_to_top() {
    scroll_offset_ = terminal_->scrollback_size();
}

void VTermSurface::scroll_to_bottom() {
    scroll_offset_ = 0;
}

void VTermSurface::dispose() {
    unbind();
    disposed_ = true;
}

void VTermSurface::type_text(const std::string& text) {
    emit_input(text);
}

void VTermSurface::press_key(int vterm_key) {
    terminal_->keyboard_key(vterm_key);
    emit_input(terminal_->get_output());
}

void VTermSurface::emit_input(const std::string& data) {
    if (data.empty()) return;
    if (!bound_ || !data_cb_) {
        spdlog::debug("[VTermSurface] Dropping {} bytes of input on unbound surface", data.size());
        return;
    }
    data_cb_(data);
}

}
