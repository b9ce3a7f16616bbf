#pragma once

#include "core/types.h"
#include <functional>
#include <string>
#include <vector>

namespace termdock {

// A display target owned by the rendering library. The adapter holds the
// canonical emulation state; a surface only mirrors it while bound.
class IRenderSurface {
public:
    using DataCallback = std::function<void(const std::string& data)>;
    using ResizeCallback = std::function<void(Dimensions dimensions)>;

    virtual ~IRenderSurface() = default;

    virtual void bind() = 0;
    virtual void unbind() = 0;

    virtual void write(const std::string& data) = 0;

    // User input typed into the surface.
    virtual void on_data(DataCallback cb) = 0;
    // Size changes the surface initiates itself (fit, container resize).
    // Not fired for resize() calls made by the adapter.
    virtual void on_resize(ResizeCallback cb) = 0;

    virtual std::vector<std::string> lines() const = 0;
    virtual CursorPos cursor() const = 0;
    virtual Dimensions dimensions() const = 0;

    virtual void resize(Dimensions dimensions) = 0;
    virtual void reset() = 0;

    virtual void focus() = 0;
    virtual void blur() = 0;
    virtual void fit() = 0;
    virtual void scroll_to_top() = 0;
    virtual void scroll_to_bottom() = 0;

    virtual void dispose() = 0;
};

}
