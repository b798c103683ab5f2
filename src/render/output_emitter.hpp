#pragma once

#include "core/types.hpp"
#include "render/frame_buffer.hpp"
#include "terminal/terminal.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace splash {

// Serializes a frame diff into one terminal write and owns the terminal
// session (modes, resize, restore) plus the FrameBuffer sized to it.
//
// Every glyph is framed as cursor move, color, glyph, SGR reset. The reset
// after each glyph and the single write per frame keep a half-written
// color sequence from ever reaching the terminal between frames.
class OutputEmitter {
public:
    OutputEmitter(Terminal& term, ColorMode color_mode = ColorMode::Truecolor);

    // Returns false when raw input mode could not be enabled (stdin is not a tty).
    bool initialize(bool mouse_enabled);
    size_t emit(const ChangeList& changes);
    void handle_resize(int width, int height);
    bool poll_resize();
    bool cleanup() noexcept;

    FrameBuffer& buffer() { return buffer_; }
    const FrameBuffer& buffer() const { return buffer_; }
    Size size() const { return size_; }
    bool mouse_enabled() const { return mouse_enabled_; }
    bool initialized() const { return initialized_; }
    bool resize_watched() const { return resize_watched_; }

    void set_color_mode(ColorMode mode) { color_mode_ = mode; }
    ColorMode color_mode() const { return color_mode_; }

private:
    void append_cursor_move(int row, int col);
    void append_color(const std::optional<Color>& color);
    void append_string(const std::string& s);

    Terminal& term_;
    ColorMode color_mode_;
    FrameBuffer buffer_;
    Size size_;
    std::string out_buffer_;
    bool mouse_enabled_ = false;
    bool initialized_ = false;
    bool resize_watched_ = false;
};

}
