#pragma once

#include "render/frame_buffer.hpp"
#include "ui/draw.hpp"

namespace splash {

// Centered key reference, toggled with '?'.
class HelpOverlay {
public:
    static constexpr int MAX_WIDTH = 62;
    static constexpr int MAX_HEIGHT = 22;

    void toggle();
    void show();
    void hide();
    bool visible() const { return visible_; }
    void invalidate() { drawn_ = Rect{}; dirty_ = true; }

    // Redraws only after a toggle or a size change. Returns true if it touched the buffer.
    bool render(FrameBuffer& fb);

    static Rect layout(Size screen);

private:
    void draw(FrameBuffer& fb, const Rect& r);

    bool visible_ = false;
    bool dirty_ = false;
    Rect drawn_;
    Size drawn_size_;
};

}
