#pragma once

#include "core/types.hpp"
#include "render/frame_buffer.hpp"
#include <string>

namespace splash {

struct StatusBarState {
    std::string pattern;
    int preset = 0;         // 0 when the pattern runs its default settings
    std::string theme;
    int fps = 0;
    bool paused = false;

    bool operator==(const StatusBarState& o) const {
        return pattern == o.pattern && preset == o.preset && theme == o.theme &&
               fps == o.fps && paused == o.paused;
    }
    bool operator!=(const StatusBarState& o) const { return !(*this == o); }
};

// One-line status on the bottom row, drawn through the overlay layer and only
// redrawn when its state or the buffer size changes.
class StatusBar {
public:
    static constexpr char HINT[] = "? Help";
    // Segments stop this many cells before the right edge to leave room for the hint.
    static constexpr int RIGHT_MARGIN = 10;

    void update(const StatusBarState& state);
    const StatusBarState& state() const { return state_; }

    void set_visible(bool visible);
    bool visible() const { return visible_; }
    void invalidate() { dirty_ = true; }

    // Returns true if the row was (re)drawn or cleared.
    bool render(FrameBuffer& fb);

    static Color fps_color(int fps);

private:
    void draw(FrameBuffer& fb, int y);

    StatusBarState state_;
    bool visible_ = true;
    bool dirty_ = true;
    Size drawn_size_;
    int drawn_row_ = -1;
};

}
