#pragma once

#include "core/types.hpp"
#include "render/frame_buffer.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace splash {

struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool empty() const { return width <= 0 || height <= 0; }
    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
};

// Overlay drawing primitives shared by the UI widgets.
namespace draw {

void fill(FrameBuffer& fb, const Rect& r, const Cell& cell);
void clear(FrameBuffer& fb, const Rect& r);
// `+` corners, `-` and `|` edges.
void border(FrameBuffer& fb, const Rect& r, const Color& color);
// Returns the number of cells written.
int text(FrameBuffer& fb, int x, int y, std::string_view s,
         const std::optional<Color>& color, int max_cells = -1);

size_t glyph_count(std::string_view s);
// Cuts to `max_cells` code points, marking the cut with `marker`.
std::string truncate(std::string_view s, size_t max_cells, std::string_view marker = "~");

}

}
