#include "ui/draw.hpp"
#include "core/utf8.hpp"
#include <vector>

namespace splash {
namespace draw {

void fill(FrameBuffer& fb, const Rect& r, const Cell& cell) {
    for (int y = r.y; y < r.y + r.height; ++y) {
        for (int x = r.x; x < r.x + r.width; ++x) {
            fb.set_overlay(x, y, cell);
        }
    }
}

void clear(FrameBuffer& fb, const Rect& r) {
    for (int y = r.y; y < r.y + r.height; ++y) {
        for (int x = r.x; x < r.x + r.width; ++x) {
            fb.clear_overlay_cell(x, y);
        }
    }
}

void border(FrameBuffer& fb, const Rect& r, const Color& color) {
    if (r.empty()) return;
    const int right = r.x + r.width - 1;
    const int bottom = r.y + r.height - 1;

    for (int x = r.x + 1; x < right; ++x) {
        fb.set_overlay(x, r.y, Cell('-', color));
        fb.set_overlay(x, bottom, Cell('-', color));
    }
    for (int y = r.y + 1; y < bottom; ++y) {
        fb.set_overlay(r.x, y, Cell('|', color));
        fb.set_overlay(right, y, Cell('|', color));
    }
    fb.set_overlay(r.x, r.y, Cell('+', color));
    fb.set_overlay(right, r.y, Cell('+', color));
    fb.set_overlay(r.x, bottom, Cell('+', color));
    fb.set_overlay(right, bottom, Cell('+', color));
}

int text(FrameBuffer& fb, int x, int y, std::string_view s,
         const std::optional<Color>& color, int max_cells) {
    const std::vector<uint32_t> glyphs = decode_utf8(s);
    int written = 0;
    for (uint32_t cp : glyphs) {
        if (max_cells >= 0 && written >= max_cells) break;
        fb.set_overlay(x + written, y, Cell(cp, color));
        ++written;
    }
    return written;
}

size_t glyph_count(std::string_view s) {
    return decode_utf8(s).size();
}

std::string truncate(std::string_view s, size_t max_cells, std::string_view marker) {
    const std::vector<uint32_t> glyphs = decode_utf8(s);
    if (glyphs.size() <= max_cells) return std::string(s);

    const size_t marker_len = glyph_count(marker);
    std::string out;
    if (max_cells <= marker_len) {
        for (size_t i = 0; i < max_cells; ++i) append_utf8(out, glyphs[i]);
        return out;
    }
    for (size_t i = 0; i < max_cells - marker_len; ++i) append_utf8(out, glyphs[i]);
    out.append(marker.data(), marker.size());
    return out;
}

}
}
