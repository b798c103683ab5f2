#include "ui/status_bar.hpp"
#include "ui/draw.hpp"
#include "core/utf8.hpp"
#include <vector>

namespace splash {

namespace {
    const Color kBackground{20, 25, 35};
    const Color kSeparator{60, 70, 90};
    const Color kPatternColor{100, 180, 255};
    const Color kThemeColor{180, 140, 255};
    const Color kFpsGood{100, 220, 120};
    const Color kFpsWarn{255, 200, 100};
    const Color kFpsBad{255, 100, 100};
    const Color kHintColor{120, 130, 150};
    const Color kPausedColor{255, 150, 100};

    struct Segment {
        std::string text;
        Color color;
    };
}

void StatusBar::update(const StatusBarState& state) {
    if (state == state_) return;
    state_ = state;
    dirty_ = true;
}

void StatusBar::set_visible(bool visible) {
    if (visible == visible_) return;
    visible_ = visible;
    dirty_ = true;
}

Color StatusBar::fps_color(int fps) {
    if (fps >= 25) return kFpsGood;
    if (fps >= 15) return kFpsWarn;
    return kFpsBad;
}

bool StatusBar::render(FrameBuffer& fb) {
    if (!dirty_ && fb.size() == drawn_size_) return false;

    // A resize has already dropped every overlay, so a stale row only needs
    // clearing when the size is unchanged.
    const bool same_size = fb.size() == drawn_size_;
    drawn_size_ = fb.size();
    dirty_ = false;

    if (!visible_ || fb.empty()) {
        if (drawn_row_ >= 0 && same_size) fb.clear_overlay_row(drawn_row_);
        drawn_row_ = -1;
        return true;
    }

    drawn_row_ = fb.height() - 1;
    draw(fb, drawn_row_);
    return true;
}

void StatusBar::draw(FrameBuffer& fb, int y) {
    const int width = fb.width();
    std::vector<Cell> row(static_cast<size_t>(width), Cell(' ', kBackground));
    auto put = [&](int x, uint32_t ch, const Color& color) {
        if (x >= 0 && x < width) row[static_cast<size_t>(x)] = Cell(ch, color);
    };
    auto put_text = [&](int x, const std::string& text, const Color& color, int max_cells) {
        int n = 0;
        for (uint32_t cp : decode_utf8(text)) {
            if (n >= max_cells) break;
            put(x + n++, cp, color);
        }
        return n;
    };

    std::vector<Segment> segments;
    if (state_.paused) segments.push_back({"PAUSED", kPausedColor});

    std::string pattern = draw::truncate(state_.pattern, 12);
    if (state_.preset > 0) pattern += "." + std::to_string(state_.preset);
    segments.push_back({pattern, kPatternColor});
    segments.push_back({draw::truncate(state_.theme, 10), kThemeColor});
    segments.push_back({std::to_string(state_.fps) + "fps", fps_color(state_.fps)});

    const int limit = width - RIGHT_MARGIN;
    int x = 1;
    for (size_t i = 0; i < segments.size() && x < limit; ++i) {
        if (i > 0) {
            put(x, '|', kSeparator);
            x += 2;
        }
        if (x >= limit) break;
        x += put_text(x, segments[i].text, segments[i].color, limit - x);
        ++x;
    }

    const int hint_len = static_cast<int>(sizeof(HINT) - 1);
    const int hint_x = width - hint_len - 2;
    if (hint_x > x + 2) {
        put_text(hint_x, HINT, kHintColor, hint_len);
    }

    // Cells equal to what is already there are no-ops in the overlay layer.
    for (int cx = 0; cx < width; ++cx) {
        fb.set_overlay(cx, y, row[static_cast<size_t>(cx)]);
    }
}

}
