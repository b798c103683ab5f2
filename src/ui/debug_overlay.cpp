#include "ui/debug_overlay.hpp"
#include "core/utf8.hpp"
#include <algorithm>
#include <cstdio>

namespace splash {

namespace {
    const Color kBackground{15, 15, 20};
    const Color kBorder{90, 90, 110};
    const Color kTitle{255, 200, 100};
    const Color kText{170, 200, 170};

    std::string fmt(const char* format, double a, double b = 0.0) {
        char buf[64];
        snprintf(buf, sizeof(buf), format, a, b);
        return buf;
    }
}

void DebugOverlay::toggle() {
    set_visible(!visible_);
}

void DebugOverlay::set_visible(bool visible) {
    if (visible == visible_) return;
    visible_ = visible;
    hide_pending_ = !visible;
    last_update_.reset();
}

std::vector<std::string> DebugOverlay::format(const PerformanceTelemetry& telemetry,
                                              const Pattern& pattern) {
    const FrameMetrics m = telemetry.metrics();
    const FrameStats s = telemetry.stats();

    std::vector<std::string> out;
    out.push_back("DEBUG " + pattern.name());
    out.push_back(fmt("FPS    %.1f / %.0f", m.fps, m.target_fps));
    out.push_back(fmt("Range  %.1f - %.1f", s.min_fps, s.max_fps));
    out.push_back(fmt("P5/P95 %.1f / %.1f", telemetry.percentile(5), telemetry.percentile(95)));
    out.push_back(fmt("Frame  %.2f ms", m.frame_time));
    out.push_back(fmt("Update %.2f ms", m.update_time));
    out.push_back(fmt("Render %.2f ms", m.render_time));
    out.push_back(fmt("Cells  %.0f", static_cast<double>(m.changed_cells)));
    out.push_back(fmt("Drops  %.0f (total %.0f)", static_cast<double>(m.frame_drops),
                      static_cast<double>(s.total_dropped_frames)));

    const PatternMetrics pm = pattern.metrics();
    size_t shown = 0;
    for (const auto& [key, value] : pm) {
        if (shown++ >= MAX_PATTERN_METRICS) break;
        char buf[64];
        snprintf(buf, sizeof(buf), "%-12.12s %g", key.c_str(), value);
        out.push_back(buf);
    }
    return out;
}

bool DebugOverlay::update(FrameBuffer& fb, double now_ms, const PerformanceTelemetry& telemetry,
                          const Pattern& pattern) {
    if (!visible_) {
        if (!hide_pending_) return false;
        hide_pending_ = false;
        draw::clear(fb, drawn_);
        drawn_ = Rect{};
        return true;
    }

    const double interval = 1000.0 / UPDATES_PER_SECOND;
    if (last_update_ && now_ms - *last_update_ < interval) return false;
    last_update_ = now_ms;

    lines_ = format(telemetry, pattern);
    draw(fb);
    return true;
}

void DebugOverlay::draw(FrameBuffer& fb) {
    Rect r{0, 0, std::min(PANEL_WIDTH, fb.width()), static_cast<int>(lines_.size()) + 2};
    r.height = std::min(r.height, std::max(0, fb.height() - 1));

    // Rows the panel no longer covers.
    for (int y = r.y + r.height; y < drawn_.y + drawn_.height; ++y) {
        for (int x = drawn_.x; x < drawn_.x + drawn_.width; ++x) fb.clear_overlay_cell(x, y);
    }
    drawn_ = r;
    if (r.width < 3 || r.height < 3) return;

    for (int row = 0; row < r.height; ++row) {
        const bool edge_row = row == 0 || row == r.height - 1;
        std::vector<uint32_t> glyphs;
        if (!edge_row && static_cast<size_t>(row - 1) < lines_.size()) {
            glyphs = decode_utf8(lines_[static_cast<size_t>(row - 1)]);
        }
        for (int col = 0; col < r.width; ++col) {
            const bool edge_col = col == 0 || col == r.width - 1;
            Cell cell(' ', kBackground);
            if (edge_row && edge_col) {
                cell = Cell('+', kBorder);
            } else if (edge_row) {
                cell = Cell('-', kBorder);
            } else if (edge_col) {
                cell = Cell('|', kBorder);
            } else if (col >= 2 && static_cast<size_t>(col - 2) < glyphs.size()) {
                cell = Cell(glyphs[static_cast<size_t>(col - 2)], row == 1 ? kTitle : kText);
            }
            fb.set_overlay(r.x + col, r.y + row, cell);
        }
    }
}

}
