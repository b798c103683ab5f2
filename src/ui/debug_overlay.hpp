#pragma once

#include "engine/telemetry.hpp"
#include "patterns/pattern.hpp"
#include "render/frame_buffer.hpp"
#include "ui/draw.hpp"
#include <optional>
#include <string>
#include <vector>

namespace splash {

// Telemetry panel in the top-left corner. Content is rebuilt at most
// UPDATES_PER_SECOND times a second; cells that did not change are not
// rewritten, so a steady panel costs nothing in the diff.
class DebugOverlay {
public:
    static constexpr double UPDATES_PER_SECOND = 4.0;
    static constexpr int PANEL_WIDTH = 32;
    static constexpr size_t MAX_PATTERN_METRICS = 6;

    void toggle();
    void set_visible(bool visible);
    bool visible() const { return visible_; }
    void invalidate() { drawn_ = Rect{}; last_update_.reset(); }

    // Returns true if the panel was redrawn or cleared.
    bool update(FrameBuffer& fb, double now_ms, const PerformanceTelemetry& telemetry,
                const Pattern& pattern);

    const std::vector<std::string>& lines() const { return lines_; }

    static std::vector<std::string> format(const PerformanceTelemetry& telemetry,
                                           const Pattern& pattern);

private:
    void draw(FrameBuffer& fb);

    bool visible_ = false;
    bool hide_pending_ = false;
    std::optional<double> last_update_;
    std::vector<std::string> lines_;
    Rect drawn_;
};

}
