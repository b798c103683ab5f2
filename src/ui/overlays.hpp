#pragma once

#include "engine/telemetry.hpp"
#include "patterns/pattern.hpp"
#include "render/frame_buffer.hpp"
#include "ui/debug_overlay.hpp"
#include "ui/help_overlay.hpp"
#include "ui/status_bar.hpp"
#include "ui/toast_manager.hpp"

namespace splash {

// The on-screen widgets and the order they are composited in: toasts, help,
// status bar, debug panel. A widget that clears cells shared with another
// makes the other one redraw in the same frame.
struct Overlays {
    StatusBar status;
    ToastManager toasts;
    HelpOverlay help;
    DebugOverlay debug;

    explicit Overlays(double toast_duration_ms = ToastManager::DEFAULT_DURATION_MS)
        : toasts(toast_duration_ms) {}

    void draw(FrameBuffer& fb, double now_ms, const StatusBarState& state,
              const PerformanceTelemetry& telemetry, const Pattern& pattern);

    // After a resize dropped every overlay cell.
    void invalidate();

private:
    void refresh_debug();

    size_t last_toast_count_ = 0;
};

}
