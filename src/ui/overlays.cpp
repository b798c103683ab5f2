#include "ui/overlays.hpp"

namespace splash {

void Overlays::draw(FrameBuffer& fb, double now_ms, const StatusBarState& state,
                    const PerformanceTelemetry& telemetry, const Pattern& pattern) {
    toasts.update(now_ms);
    const bool toasts_changed = toasts.count() != last_toast_count_;
    last_toast_count_ = toasts.count();

    status.update(state);

    // Toasts clear their stale cells first; help and the debug panel repaint over any hole.
    toasts.render(fb);
    if (toasts_changed) {
        if (help.visible()) help.invalidate();
        refresh_debug();
    }
    if (help.render(fb)) {
        toasts.render(fb);
        refresh_debug();
    }
    status.render(fb);
    if (debug.update(fb, now_ms, telemetry, pattern) && !debug.visible()) {
        // The cleared panel may have covered parts of the other widgets.
        if (help.visible()) help.invalidate();
        help.render(fb);
        toasts.render(fb);
    }
}

void Overlays::invalidate() {
    status.invalidate();
    toasts.invalidate();
    help.invalidate();
    debug.invalidate();
}

void Overlays::refresh_debug() {
    // A hidden panel may still owe a clear of its old cells.
    if (debug.visible()) debug.invalidate();
}

}
