#include <cassert>
#include <iostream>
#include <map>
#include <string>
#include <utility>

#include "test_harness.hpp"
#include "../src/engine/telemetry.hpp"
#include "../src/patterns/theme.hpp"
#include "../src/patterns/waves.hpp"
#include "../src/render/frame_buffer.hpp"
#include "../src/ui/debug_overlay.hpp"
#include "../src/ui/draw.hpp"
#include "../src/ui/help_overlay.hpp"
#include "../src/ui/overlays.hpp"
#include "../src/ui/status_bar.hpp"
#include "../src/ui/toast_manager.hpp"

using namespace splash;

int failures = 0;

namespace {

using Screen = std::map<std::pair<int, int>, Cell>;

// Applies a diff to a model of the terminal.
void apply(Screen& screen, FrameBuffer& fb) {
    for (const ChangeRecord& c : fb.get_changes()) screen[{c.x, c.y}] = c.cell;
    fb.swap();
}

uint32_t glyph_at(const Screen& screen, int x, int y) {
    auto it = screen.find({x, y});
    return it == screen.end() ? ' ' : it->second.ch;
}

std::string row_text(const Screen& screen, int y, int x0, int len) {
    std::string out;
    for (int x = x0; x < x0 + len; ++x) out.push_back(static_cast<char>(glyph_at(screen, x, y)));
    return out;
}

}

TEST(truncate_marks_cut) {
    assert(draw::truncate("starfield", 5) == "star~");
    assert(draw::truncate("waves", 5) == "waves");
    assert(draw::truncate("abcdef", 2, "...") == "ab");
    assert(draw::truncate("abcdefgh", 6, "...") == "abc...");
    assert(draw::glyph_count("a\xE2\x89\x88") == 2);
}

TEST(draw_text_clips) {
    FrameBuffer fb(5, 1);
    assert(draw::text(fb, 3, 0, "hello", std::nullopt) == 5);
    assert(fb.overlay_count() == 2);
    assert(draw::text(fb, 0, 0, "hello", std::nullopt, 2) == 2);
}

TEST(toasts_keep_newest_three) {
    ToastManager toasts;
    toasts.info("one");
    toasts.info("two");
    toasts.info("three");
    const int fourth = toasts.warning("four");

    assert(toasts.count() == ToastManager::MAX_TOASTS);
    assert(toasts.toasts().front().message == "two");
    assert(toasts.toasts().back().id == fourth);
    assert(toasts.toasts().back().type == ToastType::Warning);

    toasts.dismiss(fourth);
    assert(toasts.count() == 2);
    toasts.clear();
    assert(!toasts.has_toasts());
}

TEST(toasts_expire) {
    ToastManager toasts(1000);
    toasts.show("short", ToastType::Info, 500.0);
    toasts.success("default");

    toasts.update(10000);
    toasts.update(10499);
    assert(toasts.count() == 2);
    toasts.update(10500);
    assert(toasts.count() == 1);
    assert(toasts.toasts().front().message == "default");
    toasts.update(11000);
    assert(!toasts.has_toasts());
}

TEST(toast_layout_and_removal) {
    FrameBuffer fb(80, 24);
    Screen screen;
    ToastManager toasts;
    toasts.error("Something broke");
    toasts.update(0);

    toasts.render(fb);
    apply(screen, fb);

    assert(glyph_at(screen, 38, 2) == '+');
    assert(glyph_at(screen, 77, 2) == '+');
    assert(glyph_at(screen, 38, 3) == '|');
    assert(row_text(screen, 3, 40, 15) == "Something broke");
    // Full countdown bar.
    assert(glyph_at(screen, 39, 4) == '=');
    assert(glyph_at(screen, 76, 4) == '=');

    // Nothing changed, nothing to send.
    toasts.render(fb);
    assert(fb.get_changes().empty());

    toasts.clear();
    toasts.render(fb);
    apply(screen, fb);
    assert(fb.overlay_count() == 0);
    assert(glyph_at(screen, 38, 2) == ' ');
}

TEST(toasts_stack_down) {
    FrameBuffer fb(80, 24);
    Screen screen;
    ToastManager toasts;
    toasts.info("a");
    toasts.info("b");
    toasts.render(fb);
    apply(screen, fb);
    assert(glyph_at(screen, 40, 3) == 'a');
    assert(glyph_at(screen, 40, 7) == 'b');
}

TEST(toasts_skip_tiny_screens) {
    FrameBuffer narrow(8, 24);
    ToastManager toasts;
    toasts.info("hidden");
    toasts.render(narrow);
    assert(narrow.overlay_count() == 0);

    FrameBuffer short_fb(80, 5);
    toasts.render(short_fb);
    assert(short_fb.overlay_count() == 0);
}

TEST(status_bar_layout) {
    FrameBuffer fb(80, 24);
    Screen screen;
    StatusBar status;
    status.update({"waves", 0, "ocean", 30, false});

    assert(status.render(fb));
    apply(screen, fb);
    assert(row_text(screen, 23, 1, 5) == "waves");
    assert(glyph_at(screen, 7, 23) == '|');
    assert(row_text(screen, 9, 23, 5) == "ocean");
    assert(row_text(screen, 17, 23, 5) == "30fps");
    assert(row_text(screen, 72, 23, 6) == "? Help");
    assert(fb.overlay_count() == 80);

    assert(!status.render(fb));
    assert(fb.get_changes().empty());
}

TEST(status_bar_paused_and_preset) {
    FrameBuffer fb(80, 24);
    Screen screen;
    StatusBar status;
    status.update({"starfield", 2, "fire", 12, true});
    status.render(fb);
    apply(screen, fb);

    assert(row_text(screen, 23, 1, 6) == "PAUSED");
    assert(row_text(screen, 23, 10, 11) == "starfield.2");
    assert((screen[{10, 23}].color == Color(100, 180, 255)));
}

TEST(status_bar_fps_colors) {
    assert(StatusBar::fps_color(30) == Color(100, 220, 120));
    assert(StatusBar::fps_color(25) == Color(100, 220, 120));
    assert(StatusBar::fps_color(24) == Color(255, 200, 100));
    assert(StatusBar::fps_color(15) == Color(255, 200, 100));
    assert(StatusBar::fps_color(14) == Color(255, 100, 100));
}

TEST(status_bar_hide_clears_row) {
    FrameBuffer fb(40, 10);
    StatusBar status;
    status.update({"plasma", 0, "matrix", 60, false});
    status.render(fb);
    fb.get_changes();

    status.set_visible(false);
    assert(status.render(fb));
    assert(fb.overlay_count() == 0);
    assert(fb.get_changes().size() == 40);
}

TEST(status_bar_redraws_after_resize) {
    FrameBuffer fb(40, 10);
    StatusBar status;
    status.update({"plasma", 0, "matrix", 60, false});
    status.render(fb);

    fb.resize(50, 12);
    assert(status.render(fb));
    assert(fb.has_overlay(0, 11));
    assert(!fb.has_overlay(0, 9));
}

TEST(help_layout) {
    const Rect r = HelpOverlay::layout({80, 24});
    assert(r == (Rect{9, 2, 62, 20}));
    assert(HelpOverlay::layout({100, 40}) == (Rect{19, 9, 62, 22}));
    assert(HelpOverlay::layout({20, 24}).empty());
    assert(HelpOverlay::layout({80, 8}).empty());
}

TEST(help_toggle) {
    FrameBuffer fb(80, 24);
    Screen screen;
    HelpOverlay help;

    help.render(fb);
    assert(fb.overlay_count() == 0);
    help.toggle();
    assert(help.visible());
    assert(help.render(fb));
    apply(screen, fb);
    assert(glyph_at(screen, 9, 2) == '+');
    assert(row_text(screen, 2, 31, 18) == "ascii-splash Help ");
    assert(row_text(screen, 9, 13, 5) == "[ / ]");
    assert(!help.render(fb));

    help.hide();
    assert(help.render(fb));
    apply(screen, fb);
    assert(fb.overlay_count() == 0);
    assert(glyph_at(screen, 9, 2) == ' ');
}

TEST(debug_overlay_throttled) {
    FrameBuffer fb(80, 24);
    PerformanceTelemetry telemetry(30);
    WavePattern pattern(themes().front());
    DebugOverlay debug;

    assert(!debug.update(fb, 0, telemetry, pattern));
    debug.toggle();
    assert(debug.update(fb, 0, telemetry, pattern));
    assert(debug.lines().front() == "DEBUG waves");
    assert(fb.has_overlay(0, 0));

    assert(!debug.update(fb, 100, telemetry, pattern));
    assert(!debug.update(fb, 249, telemetry, pattern));
    assert(debug.update(fb, 250, telemetry, pattern));

    debug.toggle();
    assert(debug.update(fb, 300, telemetry, pattern));
    assert(fb.overlay_count() == 0);
    assert(!debug.update(fb, 600, telemetry, pattern));
}

TEST(debug_format_lists_pattern_metrics) {
    PerformanceTelemetry telemetry(30);
    WavePattern pattern(themes().front());
    const auto lines = DebugOverlay::format(telemetry, pattern);

    assert(lines.size() == 9 + DebugOverlay::MAX_PATTERN_METRICS);
    assert(lines[1].find("FPS") == 0);
    bool found = false;
    for (const auto& l : lines) {
        if (l.find("activeRipple") == 0) found = true;
    }
    assert(found);
}

TEST(steady_debug_panel_costs_nothing) {
    FrameBuffer fb(80, 24);
    PerformanceTelemetry telemetry(30);
    WavePattern pattern(themes().front());
    DebugOverlay debug;
    debug.set_visible(true);

    debug.update(fb, 0, telemetry, pattern);
    fb.get_changes();
    debug.update(fb, 1000, telemetry, pattern);
    assert(fb.get_changes().empty());
}

TEST(expired_toast_does_not_hole_debug_panel) {
    // On a narrow screen the toast column overlaps the debug panel.
    FrameBuffer fb(50, 24);
    Screen screen;
    PerformanceTelemetry telemetry(30);
    WavePattern pattern(themes().front());
    Overlays ui(3000);
    ui.debug.set_visible(true);
    ui.toasts.info("hello");
    const StatusBarState state{"waves", 0, "ocean", 30, false};

    ui.draw(fb, 0, state, telemetry, pattern);
    apply(screen, fb);
    assert(ui.toasts.count() == 1);
    assert(glyph_at(screen, 47, 2) == '+');

    ui.draw(fb, 2900, state, telemetry, pattern);
    apply(screen, fb);

    // The toast expires inside the panel's redraw interval.
    ui.draw(fb, 3000, state, telemetry, pattern);
    assert(!ui.toasts.has_toasts());
    for (int y = 2; y < 5; ++y) {
        for (int x = 8; x < DebugOverlay::PANEL_WIDTH; ++x) assert(fb.has_overlay(x, y));
    }
    apply(screen, fb);
    assert(glyph_at(screen, 31, 2) == '|');
}

TEST(hidden_debug_panel_still_clears) {
    FrameBuffer fb(50, 24);
    PerformanceTelemetry telemetry(30);
    WavePattern pattern(themes().front());
    Overlays ui(3000);
    ui.debug.set_visible(true);
    const StatusBarState state{"waves", 0, "ocean", 30, false};

    ui.draw(fb, 0, state, telemetry, pattern);
    assert(fb.has_overlay(0, 0));

    // Hidden in the same frame a toast appears.
    ui.debug.toggle();
    ui.toasts.info("bye");
    ui.draw(fb, 10, state, telemetry, pattern);
    assert(!fb.has_overlay(0, 0));
    // Toast cells the panel covered are back in the same frame.
    for (int x = 8; x < DebugOverlay::PANEL_WIDTH; ++x) assert(fb.has_overlay(x, 2));
}

int main() {
    std::cout << "=== UI Tests ===\n\n";

    RUN_TEST(truncate_marks_cut);
    RUN_TEST(draw_text_clips);
    RUN_TEST(toasts_keep_newest_three);
    RUN_TEST(toasts_expire);
    RUN_TEST(toast_layout_and_removal);
    RUN_TEST(toasts_stack_down);
    RUN_TEST(toasts_skip_tiny_screens);
    RUN_TEST(status_bar_layout);
    RUN_TEST(status_bar_paused_and_preset);
    RUN_TEST(status_bar_fps_colors);
    RUN_TEST(status_bar_hide_clears_row);
    RUN_TEST(status_bar_redraws_after_resize);
    RUN_TEST(help_layout);
    RUN_TEST(help_toggle);
    RUN_TEST(debug_overlay_throttled);
    RUN_TEST(debug_format_lists_pattern_metrics);
    RUN_TEST(steady_debug_panel_costs_nothing);
    RUN_TEST(expired_toast_does_not_hole_debug_panel);
    RUN_TEST(hidden_debug_panel_still_clears);

    std::cout << "\n=== Results: " << failures << " failures ===\n";
    return failures > 0 ? 1 : 0;
}
