#include <cassert>
#include <cmath>
#include <iostream>

#include "test_harness.hpp"
#include "../src/engine/telemetry.hpp"

using namespace splash;

int failures = 0;

static bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

TEST(first_frame_sets_reference_only) {
    FakeClock clock;
    PerformanceTelemetry t(30, clock.fn());

    clock.now = 500;
    t.start_frame();
    assert(t.history_size() == 0);
    assert(t.metrics().fps == 0);
    assert(t.metrics().frame_drops == 0);
    assert(t.stats().total_frames == 1);
}

TEST(rolling_average_fps) {
    FakeClock clock;
    PerformanceTelemetry t(30, clock.fn());

    t.start_frame();
    clock.now += 20;
    t.start_frame();
    clock.now += 50;
    t.start_frame();

    const FrameMetrics m = t.metrics();
    assert(near(m.fps, (50.0 + 20.0) / 2.0));
    assert(near(m.frame_time, 50));

    const FrameStats s = t.stats();
    assert(near(s.min_fps, 20));
    assert(near(s.max_fps, 50));
    assert(near(s.avg_frame_time, 35));
    assert(s.total_frames == 3);
}

TEST(history_is_capped) {
    FakeClock clock;
    PerformanceTelemetry t(60, clock.fn());

    t.start_frame();
    for (int i = 0; i < 100; ++i) {
        clock.now += 10;
        t.start_frame();
    }
    assert(t.history_size() == PerformanceTelemetry::HISTORY_SIZE);
    assert(near(t.metrics().fps, 100));
    assert(t.stats().total_frames == 101);
}

TEST(drop_threshold_is_one_and_a_half_frames) {
    FakeClock clock;
    PerformanceTelemetry t(30, clock.fn());

    t.start_frame();
    clock.now += 45;        // under 1.5x of 33.3 ms
    t.start_frame();
    assert(t.metrics().frame_drops == 0);

    clock.now += 51;
    t.start_frame();
    assert(t.metrics().frame_drops == 1);

    clock.now += 200;
    t.start_frame();
    assert(t.metrics().frame_drops == 2);
    assert(t.stats().total_dropped_frames == 2);
}

TEST(zero_delta_is_not_sampled) {
    FakeClock clock;
    PerformanceTelemetry t(30, clock.fn());

    t.start_frame();
    t.start_frame();
    assert(t.history_size() == 0);
    assert(std::isfinite(t.metrics().fps));
}

TEST(reset_keeps_totals) {
    FakeClock clock;
    PerformanceTelemetry t(30, clock.fn());

    t.start_frame();
    clock.now += 100;
    t.start_frame();
    assert(t.metrics().frame_drops == 1);

    t.reset();
    assert(t.history_size() == 0);
    assert(t.metrics().fps == 0);
    assert(t.metrics().frame_drops == 0);
    assert(t.stats().total_frames == 2);
    assert(t.stats().total_dropped_frames == 1);
    assert(t.percentile(50) == 0);
}

TEST(percentile_uses_sorted_history) {
    FakeClock clock;
    PerformanceTelemetry t(30, clock.fn());

    // Frame times 100, 50, 25, 20 ms give fps 10, 20, 40, 50.
    t.start_frame();
    for (double dt : {100.0, 50.0, 25.0, 20.0}) {
        clock.now += dt;
        t.start_frame();
    }
    assert(near(t.percentile(0), 10));
    assert(near(t.percentile(25), 20));
    assert(near(t.percentile(50), 40));
    assert(near(t.percentile(95), 50));
    assert(near(t.percentile(100), 50));
    assert(near(t.percentile(-10), 10));
}

TEST(target_change_moves_threshold) {
    FakeClock clock;
    PerformanceTelemetry t(10, clock.fn());

    t.start_frame();
    clock.now += 120;
    t.start_frame();
    assert(t.metrics().frame_drops == 0);

    t.set_target_fps(60);
    assert(t.metrics().target_fps == 60);
    clock.now += 120;
    t.start_frame();
    assert(t.metrics().frame_drops == 1);
}

TEST(recorded_timings_are_exposed) {
    PerformanceTelemetry t(30);
    t.record_update_time(1.5);
    t.record_pattern_render_time(1.0);
    t.record_render_time(2.5);
    t.record_changed_cells(42);

    const FrameMetrics m = t.metrics();
    assert(m.update_time == 1.5);
    assert(m.pattern_render_time == 1.0);
    assert(m.render_time == 2.5);
    assert(m.changed_cells == 42);
}

int main() {
    std::cout << "=== Telemetry Tests ===\n\n";

    RUN_TEST(first_frame_sets_reference_only);
    RUN_TEST(rolling_average_fps);
    RUN_TEST(history_is_capped);
    RUN_TEST(drop_threshold_is_one_and_a_half_frames);
    RUN_TEST(zero_delta_is_not_sampled);
    RUN_TEST(reset_keeps_totals);
    RUN_TEST(percentile_uses_sorted_history);
    RUN_TEST(target_change_moves_threshold);
    RUN_TEST(recorded_timings_are_exposed);

    std::cout << "\n=== Results: " << failures << " failures ===\n";
    return failures > 0 ? 1 : 0;
}
