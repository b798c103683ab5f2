#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_harness.hpp"
#include "../src/engine/scheduler.hpp"
#include "../src/render/output_emitter.hpp"
#include "../src/terminal/terminal.hpp"

using namespace splash;

int failures = 0;

namespace {

class CountingPattern : public Pattern {
public:
    explicit CountingPattern(std::string name = "counting") : name_(std::move(name)) {}

    std::string name() const override { return name_; }

    void render(FrameBuffer& buffer, double time_ms, Size size,
                const std::optional<Point>& mouse) override {
        if (throw_on_render) throw std::runtime_error("render failed");
        ++renders;
        last_time = time_ms;
        last_size = size;
        last_mouse = mouse;
        buffer.set_cell(renders % 5, 0, Cell('*', Color(255, 255, 255)));
    }

    void reset() override { ++resets; }

    int renders = 0;
    int resets = 0;
    double last_time = -1.0;
    Size last_size;
    std::optional<Point> last_mouse;
    bool throw_on_render = false;

private:
    std::string name_;
};

struct Rig {
    RecordingOutput out;
    Terminal term{out, -1, -1};
    OutputEmitter emitter{term};
    FakeClock clock;

    Rig() { emitter.handle_resize(20, 10); }
};

}

TEST(tick_requires_start) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());

    rig.clock.now = 1000;
    assert(!scheduler.tick());
    assert(pattern.renders == 0);
    assert(!scheduler.running());
}

TEST(tick_waits_for_interval) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 10, rig.clock.fn());
    scheduler.start();

    rig.clock.now = 99;
    assert(!scheduler.tick());
    rig.clock.now = 100;
    assert(scheduler.tick());
    assert(pattern.renders == 1);
    assert(pattern.last_time == 100);
    assert(scheduler.frame_count() == 1);
    assert(!scheduler.tick());
}

TEST(phase_locked_rate_with_fine_clock) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());
    scheduler.start();

    int frames = 0;
    for (int ms = 1; ms <= 10000; ++ms) {
        rig.clock.now = ms;
        if (scheduler.tick()) ++frames;
    }
    assert(frames >= 299 && frames <= 300);
}

TEST(phase_locked_rate_with_coarse_clock) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());
    scheduler.start();

    // A 7 ms wake-up granularity would lose about 15 frames if the overshoot were dropped.
    int frames = 0;
    for (int ms = 7; ms <= 10000; ms += 7) {
        rig.clock.now = ms;
        if (scheduler.tick()) ++frames;
    }
    assert(frames >= 298 && frames <= 300);
}

TEST(pause_and_stop_state_machine) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());

    scheduler.pause();
    assert(!scheduler.paused());

    scheduler.start();
    assert(scheduler.running());
    scheduler.pause();
    assert(scheduler.paused());

    rig.clock.now = 500;
    assert(!scheduler.tick());
    assert(pattern.renders == 0);

    scheduler.pause();
    assert(!scheduler.paused());
    assert(scheduler.tick());

    scheduler.stop();
    assert(!scheduler.running());
    rig.clock.now = 1000;
    assert(!scheduler.tick());

    scheduler.start();
    assert(scheduler.running() && !scheduler.paused());
    assert(scheduler.state().last_frame_timestamp == 1000);
}

TEST(frame_emits_single_write) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());
    scheduler.start();
    rig.out.writes.clear();

    rig.clock.now = 40;
    assert(scheduler.tick());
    assert(rig.out.writes.size() == 1);
    assert(scheduler.telemetry().metrics().changed_cells == 1);

    // Previous frame now equals what was drawn.
    const FrameBuffer& fb = rig.emitter.buffer();
    assert(fb.previous_cell(1, 0).ch == '*');
}

TEST(after_render_runs_after_swap) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());

    std::vector<uint64_t> seen;
    bool swapped = false;
    scheduler.set_after_render_callback([&] {
        seen.push_back(scheduler.frame_count());
        const FrameBuffer& fb = rig.emitter.buffer();
        swapped = fb.previous_cell(pattern.renders % 5, 0) == fb.cell(pattern.renders % 5, 0);
    });
    scheduler.start();

    rig.clock.now = 40;
    scheduler.tick();
    rig.clock.now = 80;
    scheduler.tick();
    assert((seen == std::vector<uint64_t>{1, 2}));
    assert(swapped);
}

TEST(set_pattern_resets_and_clears) {
    Rig rig;
    CountingPattern first("first");
    CountingPattern second("second");
    Scheduler scheduler(rig.emitter, first, 30, rig.clock.fn());
    scheduler.start();

    rig.clock.now = 40;
    scheduler.tick();
    rig.emitter.buffer().set_overlay_text(0, 9, "status");

    scheduler.set_pattern(second);
    assert(first.resets == 1);
    assert(second.resets == 1);
    assert(scheduler.pattern().name() == "second");
    assert(rig.emitter.buffer().cell(1, 0) == Cell());
    assert(rig.emitter.buffer().overlay_count() == 6);

    rig.clock.now = 80;
    scheduler.tick();
    assert(first.renders == 1);
    assert(second.renders == 1);
}

TEST(reserved_rows_shrink_pattern_area) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());
    scheduler.set_reserved_rows(1);
    scheduler.start();

    rig.clock.now = 40;
    scheduler.tick();
    assert(pattern.last_size == (Size{20, 9}));

    scheduler.set_reserved_rows(50);
    assert(scheduler.pattern_size() == (Size{20, 0}));
    scheduler.set_reserved_rows(-2);
    assert(scheduler.pattern_size() == (Size{20, 10}));
}

TEST(mouse_position_reaches_pattern) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());
    scheduler.start();

    scheduler.set_mouse_position(Point{3, 4});
    rig.clock.now = 40;
    scheduler.tick();
    assert(pattern.last_mouse && *pattern.last_mouse == (Point{3, 4}));

    scheduler.set_mouse_position(std::nullopt);
    rig.clock.now = 80;
    scheduler.tick();
    assert(!pattern.last_mouse);
}

TEST(set_fps_changes_interval) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());

    scheduler.set_fps(50);
    assert(scheduler.fps() == 50);
    assert(scheduler.state().frame_interval_ms == 20);
    assert(scheduler.telemetry().metrics().target_fps == 50);

    scheduler.set_fps(0);
    assert(scheduler.fps() == 1);
}

TEST(render_errors_propagate) {
    Rig rig;
    CountingPattern pattern;
    pattern.throw_on_render = true;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());
    scheduler.start();

    rig.clock.now = 40;
    bool threw = false;
    try {
        scheduler.tick();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

TEST(run_calls_idle_until_stopped) {
    Rig rig;
    CountingPattern pattern;
    Scheduler scheduler(rig.emitter, pattern, 30, rig.clock.fn());
    scheduler.start();

    int calls = 0;
    scheduler.run([&] {
        ++calls;
        if (calls == 5) {
            scheduler.stop();
        } else {
            rig.clock.now += 40;
        }
    });
    assert(calls == 5);
    assert(pattern.renders == 4);
}

int main() {
    std::cout << "=== Scheduler Tests ===\n\n";

    RUN_TEST(tick_requires_start);
    RUN_TEST(tick_waits_for_interval);
    RUN_TEST(phase_locked_rate_with_fine_clock);
    RUN_TEST(phase_locked_rate_with_coarse_clock);
    RUN_TEST(pause_and_stop_state_machine);
    RUN_TEST(frame_emits_single_write);
    RUN_TEST(after_render_runs_after_swap);
    RUN_TEST(set_pattern_resets_and_clears);
    RUN_TEST(reserved_rows_shrink_pattern_area);
    RUN_TEST(mouse_position_reaches_pattern);
    RUN_TEST(set_fps_changes_interval);
    RUN_TEST(render_errors_propagate);
    RUN_TEST(run_calls_idle_until_stopped);

    std::cout << "\n=== Results: " << failures << " failures ===\n";
    return failures > 0 ? 1 : 0;
}
