#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"
#include "engine/telemetry.hpp"
#include "patterns/pattern.hpp"
#include "render/output_emitter.hpp"
#include <functional>
#include <optional>

namespace splash {

struct ScheduleState {
    bool running = false;
    bool paused = false;
    double target_fps = 30.0;
    double frame_interval_ms = 1000.0 / 30.0;
    double last_frame_timestamp = 0.0;
};

// Paces the clear/render/diff/emit/swap cycle. Single threaded: run() polls
// tick() and hands control to an idle callback between frames for input and
// resize handling. Exceptions thrown by a pattern or by the output device
// propagate out of tick() and run().
class Scheduler {
public:
    using Callback = std::function<void()>;

    Scheduler(OutputEmitter& emitter, Pattern& pattern, double fps,
              Clock clock = steady_clock_ms());

    void start();
    void stop() { state_.running = false; }
    void pause();

    // Renders at most one frame. Returns true if a frame was produced.
    bool tick();
    void run(const Callback& idle);

    void set_pattern(Pattern& pattern);
    Pattern& pattern() { return *pattern_; }
    void set_fps(double fps);
    double fps() const { return state_.target_fps; }
    void set_mouse_position(const std::optional<Point>& pos) { mouse_ = pos; }
    const std::optional<Point>& mouse_position() const { return mouse_; }
    void set_reserved_rows(int rows);
    void set_after_render_callback(Callback cb) { after_render_ = std::move(cb); }

    bool running() const { return state_.running; }
    bool paused() const { return state_.paused; }
    const ScheduleState& state() const { return state_; }
    uint64_t frame_count() const { return frame_count_; }

    PerformanceTelemetry& telemetry() { return telemetry_; }
    const PerformanceTelemetry& telemetry() const { return telemetry_; }

    Size pattern_size() const;

private:
    void render_frame(double now);

    OutputEmitter& emitter_;
    Pattern* pattern_;
    Clock clock_;
    PerformanceTelemetry telemetry_;
    ScheduleState state_;
    std::optional<Point> mouse_;
    Callback after_render_;
    int reserved_rows_ = 0;
    uint64_t frame_count_ = 0;
};

}
