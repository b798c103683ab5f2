#include "engine/scheduler.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>
#include <utility>

namespace splash {

namespace {
    constexpr double kMinFps = 1.0;
}

Scheduler::Scheduler(OutputEmitter& emitter, Pattern& pattern, double fps, Clock clock)
    : emitter_(emitter), pattern_(&pattern), clock_(std::move(clock)),
      telemetry_(std::max(fps, kMinFps), clock_) {
    state_.target_fps = std::max(fps, kMinFps);
    state_.frame_interval_ms = 1000.0 / state_.target_fps;
}

void Scheduler::start() {
    state_.running = true;
    state_.paused = false;
    state_.last_frame_timestamp = clock_();
}

void Scheduler::pause() {
    if (!state_.running) return;
    state_.paused = !state_.paused;
}

bool Scheduler::tick() {
    if (!state_.running || state_.paused) return false;

    const double now = clock_();
    const double delta = now - state_.last_frame_timestamp;
    if (delta < state_.frame_interval_ms) return false;

    render_frame(now);

    // Keep the overshoot so the average rate does not drift below target.
    state_.last_frame_timestamp = now - std::fmod(delta, state_.frame_interval_ms);
    return true;
}

void Scheduler::run(const Callback& idle) {
    while (state_.running) {
        if (idle) idle();
        if (!state_.running) break;
        tick();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void Scheduler::render_frame(double now) {
    FrameBuffer& buffer = emitter_.buffer();

    telemetry_.start_frame();

    const double update_start = clock_();
    buffer.clear();
    const double pattern_start = clock_();
    pattern_->render(buffer, now, pattern_size(), mouse_);
    const double pattern_end = clock_();

    const ChangeList changes = buffer.get_changes();
    const size_t emitted = emitter_.emit(changes);
    buffer.swap();
    const double render_end = clock_();

    telemetry_.record_update_time(pattern_end - update_start);
    telemetry_.record_pattern_render_time(pattern_end - pattern_start);
    telemetry_.record_render_time(render_end - pattern_end);
    telemetry_.record_changed_cells(emitted);
    ++frame_count_;

    if (after_render_) after_render_();
}

void Scheduler::set_pattern(Pattern& pattern) {
    pattern_->reset();
    pattern_ = &pattern;
    pattern_->reset();
    emitter_.buffer().clear();
}

void Scheduler::set_fps(double fps) {
    state_.target_fps = std::max(fps, kMinFps);
    state_.frame_interval_ms = 1000.0 / state_.target_fps;
    telemetry_.set_target_fps(state_.target_fps);
}

void Scheduler::set_reserved_rows(int rows) {
    reserved_rows_ = std::max(0, rows);
}

Size Scheduler::pattern_size() const {
    const Size full = emitter_.size();
    return {full.width, std::max(0, full.height - reserved_rows_)};
}

}
