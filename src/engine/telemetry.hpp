#pragma once

#include "core/clock.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>

namespace splash {

struct FrameMetrics {
    double fps = 0.0;            // rolling average over the history window
    double target_fps = 0.0;
    double frame_time = 0.0;     // ms between the last two start_frame() calls
    double update_time = 0.0;    // clear + pattern render
    double pattern_render_time = 0.0;
    double render_time = 0.0;    // diff + emit + swap
    size_t changed_cells = 0;
    uint64_t frame_drops = 0;    // since the last reset()
};

struct FrameStats {
    double avg_fps = 0.0;
    double min_fps = 0.0;
    double max_fps = 0.0;
    double avg_frame_time = 0.0;
    uint64_t total_frames = 0;
    uint64_t total_dropped_frames = 0;
};

// Observer only: nothing in here feeds back into scheduling.
class PerformanceTelemetry {
public:
    static constexpr size_t HISTORY_SIZE = 60;
    static constexpr double DROP_FACTOR = 1.5;

    explicit PerformanceTelemetry(double target_fps, Clock clock = steady_clock_ms());

    void start_frame();
    void record_update_time(double ms) { metrics_.update_time = ms; }
    void record_pattern_render_time(double ms) { metrics_.pattern_render_time = ms; }
    void record_render_time(double ms) { metrics_.render_time = ms; }
    void record_changed_cells(size_t count) { metrics_.changed_cells = count; }
    void set_target_fps(double fps) { metrics_.target_fps = fps; }

    FrameMetrics metrics() const { return metrics_; }
    FrameStats stats() const;
    double percentile(double p) const;
    void reset();

    size_t history_size() const { return fps_history_.size(); }

private:
    Clock clock_;
    FrameMetrics metrics_;
    std::deque<double> fps_history_;
    std::deque<double> frame_time_history_;
    double last_frame_start_ = 0.0;
    bool has_last_frame_ = false;
    uint64_t total_frames_ = 0;
    uint64_t total_dropped_frames_ = 0;
};

}
