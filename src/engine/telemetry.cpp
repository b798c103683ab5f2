#include "engine/telemetry.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>
#include <vector>

namespace splash {

PerformanceTelemetry::PerformanceTelemetry(double target_fps, Clock clock)
    : clock_(std::move(clock)) {
    metrics_.target_fps = target_fps;
}

void PerformanceTelemetry::start_frame() {
    const double now = clock_();

    if (has_last_frame_) {
        const double delta = now - last_frame_start_;
        metrics_.frame_time = delta;

        if (delta > 0.0) {
            fps_history_.push_back(1000.0 / delta);
            frame_time_history_.push_back(delta);
            if (fps_history_.size() > HISTORY_SIZE) {
                fps_history_.pop_front();
                frame_time_history_.pop_front();
            }
        }

        if (!fps_history_.empty()) {
            metrics_.fps = std::accumulate(fps_history_.begin(), fps_history_.end(), 0.0) /
                           static_cast<double>(fps_history_.size());
        }

        if (metrics_.target_fps > 0.0) {
            const double target_frame_time = 1000.0 / metrics_.target_fps;
            if (delta > target_frame_time * DROP_FACTOR) {
                ++metrics_.frame_drops;
                ++total_dropped_frames_;
            }
        }
    }

    last_frame_start_ = now;
    has_last_frame_ = true;
    ++total_frames_;
}

FrameStats PerformanceTelemetry::stats() const {
    FrameStats stats;
    stats.avg_fps = metrics_.fps;
    if (!fps_history_.empty()) {
        auto [lo, hi] = std::minmax_element(fps_history_.begin(), fps_history_.end());
        stats.min_fps = *lo;
        stats.max_fps = *hi;
    }
    if (!frame_time_history_.empty()) {
        stats.avg_frame_time =
            std::accumulate(frame_time_history_.begin(), frame_time_history_.end(), 0.0) /
            static_cast<double>(frame_time_history_.size());
    }
    stats.total_frames = total_frames_;
    stats.total_dropped_frames = total_dropped_frames_;
    return stats;
}

double PerformanceTelemetry::percentile(double p) const {
    if (fps_history_.empty()) return 0.0;

    std::vector<double> sorted(fps_history_.begin(), fps_history_.end());
    std::sort(sorted.begin(), sorted.end());

    const double clamped = std::clamp(p, 0.0, 100.0);
    size_t index = static_cast<size_t>(std::floor(clamped / 100.0 * static_cast<double>(sorted.size())));
    index = std::min(index, sorted.size() - 1);
    return sorted[index];
}

void PerformanceTelemetry::reset() {
    fps_history_.clear();
    frame_time_history_.clear();
    metrics_.fps = 0.0;
    metrics_.frame_drops = 0;
}

}
