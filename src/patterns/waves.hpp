#pragma once

#include "patterns/pattern.hpp"
#include <deque>

namespace splash {

struct WaveConfig {
    double speed = 1.0;
    double amplitude = 5.0;
    double frequency = 0.1;
    int layers = 3;
    bool foam_enabled = false;
    double foam_threshold = 0.0;
    double foam_density = 0.0;
};

// Layered sine waves across the screen; mouse movement and clicks spawn ripples.
class WavePattern : public Pattern {
public:
    static constexpr size_t MAX_RIPPLES = 8;
    static constexpr double RIPPLE_LIFETIME_MS = 2000.0;

    explicit WavePattern(const Theme& theme, const WaveConfig& config = {});

    std::string name() const override { return "waves"; }
    void render(FrameBuffer& buffer, double time_ms, Size size,
                const std::optional<Point>& mouse) override;
    void reset() override;

    void set_theme(const Theme& theme) override { theme_ = &theme; }
    void on_mouse_move(Point pos) override;
    void on_mouse_click(Point pos) override;
    PatternMetrics metrics() const override;
    std::vector<PatternPreset> presets() const override;
    bool apply_preset(int id) override;
    int current_preset() const override { return preset_; }

    const WaveConfig& config() const { return config_; }
    size_t ripple_count() const { return ripples_.size(); }

private:
    struct Ripple {
        double x;
        double y;
        double time;
        double radius;
    };

    void add_ripple(Point pos, double radius);

    const Theme* theme_;
    WaveConfig config_;
    std::deque<Ripple> ripples_;
    double current_time_ = 0.0;
    int preset_ = 0;
};

}
