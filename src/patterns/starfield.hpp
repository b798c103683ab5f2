#pragma once

#include "patterns/pattern.hpp"
#include <random>

namespace splash {

struct StarfieldConfig {
    int star_count = 100;
    double speed = 1.0;
    double mouse_repel_radius = 5.0;
};

// Stars flying toward the viewer. The pointer pushes nearby stars away and a
// click sets off a short particle burst.
class StarfieldPattern : public Pattern {
public:
    static constexpr double EXPLOSION_LIFETIME_MS = 1000.0;
    static constexpr int EXPLOSION_PARTICLES = 12;

    explicit StarfieldPattern(const Theme& theme, const StarfieldConfig& config = {},
                              uint32_t seed = std::random_device{}());

    std::string name() const override { return "starfield"; }
    void render(FrameBuffer& buffer, double time_ms, Size size,
                const std::optional<Point>& mouse) override;
    void reset() override;

    void set_theme(const Theme& theme) override { theme_ = &theme; }
    void on_mouse_click(Point pos) override;
    PatternMetrics metrics() const override;
    std::vector<PatternPreset> presets() const override;
    bool apply_preset(int id) override;
    int current_preset() const override { return preset_; }

    size_t star_count() const { return stars_.size(); }
    size_t explosion_count() const { return explosions_.size(); }

private:
    struct Star {
        double x;
        double y;
        double z;
        double speed;
    };

    struct Explosion {
        double x;
        double y;
        double time;
    };

    Star make_star(Size size);

    const Theme* theme_;
    StarfieldConfig config_;
    std::mt19937 rng_;
    std::vector<Star> stars_;
    std::vector<Explosion> explosions_;
    double current_time_ = 0.0;
    int preset_ = 0;
};

}
