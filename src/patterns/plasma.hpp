#pragma once

#include "patterns/pattern.hpp"

namespace splash {

struct PlasmaConfig {
    double frequency = 0.1;
    double speed = 1.0;
    double complexity = 3.0;
};

// Four summed sine fields mapped onto shade glyphs. Stateless.
class PlasmaPattern : public Pattern {
public:
    explicit PlasmaPattern(const Theme& theme, const PlasmaConfig& config = {})
        : theme_(&theme), config_(config) {}

    std::string name() const override { return "plasma"; }
    void render(FrameBuffer& buffer, double time_ms, Size size,
                const std::optional<Point>& mouse) override;
    void reset() override {}

    void set_theme(const Theme& theme) override { theme_ = &theme; }
    PatternMetrics metrics() const override;

private:
    const Theme* theme_;
    PlasmaConfig config_;
};

}
