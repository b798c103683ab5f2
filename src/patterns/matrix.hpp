#pragma once

#include "patterns/pattern.hpp"
#include <random>

namespace splash {

enum class MatrixCharset {
    Katakana,
    Numbers,
    Mixed
};

struct MatrixConfig {
    double density = 0.3;   // columns per screen column, [0.1, 1]
    double speed = 1.0;     // [0.1, 5]
    MatrixCharset charset = MatrixCharset::Katakana;
};

// Falling glyph columns. Glyphs near the pointer are scrambled and a click
// spawns new columns around it.
class MatrixPattern : public Pattern {
public:
    explicit MatrixPattern(const MatrixConfig& config = {},
                           uint32_t seed = std::random_device{}());

    std::string name() const override { return "matrix"; }
    void render(FrameBuffer& buffer, double time_ms, Size size,
                const std::optional<Point>& mouse) override;
    void reset() override;

    void on_mouse_click(Point pos) override;
    PatternMetrics metrics() const override;
    std::vector<PatternPreset> presets() const override;
    bool apply_preset(int id) override;
    int current_preset() const override { return preset_; }

    const MatrixConfig& config() const { return config_; }
    size_t column_count() const { return columns_.size(); }

private:
    struct Column {
        int x;
        double y;
        double speed;
        std::vector<uint32_t> chars;
        int age;
    };

    Column make_column(Size size);
    uint32_t random_char();

    MatrixConfig config_;
    std::mt19937 rng_;
    std::vector<Column> columns_;
    std::optional<Point> distortion_;
    Size last_size_{100, 100};
    int preset_ = 0;
};

}
