#include "patterns/matrix.hpp"
#include <algorithm>
#include <cmath>

namespace splash {

namespace {
    struct MatrixPresetDef {
        PatternPreset info;
        MatrixConfig config;
    };

    const std::vector<MatrixPresetDef>& matrix_presets() {
        static const std::vector<MatrixPresetDef> presets = {
            {{1, "Classic Matrix", "The iconic falling code effect"}, {0.3, 1.0, MatrixCharset::Katakana}},
            {{2, "Binary Rain", "Falling numbers, digital downpour"}, {0.4, 1.2, MatrixCharset::Numbers}},
            {{3, "Code Storm", "Dense, fast-moving characters"}, {0.5, 1.8, MatrixCharset::Mixed}},
            {{4, "Sparse Glyphs", "Minimal, slow-falling characters"}, {0.15, 0.6, MatrixCharset::Katakana}},
            {{5, "Firewall", "Ultra-dense security screen"}, {0.7, 2.0, MatrixCharset::Mixed}},
            {{6, "Zen Code", "Peaceful, meditative flow"}, {0.2, 0.5, MatrixCharset::Katakana}},
        };
        return presets;
    }

    constexpr int kDistortionRadius = 5;

    // Halfwidth katakana U+FF71..U+FF9C, then U+FF66 and U+FF9D.
    std::vector<uint32_t> make_katakana() {
        std::vector<uint32_t> out;
        for (uint32_t cp = 0xFF71; cp <= 0xFF9C; ++cp) out.push_back(cp);
        out.push_back(0xFF66);
        out.push_back(0xFF9D);
        return out;
    }

    const std::vector<uint32_t>& charset_glyphs(MatrixCharset charset) {
        static const std::vector<uint32_t> katakana = make_katakana();
        static const std::vector<uint32_t> numbers = {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9'};
        static const std::vector<uint32_t> mixed = [] {
            std::vector<uint32_t> out = make_katakana();
            for (uint32_t c = '0'; c <= '9'; ++c) out.push_back(c);
            for (uint32_t c = 'A'; c <= 'Z'; ++c) out.push_back(c);
            return out;
        }();

        switch (charset) {
            case MatrixCharset::Numbers: return numbers;
            case MatrixCharset::Mixed: return mixed;
            case MatrixCharset::Katakana: break;
        }
        return katakana;
    }

    MatrixConfig sanitize(MatrixConfig config) {
        config.density = std::isfinite(config.density) ? std::clamp(config.density, 0.1, 1.0) : 0.3;
        config.speed = std::isfinite(config.speed) ? std::clamp(config.speed, 0.1, 5.0) : 1.0;
        return config;
    }
}

MatrixPattern::MatrixPattern(const MatrixConfig& config, uint32_t seed)
    : config_(sanitize(config)), rng_(seed) {}

uint32_t MatrixPattern::random_char() {
    const auto& glyphs = charset_glyphs(config_.charset);
    std::uniform_int_distribution<size_t> pick(0, glyphs.size() - 1);
    return glyphs[pick(rng_)];
}

MatrixPattern::Column MatrixPattern::make_column(Size size) {
    std::uniform_int_distribution<int> length_dist(5, 19);
    std::uniform_int_distribution<int> x_dist(0, std::max(0, size.width - 1));
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    Column col;
    const int length = length_dist(rng_);
    col.chars.reserve(static_cast<size_t>(length));
    for (int i = 0; i < length; ++i) col.chars.push_back(random_char());
    col.x = x_dist(rng_);
    col.y = -static_cast<double>(length);
    col.speed = (unit(rng_) * 0.5 + 0.5) * config_.speed;
    col.age = 0;
    return col;
}

void MatrixPattern::render(FrameBuffer& buffer, double, Size size,
                           const std::optional<Point>& mouse) {
    const int width = size.width;
    const int height = size.height;
    last_size_ = size;

    if (width <= 0 || height <= 0) return;

    const size_t target = static_cast<size_t>(std::floor(width * config_.density));
    while (columns_.size() < target) columns_.push_back(make_column(size));
    columns_.erase(std::remove_if(columns_.begin(), columns_.end(),
                                  [width](const Column& c) { return c.x >= width; }),
                   columns_.end());

    if (mouse) distortion_ = mouse;

    std::uniform_real_distribution<double> unit(0.0, 1.0);

    for (Column& col : columns_) {
        const int length = static_cast<int>(col.chars.size());
        col.y += col.speed * 0.3;
        ++col.age;

        if (col.y > height + length) {
            col = make_column(size);
            continue;
        }

        const double age_fade = std::max(0.0, 1.0 - col.age / 500.0);

        for (int j = 0; j < length; ++j) {
            const int y = static_cast<int>(std::floor(col.y - j));
            if (y < 0 || y >= height || col.x < 0 || col.x >= width) continue;

            uint32_t ch = col.chars[static_cast<size_t>(j)];
            if (distortion_) {
                const int dx = col.x - distortion_->x;
                const int dy = y - distortion_->y;
                if (dx * dx + dy * dy < kDistortionRadius * kDistortionRadius) {
                    ch = random_char();
                }
            }

            Color color;
            if (j == 0) {
                const int white = static_cast<int>(255 * age_fade);
                color = Color(white, white, white);
            } else if (j < 3) {
                color = Color(0, static_cast<int>(255 * age_fade), static_cast<int>(70 * age_fade));
            } else {
                const double fade = (1.0 - static_cast<double>(j) / length) * age_fade;
                const int brightness = static_cast<int>(fade * 200);
                color = Color(0, brightness, static_cast<int>(brightness * 0.3));
            }
            buffer.set_cell(col.x, y, Cell(ch, color));

            if (unit(rng_) < 0.05) col.chars[static_cast<size_t>(j)] = random_char();
        }
    }
}

void MatrixPattern::on_mouse_click(Point pos) {
    std::uniform_int_distribution<int> jitter(-3, 2);
    for (int i = 0; i < 3; ++i) {
        Column col = make_column(last_size_);
        col.x = pos.x + jitter(rng_);
        col.y = pos.y - static_cast<double>(col.chars.size());
        columns_.push_back(std::move(col));
    }
}

void MatrixPattern::reset() {
    columns_.clear();
    distortion_.reset();
}

PatternMetrics MatrixPattern::metrics() const {
    size_t total_chars = 0;
    double speed_sum = 0.0;
    double age_sum = 0.0;
    for (const Column& c : columns_) {
        total_chars += c.chars.size();
        speed_sum += c.speed;
        age_sum += c.age;
    }
    const double n = static_cast<double>(columns_.size());
    return {
        {"columns", n},
        {"totalChars", static_cast<double>(total_chars)},
        {"avgSpeed", columns_.empty() ? 0.0 : std::round(speed_sum / n * 100.0) / 100.0},
        {"avgAge", columns_.empty() ? 0.0 : std::round(age_sum / n)},
        {"density", config_.density},
        {"speed", config_.speed},
    };
}

std::vector<PatternPreset> MatrixPattern::presets() const {
    std::vector<PatternPreset> out;
    for (const auto& p : matrix_presets()) out.push_back(p.info);
    return out;
}

bool MatrixPattern::apply_preset(int id) {
    for (const auto& p : matrix_presets()) {
        if (p.info.id == id) {
            config_ = p.config;
            reset();
            preset_ = id;
            return true;
        }
    }
    return false;
}

}
