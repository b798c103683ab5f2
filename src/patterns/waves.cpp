#include "patterns/waves.hpp"
#include <algorithm>
#include <cmath>

namespace splash {

namespace {
    struct WavePresetDef {
        PatternPreset info;
        WaveConfig config;
    };

    const std::vector<WavePresetDef>& wave_presets() {
        static const std::vector<WavePresetDef> presets = {
            {{1, "Calm Seas", "Gentle, slow-moving waves"}, {0.5, 3, 0.08, 2, false, 0, 0}},
            {{2, "Ocean Storm", "Turbulent, high-energy waves"}, {2.0, 8, 0.15, 5, false, 0, 0}},
            {{3, "Ripple Tank", "Physics lab interference patterns"}, {0.8, 4, 0.2, 4, false, 0, 0}},
            {{4, "Glass Lake", "Barely perceptible movement"}, {0.3, 2, 0.05, 1, false, 0, 0}},
            {{5, "Tsunami", "Massive, powerful waves"}, {1.5, 12, 0.06, 3, false, 0, 0}},
            {{6, "Choppy Waters", "Irregular, textured surface"}, {1.2, 6, 0.25, 6, false, 0, 0}},
            {{7, "Stormy Seas", "High waves with crashing foam"}, {1.8, 10, 0.12, 4, true, 0.7, 0.6}},
            {{8, "Gentle Surf", "Soft waves with light foam"}, {0.8, 5, 0.1, 3, true, 0.8, 0.3}},
        };
        return presets;
    }

    // ~ ≈ ∼ - .
    constexpr uint32_t kWaveChars[] = {'~', 0x2248, 0x223C, '-', '.'};
    // ◦ ∘ ° ·
    constexpr uint32_t kFoamChars[] = {0x25E6, 0x2218, 0x00B0, 0x00B7};
    constexpr size_t kFoamCount = sizeof(kFoamChars) / sizeof(kFoamChars[0]);
}

WavePattern::WavePattern(const Theme& theme, const WaveConfig& config)
    : theme_(&theme), config_(config) {}

void WavePattern::render(FrameBuffer& buffer, double time_ms, Size size,
                         const std::optional<Point>&) {
    current_time_ = time_ms;
    const double amplitude = config_.amplitude;

    for (int y = 0; y < size.height; ++y) {
        for (int x = 0; x < size.width; ++x) {
            double total = 0.0;

            for (int layer = 0; layer < config_.layers; ++layer) {
                const double freq = config_.frequency * (layer + 1) * 0.5;
                const double amp = amplitude / (layer + 1);
                const double speed = config_.speed * (layer + 1) * 0.3;
                total += std::sin(x * freq + time_ms * speed * 0.001) * amp;
                total += std::sin(x * freq * 1.3 + time_ms * speed * 0.0008) * (amp * 0.5);
            }

            for (const Ripple& ripple : ripples_) {
                const double dx = x - ripple.x;
                const double dy = y - ripple.y;
                const double dist_sq = dx * dx + dy * dy;
                if (dist_sq >= ripple.radius * ripple.radius) continue;
                const double dist = std::sqrt(dist_sq);
                const double age = time_ms - ripple.time;
                total += std::sin(dist * 0.5 - age * 0.01) * (1.0 - dist / ripple.radius) * 3.0;
            }

            const double crest = size.height / 2.0 + total;
            const double d = std::abs(y - crest);

            uint32_t ch = ' ';
            double intensity = 0.0;
            if (d < 0.5) {
                ch = kWaveChars[0];
                intensity = 1.0;
            } else if (d < 1.5) {
                ch = kWaveChars[1];
                intensity = 1.0 - (d - 0.5) * 0.2;
            } else if (d < 2.5) {
                ch = kWaveChars[2];
                intensity = 0.8 - (d - 1.5) * 0.2;
            } else if (d < 4.0) {
                ch = kWaveChars[3];
                intensity = 0.6 - (d - 2.5) / 1.5 * 0.2;
            } else if (d < 6.0) {
                ch = kWaveChars[4];
                intensity = 0.4 - (d - 4.0) / 2.0 * 0.2;
            }

            if (config_.foam_enabled && d < 0.5 && amplitude > 0.0 &&
                std::abs(total) / amplitude > config_.foam_threshold) {
                const double noise = std::sin(x * 0.5 + time_ms * 0.003) * 0.5 + 0.5;
                if (noise < config_.foam_density) {
                    size_t idx = static_cast<size_t>(noise * kFoamCount / config_.foam_density);
                    ch = kFoamChars[std::min(idx, kFoamCount - 1)];
                    intensity = 0.9;
                }
            }

            buffer.set_cell(x, y, Cell(ch, theme_->color_at(intensity)));
        }
    }

    while (!ripples_.empty() && time_ms - ripples_.front().time >= RIPPLE_LIFETIME_MS) {
        ripples_.pop_front();
    }
}

void WavePattern::add_ripple(Point pos, double radius) {
    ripples_.push_back({static_cast<double>(pos.x), static_cast<double>(pos.y), current_time_, radius});
    if (ripples_.size() > MAX_RIPPLES) ripples_.pop_front();
}

void WavePattern::on_mouse_move(Point pos) {
    add_ripple(pos, 20.0);
}

void WavePattern::on_mouse_click(Point pos) {
    add_ripple(pos, 35.0);
}

void WavePattern::reset() {
    ripples_.clear();
    current_time_ = 0.0;
}

PatternMetrics WavePattern::metrics() const {
    double age_sum = 0.0;
    for (const Ripple& r : ripples_) age_sum += current_time_ - r.time;
    return {
        {"activeRipples", static_cast<double>(ripples_.size())},
        {"avgRippleAge", ripples_.empty() ? 0.0 : std::round(age_sum / ripples_.size())},
        {"waveLayers", static_cast<double>(config_.layers)},
        {"speed", config_.speed},
        {"amplitude", config_.amplitude},
        {"frequency", config_.frequency},
    };
}

std::vector<PatternPreset> WavePattern::presets() const {
    std::vector<PatternPreset> out;
    for (const auto& p : wave_presets()) out.push_back(p.info);
    return out;
}

bool WavePattern::apply_preset(int id) {
    for (const auto& p : wave_presets()) {
        if (p.info.id == id) {
            config_ = p.config;
            ripples_.clear();
            preset_ = id;
            return true;
        }
    }
    return false;
}

}
