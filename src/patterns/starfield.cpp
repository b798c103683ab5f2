#include "patterns/starfield.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace splash {

namespace {
    struct StarfieldPresetDef {
        PatternPreset info;
        StarfieldConfig config;
    };

    const std::vector<StarfieldPresetDef>& starfield_presets() {
        static const std::vector<StarfieldPresetDef> presets = {
            {{1, "Deep Space", "Sparse, slow-moving stars"}, {50, 0.5, 8}},
            {{2, "Warp Speed", "Hyperspace jump effect"}, {200, 3.0, 3}},
            {{3, "Asteroid Field", "Dense, medium-speed navigation"}, {150, 1.5, 10}},
            {{4, "Milky Way", "Balanced cosmic view"}, {120, 0.8, 6}},
            {{5, "Nebula Drift", "Slow, dense starfield"}, {180, 0.4, 12}},
            {{6, "Photon Torpedo", "Fast, sparse streaks"}, {80, 2.5, 4}},
        };
        return presets;
    }

    // . · * ✦ ✧ ★
    constexpr uint32_t kStarChars[] = {'.', 0x00B7, '*', 0x2726, 0x2727, 0x2605};
    constexpr double kPi = 3.14159265358979323846;
}

StarfieldPattern::StarfieldPattern(const Theme& theme, const StarfieldConfig& config, uint32_t seed)
    : theme_(&theme), config_(config), rng_(seed) {}

StarfieldPattern::Star StarfieldPattern::make_star(Size size) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    Star star;
    star.x = unit(rng_) * size.width - size.width / 2.0;
    star.y = unit(rng_) * size.height - size.height / 2.0;
    star.z = unit(rng_) * 10.0 + 1.0;
    star.speed = unit(rng_) * 0.5 + 0.5;
    return star;
}

void StarfieldPattern::render(FrameBuffer& buffer, double time_ms, Size size,
                              const std::optional<Point>& mouse) {
    current_time_ = time_ms;
    const int width = size.width;
    const int height = size.height;

    if (stars_.empty()) {
        stars_.reserve(static_cast<size_t>(std::max(0, config_.star_count)));
        for (int i = 0; i < config_.star_count; ++i) stars_.push_back(make_star(size));
    }

    const double repel = config_.mouse_repel_radius;
    for (Star& star : stars_) {
        star.z -= config_.speed * star.speed * 0.02;
        if (star.z <= 0.1) {
            star = make_star(size);
            continue;
        }

        const double scale = 10.0 / star.z;
        int sx = static_cast<int>(std::floor(star.x * scale + width / 2.0));
        int sy = static_cast<int>(std::floor(star.y * scale + height / 2.0));

        if (mouse && repel > 0.0) {
            const double dx = sx - mouse->x;
            const double dy = sy - mouse->y;
            const double dist = std::sqrt(dx * dx + dy * dy);
            if (dist > 0.0 && dist < repel) {
                const double force = (repel - dist) / repel;
                sx += static_cast<int>(std::floor(dx / dist * force * 3.0));
                sy += static_cast<int>(std::floor(dy / dist * force * 3.0));
            }
        }

        if (sx < 0 || sx >= width || sy < 0 || sy >= height) continue;

        const double depth = 1.0 / star.z;
        size_t idx = 0;
        double intensity = 0.0;
        if (depth > 0.9) {
            idx = 5;
            intensity = 1.0;
        } else if (depth > 0.7) {
            idx = 4;
            intensity = 0.85;
        } else if (depth > 0.5) {
            idx = 3;
            intensity = 0.65;
        } else if (depth > 0.3) {
            idx = 2;
            intensity = 0.45;
        } else if (depth > 0.15) {
            idx = 1;
            intensity = 0.25;
        }
        buffer.set_cell(sx, sy, Cell(kStarChars[idx], theme_->color_at(intensity)));
    }

    for (const Explosion& e : explosions_) {
        const double age = time_ms - e.time;
        if (age < 0.0 || age >= EXPLOSION_LIFETIME_MS) continue;
        const double progress = age / EXPLOSION_LIFETIME_MS;
        const double radius = progress * 10.0;
        const int brightness = static_cast<int>(255.0 * (1.0 - progress));
        for (int i = 0; i < EXPLOSION_PARTICLES; ++i) {
            const double angle = static_cast<double>(i) / EXPLOSION_PARTICLES * 2.0 * kPi;
            const int px = static_cast<int>(std::floor(e.x + std::cos(angle) * radius));
            const int py = static_cast<int>(std::floor(e.y + std::sin(angle) * radius));
            if (px < 0 || px >= width || py < 0 || py >= height) continue;
            buffer.set_cell(px, py, Cell('*', Color(brightness, brightness, brightness)));
        }
    }

    explosions_.erase(std::remove_if(explosions_.begin(), explosions_.end(),
                                     [time_ms](const Explosion& e) {
                                         return time_ms - e.time >= EXPLOSION_LIFETIME_MS;
                                     }),
                      explosions_.end());
}

void StarfieldPattern::on_mouse_click(Point pos) {
    explosions_.push_back({static_cast<double>(pos.x), static_cast<double>(pos.y), current_time_});
}

void StarfieldPattern::reset() {
    stars_.clear();
    explosions_.clear();
}

PatternMetrics StarfieldPattern::metrics() const {
    double avg = 0.0, lo = 0.0, hi = 0.0;
    if (!stars_.empty()) {
        const double sum = std::accumulate(stars_.begin(), stars_.end(), 0.0,
                                           [](double acc, const Star& s) { return acc + s.z; });
        avg = sum / stars_.size();
        auto [min_it, max_it] = std::minmax_element(
            stars_.begin(), stars_.end(),
            [](const Star& a, const Star& b) { return a.z < b.z; });
        lo = min_it->z;
        hi = max_it->z;
    }
    auto round2 = [](double v) { return std::round(v * 100.0) / 100.0; };
    return {
        {"stars", static_cast<double>(stars_.size())},
        {"explosions", static_cast<double>(explosions_.size())},
        {"avgDepth", round2(avg)},
        {"minDepth", round2(lo)},
        {"maxDepth", round2(hi)},
        {"speed", config_.speed},
        {"repelRadius", config_.mouse_repel_radius},
    };
}

std::vector<PatternPreset> StarfieldPattern::presets() const {
    std::vector<PatternPreset> out;
    for (const auto& p : starfield_presets()) out.push_back(p.info);
    return out;
}

bool StarfieldPattern::apply_preset(int id) {
    for (const auto& p : starfield_presets()) {
        if (p.info.id == id) {
            config_ = p.config;
            stars_.clear();
            preset_ = id;
            return true;
        }
    }
    return false;
}

}
