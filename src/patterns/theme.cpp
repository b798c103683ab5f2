#include "patterns/theme.hpp"
#include <algorithm>
#include <cmath>

namespace splash {

Color Theme::color_at(double t) const {
    if (std::isnan(t)) t = 0.0;
    t = std::clamp(t, 0.0, 1.0);

    const double pos = t * static_cast<double>(STOPS - 1);
    const size_t i1 = static_cast<size_t>(std::floor(pos));
    const size_t i2 = std::min(i1 + 1, STOPS - 1);
    const double blend = pos - static_cast<double>(i1);

    const Color& a = colors[i1];
    const Color& b = colors[i2];
    auto mix = [blend](int x, int y) {
        return static_cast<int>(std::lround(x + (y - x) * blend));
    };
    return {mix(a.r, b.r), mix(a.g, b.g), mix(a.b, b.b)};
}

const std::vector<Theme>& themes() {
    static const std::vector<Theme> all = {
        {"ocean", "Ocean", {{
            {0, 32, 64}, {0, 64, 128}, {0, 128, 192},
            {0, 192, 255}, {128, 224, 255}, {200, 240, 255}}}},
        {"matrix", "Matrix", {{
            {0, 32, 0}, {0, 64, 0}, {0, 128, 0},
            {0, 192, 0}, {64, 255, 64}, {200, 255, 200}}}},
        {"starlight", "Starlight", {{
            {16, 0, 48}, {48, 0, 96}, {64, 32, 128},
            {96, 64, 192}, {128, 128, 255}, {200, 200, 255}}}},
        {"fire", "Fire", {{
            {64, 0, 0}, {128, 0, 0}, {192, 32, 0},
            {255, 96, 0}, {255, 192, 0}, {255, 255, 128}}}},
        {"monochrome", "Monochrome", {{
            {0, 0, 0}, {64, 64, 64}, {128, 128, 128},
            {192, 192, 192}, {224, 224, 224}, {255, 255, 255}}}},
    };
    return all;
}

const Theme& theme_by_name(const std::string& name) {
    for (const Theme& theme : themes()) {
        if (theme.name == name) return theme;
    }
    return themes().front();
}

bool is_theme_name(const std::string& name) {
    const auto& all = themes();
    return std::any_of(all.begin(), all.end(),
                       [&](const Theme& t) { return t.name == name; });
}

const Theme& next_theme(const Theme& current) {
    const auto& all = themes();
    for (size_t i = 0; i < all.size(); ++i) {
        if (all[i].name == current.name) return all[(i + 1) % all.size()];
    }
    return all.front();
}

}
