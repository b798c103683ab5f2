#include "patterns/plasma.hpp"
#include <algorithm>
#include <cmath>

namespace splash {

namespace {
    // █ ▓ ▒ ░ ▪ ▫ · and blank
    constexpr uint32_t kPlasmaChars[] = {0x2588, 0x2593, 0x2592, 0x2591, 0x25AA, 0x25AB, 0x00B7, ' '};
    constexpr size_t kPlasmaCount = sizeof(kPlasmaChars) / sizeof(kPlasmaChars[0]);
}

void PlasmaPattern::render(FrameBuffer& buffer, double time_ms, Size size,
                           const std::optional<Point>&) {
    const double t = time_ms * config_.speed / 1000.0;
    const double f = config_.frequency;
    const double k = config_.complexity;

    for (int y = 0; y < size.height; ++y) {
        const double ny = static_cast<double>(y) / size.height;
        for (int x = 0; x < size.width; ++x) {
            const double nx = static_cast<double>(x) / size.width;

            double value = std::sin((nx * 10.0 * f + t) * k);
            value += std::sin((ny * 10.0 * f + t * 0.8) * k);
            value += std::sin(((nx + ny) * 7.0 * f + t * 1.2) * k);
            const double dx = nx - 0.5;
            const double dy = ny - 0.5;
            value += std::sin((std::sqrt(dx * dx + dy * dy) * 15.0 * f - t * 1.5) * k);

            const double intensity = std::clamp((value / 4.0 + 1.0) / 2.0, 0.0, 1.0);
            size_t idx = static_cast<size_t>(std::floor(intensity * (kPlasmaCount - 1)));
            idx = std::min(idx, kPlasmaCount - 1);
            buffer.set_cell(x, y, Cell(kPlasmaChars[idx], theme_->color_at(intensity)));
        }
    }
}

PatternMetrics PlasmaPattern::metrics() const {
    return {{"waves", 4.0}, {"complexity", config_.complexity}};
}

}
