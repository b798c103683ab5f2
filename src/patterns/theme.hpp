#pragma once

#include "core/types.hpp"
#include <array>
#include <string>
#include <vector>

namespace splash {

struct Theme {
    static constexpr size_t STOPS = 6;

    std::string name;
    std::string display_name;
    std::array<Color, STOPS> colors;

    // Linear interpolation along the ramp; t is clamped to [0, 1].
    Color color_at(double t) const;
};

const std::vector<Theme>& themes();
// Unknown names fall back to the first theme (ocean).
const Theme& theme_by_name(const std::string& name);
bool is_theme_name(const std::string& name);
const Theme& next_theme(const Theme& current);

}
