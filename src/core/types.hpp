#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace splash {

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
};

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// Channels are not clamped here; OutputEmitter clamps at emission.
struct Color {
    int r = 0, g = 0, b = 0;

    Color() = default;
    Color(int r, int g, int b) : r(r), g(g), b(b) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

struct Cell {
    uint32_t ch = ' ';
    std::optional<Color> color;

    Cell() = default;
    Cell(uint32_t ch) : ch(ch) {}
    Cell(uint32_t ch, const Color& color) : ch(ch), color(color) {}
    Cell(uint32_t ch, const std::optional<Color>& color) : ch(ch), color(color) {}

    // An absent color renders as the terminal default, so it never equals black.
    bool operator==(const Cell& other) const {
        return ch == other.ch && color == other.color;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

struct ChangeRecord {
    int x = 0;
    int y = 0;
    Cell cell;
};

using ChangeList = std::vector<ChangeRecord>;

}
