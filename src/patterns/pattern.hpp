#pragma once

#include "core/types.hpp"
#include "patterns/theme.hpp"
#include "render/frame_buffer.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace splash {

struct PatternPreset {
    int id = 0;
    std::string name;
    std::string description;
};

using PatternMetrics = std::map<std::string, double>;

// A visual effect driven by the Scheduler. render() must not assume the
// buffer is at least `size`: writes outside the buffer are dropped by
// FrameBuffer, and any size including zero has to be tolerated.
class Pattern {
public:
    virtual ~Pattern() = default;

    virtual std::string name() const = 0;
    virtual void render(FrameBuffer& buffer, double time_ms, Size size,
                        const std::optional<Point>& mouse) = 0;
    virtual void reset() = 0;

    virtual void set_theme(const Theme&) {}
    virtual void on_mouse_move(Point) {}
    virtual void on_mouse_click(Point) {}
    virtual PatternMetrics metrics() const { return {}; }
    virtual std::vector<PatternPreset> presets() const { return {}; }
    virtual bool apply_preset(int) { return false; }
    virtual int current_preset() const { return 0; }
};

}
