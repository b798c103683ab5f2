#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace splash {

// Double-buffered cell grid with a sparse overlay layer.
//
// `current` is redrawn by the active pattern every frame, `previous` is the
// snapshot taken by the last swap(). Overlay cells persist across frames and
// take priority over `current` when the diff is composited. Out-of-bounds
// writes are ignored everywhere.
class FrameBuffer {
public:
    FrameBuffer() = default;
    FrameBuffer(int width, int height);

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }

    void clear();
    void set_cell(int x, int y, const Cell& cell);
    Cell cell(int x, int y) const;
    Cell previous_cell(int x, int y) const;

    // Composited diff against `previous`. Consumes the overlay dirty state.
    ChangeList get_changes();
    void swap();
    void resize(int width, int height);

    void set_overlay(int x, int y, const Cell& cell);
    void set_overlay_text(int x, int y, std::string_view text,
                          const std::optional<Color>& color = std::nullopt);
    void clear_overlay_cell(int x, int y);
    void clear_overlay_row(int y);
    void clear_all_overlays();
    bool has_overlay(int x, int y) const;
    size_t overlay_count() const { return overlay_count_; }

private:
    bool in_bounds(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }
    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }
    void remove_overlay(int x, int y);

    int width_ = 0;
    int height_ = 0;
    std::vector<Cell> current_;
    std::vector<Cell> previous_;

    std::vector<std::optional<Cell>> overlay_;
    std::vector<int> overlay_row_counts_;
    std::vector<uint8_t> overlay_dirty_rows_;
    // Positions whose overlay was set or removed since the last diff. The
    // terminal may show content that `previous` does not know about there.
    std::vector<uint8_t> overlay_touched_;
    size_t overlay_count_ = 0;

    std::vector<uint8_t> rows_to_check_;
};

}
