#include "render/frame_buffer.hpp"
#include "core/utf8.hpp"
#include <algorithm>

namespace splash {

FrameBuffer::FrameBuffer(int width, int height) {
    resize(width, height);
}

void FrameBuffer::clear() {
    std::fill(current_.begin(), current_.end(), Cell{});
}

void FrameBuffer::set_cell(int x, int y, const Cell& cell) {
    if (!in_bounds(x, y)) return;
    current_[index(x, y)] = cell;
}

Cell FrameBuffer::cell(int x, int y) const {
    if (!in_bounds(x, y)) return Cell{};
    return current_[index(x, y)];
}

Cell FrameBuffer::previous_cell(int x, int y) const {
    if (!in_bounds(x, y)) return Cell{};
    return previous_[index(x, y)];
}

ChangeList FrameBuffer::get_changes() {
    ChangeList changes;
    rows_to_check_.assign(static_cast<size_t>(height_), 0);

    for (int y = 0; y < height_; ++y) {
        const size_t row = index(0, y);
        for (int x = 0; x < width_; ++x) {
            if (current_[row + x] != previous_[row + x]) {
                rows_to_check_[y] = 1;
                break;
            }
        }
        if (overlay_dirty_rows_[y]) {
            rows_to_check_[y] = 1;
        }
    }

    for (int y = 0; y < height_; ++y) {
        if (!rows_to_check_[y]) continue;

        const size_t row = index(0, y);
        for (int x = 0; x < width_; ++x) {
            const size_t idx = row + x;
            const Cell& final_cell = overlay_[idx] ? *overlay_[idx] : current_[idx];
            if (overlay_touched_[idx] || final_cell != previous_[idx]) {
                changes.push_back({x, y, final_cell});
            }
        }

        if (overlay_dirty_rows_[y]) {
            std::fill(overlay_touched_.begin() + row, overlay_touched_.begin() + row + width_, 0);
            overlay_dirty_rows_[y] = 0;
        }
    }

    return changes;
}

void FrameBuffer::swap() {
    std::copy(current_.begin(), current_.end(), previous_.begin());
}

void FrameBuffer::resize(int width, int height) {
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    const size_t cells = static_cast<size_t>(width_) * static_cast<size_t>(height_);

    current_.assign(cells, Cell{});
    previous_.assign(cells, Cell{});
    overlay_.assign(cells, std::nullopt);
    overlay_touched_.assign(cells, 0);
    overlay_row_counts_.assign(static_cast<size_t>(height_), 0);
    overlay_dirty_rows_.assign(static_cast<size_t>(height_), 0);
    overlay_count_ = 0;
}

void FrameBuffer::set_overlay(int x, int y, const Cell& cell) {
    if (!in_bounds(x, y)) return;

    const size_t idx = index(x, y);
    if (overlay_[idx] && *overlay_[idx] == cell) return;
    if (!overlay_[idx]) {
        ++overlay_count_;
        ++overlay_row_counts_[y];
    }
    overlay_[idx] = cell;
    overlay_touched_[idx] = 1;
    overlay_dirty_rows_[y] = 1;
}

void FrameBuffer::set_overlay_text(int x, int y, std::string_view text,
                                   const std::optional<Color>& color) {
    if (y < 0 || y >= height_) return;

    const std::vector<uint32_t> glyphs = decode_utf8(text);
    for (size_t i = 0; i < glyphs.size(); ++i) {
        const int cx = x + static_cast<int>(i);
        if (cx >= width_) break;
        set_overlay(cx, y, Cell(glyphs[i], color));
    }
}

void FrameBuffer::remove_overlay(int x, int y) {
    const size_t idx = index(x, y);
    if (!overlay_[idx]) return;

    overlay_[idx].reset();
    --overlay_count_;
    --overlay_row_counts_[y];
    overlay_touched_[idx] = 1;
    overlay_dirty_rows_[y] = 1;
}

void FrameBuffer::clear_overlay_cell(int x, int y) {
    if (!in_bounds(x, y)) return;
    remove_overlay(x, y);
}

void FrameBuffer::clear_overlay_row(int y) {
    if (y < 0 || y >= height_ || overlay_row_counts_[y] == 0) return;
    for (int x = 0; x < width_ && overlay_row_counts_[y] > 0; ++x) {
        remove_overlay(x, y);
    }
}

void FrameBuffer::clear_all_overlays() {
    if (overlay_count_ == 0) return;
    for (int y = 0; y < height_; ++y) {
        clear_overlay_row(y);
    }
}

bool FrameBuffer::has_overlay(int x, int y) const {
    if (!in_bounds(x, y)) return false;
    return overlay_[index(x, y)].has_value();
}

}
