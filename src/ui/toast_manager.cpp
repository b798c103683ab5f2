#include "ui/toast_manager.hpp"
#include "core/utf8.hpp"
#include <algorithm>
#include <cmath>

namespace splash {

namespace {
    struct ToastColors {
        Color bg;
        Color text;
        Color border;
    };

    ToastColors colors_for(ToastType type) {
        switch (type) {
            case ToastType::Success: return {{20, 40, 30}, {100, 220, 120}, {60, 140, 80}};
            case ToastType::Error: return {{45, 20, 20}, {255, 120, 120}, {180, 60, 60}};
            case ToastType::Warning: return {{45, 35, 20}, {255, 200, 100}, {160, 120, 60}};
            case ToastType::Info: break;
        }
        return {{20, 30, 45}, {120, 180, 255}, {60, 100, 160}};
    }

    bool contains(const std::vector<Rect>& rects, int x, int y) {
        return std::any_of(rects.begin(), rects.end(), [x, y](const Rect& r) {
            return x >= r.x && x < r.x + r.width && y >= r.y && y < r.y + r.height;
        });
    }
}

ToastManager::ToastManager(double default_duration_ms)
    : default_duration_ms_(default_duration_ms > 0.0 ? default_duration_ms : DEFAULT_DURATION_MS) {}

int ToastManager::show(const std::string& message, ToastType type, std::optional<double> duration_ms) {
    Toast toast;
    toast.id = next_id_++;
    toast.message = message;
    toast.type = type;
    toast.duration_ms = duration_ms.value_or(default_duration_ms_);
    toasts_.push_back(toast);

    while (toasts_.size() > MAX_TOASTS) toasts_.pop_front();
    return toast.id;
}

void ToastManager::dismiss(int id) {
    toasts_.erase(std::remove_if(toasts_.begin(), toasts_.end(),
                                 [id](const Toast& t) { return t.id == id; }),
                  toasts_.end());
}

void ToastManager::update(double now_ms) {
    if (!last_update_) {
        last_update_ = now_ms;
        return;
    }
    const double delta = std::max(0.0, now_ms - *last_update_);
    last_update_ = now_ms;

    for (Toast& t : toasts_) t.elapsed_ms += delta;
    toasts_.erase(std::remove_if(toasts_.begin(), toasts_.end(),
                                 [](const Toast& t) { return t.elapsed_ms >= t.duration_ms; }),
                  toasts_.end());
}

void ToastManager::render(FrameBuffer& fb) {
    std::vector<Rect> rects;
    const int width = std::min(MAX_WIDTH, fb.width() - 4);
    if (width >= 5) {
        const int x = fb.width() - width - 2;
        int y = 2;
        for (size_t i = 0; i < toasts_.size(); ++i) {
            // Keep clear of the status bar row.
            if (y + TOAST_HEIGHT >= fb.height() - 1) break;
            rects.push_back({x, y, width, TOAST_HEIGHT});
            y += TOAST_HEIGHT + 1;
        }
    }

    for (const Rect& old : drawn_) {
        for (int y = old.y; y < old.y + old.height; ++y) {
            for (int x = old.x; x < old.x + old.width; ++x) {
                if (!contains(rects, x, y)) fb.clear_overlay_cell(x, y);
            }
        }
    }

    for (size_t i = 0; i < rects.size(); ++i) draw_toast(fb, toasts_[i], rects[i]);
    drawn_ = std::move(rects);
}

void ToastManager::draw_toast(FrameBuffer& fb, const Toast& toast, const Rect& r) {
    const ToastColors c = colors_for(toast.type);

    const size_t max_msg = static_cast<size_t>(r.width - 4);
    const std::vector<uint32_t> msg = decode_utf8(draw::truncate(toast.message, max_msg, "..."));

    const double remaining = toast.duration_ms > 0.0
        ? std::clamp(1.0 - toast.elapsed_ms / toast.duration_ms, 0.0, 1.0) : 0.0;
    const int bar = static_cast<int>(std::floor((r.width - 2) * remaining));

    // Each cell is written once per frame so an unchanged toast emits nothing.
    for (int row = 0; row < r.height; ++row) {
        for (int col = 0; col < r.width; ++col) {
            const bool edge_row = row == 0 || row == r.height - 1;
            const bool edge_col = col == 0 || col == r.width - 1;
            Cell cell(' ', c.bg);
            if (edge_row && edge_col) {
                cell = Cell('+', c.border);
            } else if (row == r.height - 1 && col - 1 < bar) {
                cell = Cell('=', c.text);
            } else if (edge_row) {
                cell = Cell('-', c.border);
            } else if (edge_col) {
                cell = Cell('|', c.border);
            } else if (col >= 2 && static_cast<size_t>(col - 2) < msg.size()) {
                cell = Cell(msg[static_cast<size_t>(col - 2)], c.text);
            }
            fb.set_overlay(r.x + col, r.y + row, cell);
        }
    }
}

}
