#pragma once

#include "core/types.hpp"
#include "render/frame_buffer.hpp"
#include "ui/draw.hpp"
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace splash {

enum class ToastType {
    Success,
    Error,
    Info,
    Warning
};

struct Toast {
    int id = 0;
    std::string message;
    ToastType type = ToastType::Info;
    double duration_ms = 0.0;
    double elapsed_ms = 0.0;
};

// Short-lived notifications stacked in the top-right corner. Each toast is a
// bordered 3-row box whose bottom edge doubles as a countdown bar.
class ToastManager {
public:
    static constexpr size_t MAX_TOASTS = 3;
    static constexpr double DEFAULT_DURATION_MS = 3000.0;
    static constexpr int TOAST_HEIGHT = 3;
    static constexpr int MAX_WIDTH = 40;

    explicit ToastManager(double default_duration_ms = DEFAULT_DURATION_MS);

    int show(const std::string& message, ToastType type = ToastType::Info,
             std::optional<double> duration_ms = std::nullopt);
    int success(const std::string& message) { return show(message, ToastType::Success); }
    int error(const std::string& message) { return show(message, ToastType::Error); }
    int info(const std::string& message) { return show(message, ToastType::Info); }
    int warning(const std::string& message) { return show(message, ToastType::Warning); }

    void dismiss(int id);
    void clear() { toasts_.clear(); }

    // Advances timers; the first call only sets the time reference.
    void update(double now_ms);

    bool has_toasts() const { return !toasts_.empty(); }
    size_t count() const { return toasts_.size(); }
    const std::deque<Toast>& toasts() const { return toasts_; }

    // Draws the current stack and clears cells left over from the previous
    // draw. Call after update() every frame.
    void render(FrameBuffer& fb);
    // Forget drawn regions after a resize dropped every overlay.
    void invalidate() { drawn_.clear(); }

private:
    void draw_toast(FrameBuffer& fb, const Toast& toast, const Rect& r);

    double default_duration_ms_;
    std::deque<Toast> toasts_;
    int next_id_ = 1;
    std::optional<double> last_update_;
    std::vector<Rect> drawn_;
};

}
