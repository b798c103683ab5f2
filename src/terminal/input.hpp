#pragma once

#include "core/clock.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace splash {

enum class Key {
    None,
    Char,       // printable code point in InputEvent::ch
    Escape,
    Enter,
    Backspace,
    CtrlC
};

enum class InputType {
    Key,
    MouseMove,
    MouseClick,
    MouseRelease,
    MouseWheel
};

struct InputEvent {
    InputType type = InputType::Key;
    Key key = Key::None;
    uint32_t ch = 0;
    Point pos;          // 0-based cell position for mouse events
    int button = 0;     // 0 left, 1 middle, 2 right; wheel: 0 up, 1 down

    bool is_char(uint32_t c) const { return type == InputType::Key && key == Key::Char && ch == c; }
};

// Turns raw terminal bytes into key and SGR (1006) mouse events. An escape
// sequence split across two reads is held until the rest arrives. That
// includes a lone ESC at the end of a chunk, which only becomes the Escape key
// through flush().
class InputDecoder {
public:
    std::vector<InputEvent> feed(std::string_view bytes);
    // Reports a held lone ESC as the Escape key.
    std::vector<InputEvent> flush();

    bool has_pending() const { return !pending_.empty(); }
    bool pending_escape() const { return pending_.size() == 1 && pending_[0] == '\033'; }

private:
    // Returns bytes consumed, or 0 if the sequence at `pos` is incomplete.
    size_t parse_csi(const std::string& buf, size_t pos, std::vector<InputEvent>& out);
    size_t parse_utf8(const std::string& buf, size_t pos, std::vector<InputEvent>& out);

    std::string pending_;
};

// Non-blocking reads from a descriptor (select with zero timeout). A lone ESC
// becomes the Escape key once ESCAPE_TIMEOUT_MS pass with no further bytes.
class InputReader {
public:
    static constexpr double ESCAPE_TIMEOUT_MS = 50.0;

    explicit InputReader(int fd = 0, Clock clock = steady_clock_ms())
        : fd_(fd), clock_(std::move(clock)) {}

    // Throws std::system_error on a read error other than EINTR/EAGAIN.
    std::vector<InputEvent> poll();
    bool eof() const { return eof_; }

private:
    // Returns true if any bytes were read.
    bool read_available(std::vector<InputEvent>& events);

    int fd_;
    bool eof_ = false;
    Clock clock_;
    std::optional<double> escape_since_;
    InputDecoder decoder_;
};

// Passes at most one pointer move per interval.
class MoveThrottle {
public:
    static constexpr double DEFAULT_INTERVAL_MS = 16.0;

    explicit MoveThrottle(double interval_ms = DEFAULT_INTERVAL_MS) : interval_ms_(interval_ms) {}

    bool accept(double now_ms) {
        if (last_ && now_ms - *last_ < interval_ms_) return false;
        last_ = now_ms;
        return true;
    }

private:
    double interval_ms_;
    std::optional<double> last_;
};

}
