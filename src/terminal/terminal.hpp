#pragma once

#include "core/types.hpp"
#include "terminal/output.hpp"
#include <csignal>
#include <cstdint>
#include <string>
#include <termios.h>

namespace splash {

enum class ColorMode {
    Ansi16,
    Ansi256,
    Truecolor
};

struct TerminalInfo {
    int cols = 80;
    int rows = 24;
    ColorMode color_mode = ColorMode::Truecolor;
};

// Escape-sequence level control of the controlling terminal. All output goes
// through the Output device; restore() is async-signal-safe so it can run
// from fatal signal and terminate handlers.
class Terminal {
public:
    explicit Terminal(Output& out, int input_fd = 0, int size_fd = 1);
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    TerminalInfo get_info() const;
    Size query_size() const;
    static ColorMode detect_color_mode();

    void enter_alt_screen();
    void exit_alt_screen();
    void hide_cursor();
    void show_cursor();
    void clear_screen();
    bool enable_raw_mode();
    bool disable_raw_mode();
    void enable_mouse_motion();
    void disable_mouse_motion();

    // SIGWINCH sets a flag; consume_resize() reads and clears it.
    bool watch_resize();
    bool consume_resize();

    // Leaves every mode this object entered. Returns false if a write failed.
    bool restore() noexcept;

    Output& output() { return out_; }

    static std::string color_code(ColorMode mode, int r, int g, int b);
    static uint8_t rgb_to_256(int r, int g, int b);
    static uint8_t rgb_to_16(int r, int g, int b);

private:
    Output& out_;
    int input_fd_;
    int size_fd_;
    termios original_termios_{};
    volatile std::sig_atomic_t raw_mode_ = 0;
    volatile std::sig_atomic_t in_alt_screen_ = 0;
    volatile std::sig_atomic_t cursor_hidden_ = 0;
    volatile std::sig_atomic_t mouse_enabled_ = 0;
};

}
