#include "terminal/terminal.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <sys/ioctl.h>
#include <unistd.h>

namespace splash {

namespace {
    volatile std::sig_atomic_t g_resize_pending = 0;

    void on_sigwinch(int) {
        g_resize_pending = 1;
    }

    constexpr char kEnterAlt[] = "\033[?1049h";
    constexpr char kExitAlt[] = "\033[?1049l";
    constexpr char kHideCursor[] = "\033[?25l";
    constexpr char kShowCursor[] = "\033[?25h";
    constexpr char kClear[] = "\033[2J\033[H";
    // Any-event tracking with SGR coordinates.
    constexpr char kMouseOn[] = "\033[?1003h\033[?1006h";
    constexpr char kMouseOff[] = "\033[?1006l\033[?1003l";
    constexpr char kReset[] = "\033[0m";

    const uint8_t kPalette16[16][3] = {
        {0, 0, 0}, {128, 0, 0}, {0, 128, 0}, {128, 128, 0},
        {0, 0, 128}, {128, 0, 128}, {0, 128, 128}, {192, 192, 192},
        {128, 128, 128}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
        {0, 0, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255}
    };

    struct Color256Lookup {
        std::array<uint8_t, 256> r{};
        std::array<uint8_t, 256> g{};
        std::array<uint8_t, 256> b{};

        Color256Lookup() {
            for (int i = 0; i < 16; ++i) {
                r[i] = kPalette16[i][0];
                g[i] = kPalette16[i][1];
                b[i] = kPalette16[i][2];
            }

            for (int i = 16; i < 232; ++i) {
                int idx = i - 16;
                int rv = idx / 36;
                int gv = (idx % 36) / 6;
                int bv = idx % 6;
                r[i] = rv ? static_cast<uint8_t>(55 + rv * 40) : 0;
                g[i] = gv ? static_cast<uint8_t>(55 + gv * 40) : 0;
                b[i] = bv ? static_cast<uint8_t>(55 + bv * 40) : 0;
            }

            for (int i = 232; i < 256; ++i) {
                uint8_t gray = static_cast<uint8_t>(8 + (i - 232) * 10);
                r[i] = g[i] = b[i] = gray;
            }
        }
    };

    const Color256Lookup color256_lookup;

    template <size_t N>
    void put(Output& out, const char (&seq)[N]) {
        out.write(seq, N - 1);
    }

    template <size_t N>
    bool try_put(Output& out, const char (&seq)[N]) noexcept {
        return out.try_write(seq, N - 1);
    }
}

Terminal::Terminal(Output& out, int input_fd, int size_fd)
    : out_(out), input_fd_(input_fd), size_fd_(size_fd) {}

Terminal::~Terminal() {
    restore();
}

TerminalInfo Terminal::get_info() const {
    TerminalInfo info;
    const Size size = query_size();
    info.cols = size.width;
    info.rows = size.height;
    info.color_mode = detect_color_mode();
    return info;
}

Size Terminal::query_size() const {
    Size size{80, 24};
    winsize ws{};
    if (size_fd_ >= 0 && ioctl(size_fd_, TIOCGWINSZ, &ws) == 0) {
        if (ws.ws_col > 0) size.width = ws.ws_col;
        if (ws.ws_row > 0) size.height = ws.ws_row;
    }
    return size;
}

ColorMode Terminal::detect_color_mode() {
    const char* colorterm = std::getenv("COLORTERM");
    if (colorterm) {
        std::string ct(colorterm);
        if (ct == "truecolor" || ct == "24bit") {
            return ColorMode::Truecolor;
        }
    }

    const char* term = std::getenv("TERM");
    if (term) {
        std::string t(term);
        if (t.find("256color") != std::string::npos) {
            return ColorMode::Ansi256;
        }
        if (t == "linux" || t == "vt100" || t == "ansi") {
            return ColorMode::Ansi16;
        }
    }

    return ColorMode::Truecolor;
}

void Terminal::enter_alt_screen() {
    if (in_alt_screen_) return;
    put(out_, kEnterAlt);
    in_alt_screen_ = 1;
}

void Terminal::exit_alt_screen() {
    if (!in_alt_screen_) return;
    put(out_, kExitAlt);
    in_alt_screen_ = 0;
}

void Terminal::hide_cursor() {
    if (cursor_hidden_) return;
    put(out_, kHideCursor);
    cursor_hidden_ = 1;
}

void Terminal::show_cursor() {
    if (!cursor_hidden_) return;
    put(out_, kShowCursor);
    cursor_hidden_ = 0;
}

void Terminal::clear_screen() {
    put(out_, kClear);
}

bool Terminal::enable_raw_mode() {
    if (raw_mode_) return true;
    if (input_fd_ < 0 || !isatty(input_fd_)) return false;
    if (tcgetattr(input_fd_, &original_termios_) != 0) return false;

    termios raw = original_termios_;
    raw.c_iflag &= ~static_cast<tcflag_t>(ICRNL | IXON);
    raw.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(input_fd_, TCSANOW, &raw) != 0) return false;

    raw_mode_ = 1;
    return true;
}

bool Terminal::disable_raw_mode() {
    if (!raw_mode_) return true;
    if (tcsetattr(input_fd_, TCSANOW, &original_termios_) != 0) return false;
    raw_mode_ = 0;
    return true;
}

void Terminal::enable_mouse_motion() {
    if (mouse_enabled_) return;
    put(out_, kMouseOn);
    mouse_enabled_ = 1;
}

void Terminal::disable_mouse_motion() {
    if (!mouse_enabled_) return;
    put(out_, kMouseOff);
    mouse_enabled_ = 0;
}

bool Terminal::watch_resize() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_sigwinch;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    return sigaction(SIGWINCH, &sa, nullptr) == 0;
}

bool Terminal::consume_resize() {
    if (!g_resize_pending) return false;
    g_resize_pending = 0;
    return true;
}

bool Terminal::restore() noexcept {
    bool ok = true;
    if (in_alt_screen_) {
        ok = try_put(out_, kReset) && ok;
        ok = try_put(out_, kClear) && ok;
    }
    if (mouse_enabled_) {
        mouse_enabled_ = 0;
        ok = try_put(out_, kMouseOff) && ok;
    }
    if (cursor_hidden_) {
        cursor_hidden_ = 0;
        ok = try_put(out_, kShowCursor) && ok;
    }
    if (in_alt_screen_) {
        in_alt_screen_ = 0;
        ok = try_put(out_, kExitAlt) && ok;
    }
    if (raw_mode_) {
        raw_mode_ = 0;
        ok = tcsetattr(input_fd_, TCSANOW, &original_termios_) == 0 && ok;
    }
    return ok;
}

std::string Terminal::color_code(ColorMode mode, int r, int g, int b) {
    char buf[32];
    switch (mode) {
        case ColorMode::Ansi16: {
            int idx = rgb_to_16(r, g, b);
            int code = idx < 8 ? 30 + idx : 90 + (idx - 8);
            snprintf(buf, sizeof(buf), "\033[%dm", code);
            return buf;
        }
        case ColorMode::Ansi256:
            snprintf(buf, sizeof(buf), "\033[38;5;%dm", rgb_to_256(r, g, b));
            return buf;
        case ColorMode::Truecolor:
            snprintf(buf, sizeof(buf), "\033[38;2;%d;%d;%dm", r, g, b);
            return buf;
    }
    return "";
}

uint8_t Terminal::rgb_to_256(int r, int g, int b) {
    uint8_t best_idx = 0;
    uint32_t best_dist = UINT32_MAX;

    for (int i = 0; i < 256; ++i) {
        int dr = r - color256_lookup.r[i];
        int dg = g - color256_lookup.g[i];
        int db = b - color256_lookup.b[i];
        uint32_t dist = static_cast<uint32_t>(dr*dr + dg*dg + db*db);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = static_cast<uint8_t>(i);
        }
    }

    return best_idx;
}

uint8_t Terminal::rgb_to_16(int r, int g, int b) {
    uint8_t best_idx = 0;
    uint32_t best_dist = UINT32_MAX;

    for (int i = 0; i < 16; ++i) {
        int dr = r - kPalette16[i][0];
        int dg = g - kPalette16[i][1];
        int db = b - kPalette16[i][2];
        uint32_t dist = static_cast<uint32_t>(dr*dr + dg*dg + db*db);
        if (dist < best_dist) {
            best_dist = dist;
            best_idx = static_cast<uint8_t>(i);
        }
    }

    return best_idx;
}

}
