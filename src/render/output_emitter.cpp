#include "render/output_emitter.hpp"
#include "core/utf8.hpp"
#include <algorithm>
#include <charconv>
#include <system_error>

namespace splash {

namespace {
    constexpr char kDefaultForeground[] = "\033[39m";
    constexpr char kStyleReset[] = "\033[0m";
    // Rough per-record size: cursor move, truecolor sequence, 3-byte glyph, reset.
    constexpr size_t kBytesPerRecord = 40;
}

OutputEmitter::OutputEmitter(Terminal& term, ColorMode color_mode)
    : term_(term), color_mode_(color_mode) {}

bool OutputEmitter::initialize(bool mouse_enabled) {
    const TerminalInfo info = term_.get_info();

    term_.enter_alt_screen();
    term_.hide_cursor();
    term_.clear_screen();
    const bool raw = term_.enable_raw_mode();
    resize_watched_ = term_.watch_resize();

    mouse_enabled_ = mouse_enabled;
    if (mouse_enabled_) {
        term_.enable_mouse_motion();
    }

    size_ = {info.cols, info.rows};
    buffer_.resize(size_.width, size_.height);
    initialized_ = true;
    return raw;
}

size_t OutputEmitter::emit(const ChangeList& changes) {
    if (changes.empty()) return 0;

    out_buffer_.clear();
    const size_t reserve_bytes = changes.size() * kBytesPerRecord;
    if (out_buffer_.capacity() < reserve_bytes) {
        out_buffer_.reserve(reserve_bytes);
    }

    for (const ChangeRecord& change : changes) {
        append_cursor_move(change.y + 1, change.x + 1);
        append_color(change.cell.color);
        append_utf8(out_buffer_, change.cell.ch);
        out_buffer_.append(kStyleReset, sizeof(kStyleReset) - 1);
    }

    term_.output().write(out_buffer_);
    return changes.size();
}

void OutputEmitter::handle_resize(int width, int height) {
    size_ = {std::max(0, width), std::max(0, height)};
    buffer_.resize(size_.width, size_.height);
    term_.clear_screen();
}

bool OutputEmitter::poll_resize() {
    if (!term_.consume_resize()) return false;
    const Size size = term_.query_size();
    handle_resize(size.width, size.height);
    return true;
}

bool OutputEmitter::cleanup() noexcept {
    initialized_ = false;
    return term_.restore();
}

void OutputEmitter::append_string(const std::string& s) {
    out_buffer_.append(s);
}

void OutputEmitter::append_cursor_move(int row, int col) {
    out_buffer_.push_back('\033');
    out_buffer_.push_back('[');

    char tmp[16];
    auto row_res = std::to_chars(tmp, tmp + sizeof(tmp), row);
    if (row_res.ec == std::errc()) {
        out_buffer_.append(tmp, row_res.ptr);
    } else {
        out_buffer_.push_back('1');
    }

    out_buffer_.push_back(';');

    auto col_res = std::to_chars(tmp, tmp + sizeof(tmp), col);
    if (col_res.ec == std::errc()) {
        out_buffer_.append(tmp, col_res.ptr);
    } else {
        out_buffer_.push_back('1');
    }

    out_buffer_.push_back('H');
}

void OutputEmitter::append_color(const std::optional<Color>& color) {
    if (!color) {
        out_buffer_.append(kDefaultForeground, sizeof(kDefaultForeground) - 1);
        return;
    }
    const int r = std::clamp(color->r, 0, 255);
    const int g = std::clamp(color->g, 0, 255);
    const int b = std::clamp(color->b, 0, 255);
    append_string(Terminal::color_code(color_mode_, r, g, b));
}

}
