#include "terminal/input.hpp"
#include "core/utf8.hpp"
#include <cerrno>
#include <system_error>

#include <sys/select.h>
#include <unistd.h>

namespace splash {

namespace {
    constexpr char ESC = '\033';
    constexpr size_t kMaxSequence = 32;

    InputEvent key_event(Key key, uint32_t ch = 0) {
        InputEvent ev;
        ev.type = InputType::Key;
        ev.key = key;
        ev.ch = ch;
        return ev;
    }

    bool parse_int(const std::string& s, size_t& i, size_t end, int& value) {
        const size_t start = i;
        value = 0;
        while (i < end && s[i] >= '0' && s[i] <= '9') {
            value = value * 10 + (s[i] - '0');
            if (value > 100000) return false;
            ++i;
        }
        return i > start;
    }
}

std::vector<InputEvent> InputDecoder::feed(std::string_view bytes) {
    pending_.append(bytes.data(), bytes.size());
    std::vector<InputEvent> out;

    size_t i = 0;
    while (i < pending_.size()) {
        const unsigned char c = static_cast<unsigned char>(pending_[i]);

        if (c == ESC) {
            if (i + 1 >= pending_.size()) break;   // may start a sequence still in flight
            if (pending_[i + 1] != '[') {
                out.push_back(key_event(Key::Escape));
                ++i;
                continue;
            }
            const size_t used = parse_csi(pending_, i, out);
            if (used == 0) break;
            i += used;
            continue;
        }

        if (c == 0x03) {
            out.push_back(key_event(Key::CtrlC));
        } else if (c == '\r' || c == '\n') {
            out.push_back(key_event(Key::Enter));
        } else if (c == 0x7F || c == 0x08) {
            out.push_back(key_event(Key::Backspace));
        } else if (c >= 0x80) {
            const size_t used = parse_utf8(pending_, i, out);
            if (used == 0) break;
            i += used;
            continue;
        } else if (c >= 0x20) {
            out.push_back(key_event(Key::Char, c));
        }
        ++i;
    }

    pending_.erase(0, i);
    return out;
}

std::vector<InputEvent> InputDecoder::flush() {
    std::vector<InputEvent> out;
    if (pending_escape()) {
        out.push_back(key_event(Key::Escape));
        pending_.clear();
    }
    return out;
}

size_t InputDecoder::parse_csi(const std::string& buf, size_t pos, std::vector<InputEvent>& out) {
    // buf[pos] == ESC, buf[pos + 1] == '['
    size_t end = pos + 2;
    while (end < buf.size()) {
        const unsigned char b = static_cast<unsigned char>(buf[end]);
        if (b >= 0x40 && b <= 0x7E) break;
        ++end;
    }

    if (end >= buf.size()) {
        // Garbage that never terminates is dropped instead of held forever.
        return buf.size() - pos > kMaxSequence ? buf.size() - pos : 0;
    }

    const size_t total = end - pos + 1;
    const char final_byte = buf[end];
    size_t i = pos + 2;
    if ((final_byte != 'M' && final_byte != 'm') || i >= end || buf[i] != '<') {
        return total;   // other CSI sequences (arrows, function keys) are ignored
    }
    ++i;

    int b = 0, x = 0, y = 0;
    if (!parse_int(buf, i, end, b) || i >= end || buf[i++] != ';') return total;
    if (!parse_int(buf, i, end, x) || i >= end || buf[i++] != ';') return total;
    if (!parse_int(buf, i, end, y) || i != end) return total;

    InputEvent ev;
    ev.pos = {x > 0 ? x - 1 : 0, y > 0 ? y - 1 : 0};
    ev.button = b & 3;

    if (b & 64) {
        ev.type = InputType::MouseWheel;
        ev.button = b & 1;
    } else if (b & 32) {
        ev.type = InputType::MouseMove;
    } else if (final_byte == 'm') {
        ev.type = InputType::MouseRelease;
    } else {
        ev.type = InputType::MouseClick;
    }
    out.push_back(ev);
    return total;
}

size_t InputDecoder::parse_utf8(const std::string& buf, size_t pos, std::vector<InputEvent>& out) {
    const unsigned char lead = static_cast<unsigned char>(buf[pos]);
    size_t len = 1;
    if ((lead & 0xE0) == 0xC0) len = 2;
    else if ((lead & 0xF0) == 0xE0) len = 3;
    else if ((lead & 0xF8) == 0xF0) len = 4;

    if (len > 1 && pos + len > buf.size()) return 0;

    const std::vector<uint32_t> cps = decode_utf8(std::string_view(buf).substr(pos, len));
    for (uint32_t cp : cps) out.push_back(key_event(Key::Char, cp));
    return len;
}

std::vector<InputEvent> InputReader::poll() {
    std::vector<InputEvent> events;
    if (fd_ < 0 || eof_) return events;

    const bool got_bytes = read_available(events);
    if (!decoder_.pending_escape()) {
        escape_since_.reset();
        return events;
    }

    const double now = clock_();
    if (got_bytes || !escape_since_) escape_since_ = now;
    if (eof_ || now - *escape_since_ >= ESCAPE_TIMEOUT_MS) {
        std::vector<InputEvent> flushed = decoder_.flush();
        events.insert(events.end(), flushed.begin(), flushed.end());
        escape_since_.reset();
    }
    return events;
}

bool InputReader::read_available(std::vector<InputEvent>& events) {
    bool got_bytes = false;
    char buf[256];
    for (;;) {
        timeval tv = {0, 0};
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(fd_, &fds);

        const int ready = select(fd_ + 1, &fds, nullptr, nullptr, &tv);
        if (ready < 0) {
            if (errno == EINTR) return got_bytes;
            throw std::system_error(errno, std::generic_category(), "select");
        }
        if (ready == 0) return got_bytes;

        const ssize_t n = read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return got_bytes;
            throw std::system_error(errno, std::generic_category(), "read");
        }
        if (n == 0) {
            eof_ = true;
            return got_bytes;
        }
        got_bytes = true;

        std::vector<InputEvent> decoded = decoder_.feed(std::string_view(buf, static_cast<size_t>(n)));
        events.insert(events.end(), decoded.begin(), decoded.end());
        if (static_cast<size_t>(n) < sizeof(buf)) return got_bytes;
    }
}

}
