#include "terminal/output.hpp"

#include <cerrno>
#include <system_error>
#include <unistd.h>

namespace splash {

FdOutput::FdOutput(int fd) : fd_(fd) {}

void FdOutput::write(const char* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        const ssize_t n = ::write(fd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "terminal write failed");
        }
        written += static_cast<size_t>(n);
    }
}

bool FdOutput::try_write(const char* data, size_t size) noexcept {
    const int saved_errno = errno;
    size_t written = 0;
    bool ok = true;
    while (written < size) {
        const ssize_t n = ::write(fd_, data + written, size - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            ok = false;
            break;
        }
        written += static_cast<size_t>(n);
    }
    errno = saved_errno;
    return ok;
}

}
