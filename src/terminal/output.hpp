#pragma once

#include <cstddef>
#include <string>

namespace splash {

class Output {
public:
    virtual ~Output() = default;

    // Writes every byte or throws std::system_error.
    virtual void write(const char* data, size_t size) = 0;
    // Best effort for restore paths: no allocation, no exceptions.
    virtual bool try_write(const char* data, size_t size) noexcept = 0;

    void write(const std::string& s) { write(s.data(), s.size()); }
};

class FdOutput : public Output {
public:
    explicit FdOutput(int fd);

    using Output::write;
    void write(const char* data, size_t size) override;
    bool try_write(const char* data, size_t size) noexcept override;

    int fd() const { return fd_; }

private:
    int fd_;
};

}
