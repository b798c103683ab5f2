#include "core/clock.hpp"

#include <chrono>

namespace splash {

Clock steady_clock_ms() {
    const auto origin = std::chrono::steady_clock::now();
    return [origin]() {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - origin).count();
    };
}

}
