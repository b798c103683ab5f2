#pragma once

#include <functional>

namespace splash {

// Monotonic milliseconds. Injected so pacing and telemetry can be driven by a fake clock.
using Clock = std::function<double()>;

Clock steady_clock_ms();

}
