#pragma once

#include <cstdint>

#ifdef PLATFORM_ESP32
#include <esp_timer.h>
#else
#include <chrono>
#endif

namespace platform {

/**
 * @brief Monotonic microsecond counter used for render timing
 *
 * Wraps every ~71 minutes; callers only ever subtract two nearby readings.
 */
inline uint32_t microsNow() {
#ifdef PLATFORM_ESP32
    return static_cast<uint32_t>(esp_timer_get_time());
#else
    using namespace std::chrono;
    return static_cast<uint32_t>(
        duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
#endif
}

using MicrosClock = uint32_t (*)();

} // namespace platform
