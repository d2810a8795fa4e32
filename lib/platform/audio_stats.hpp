#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace platform {

/**
 * @brief Telemetry for the render cycle
 * 
 * Timing of drain + render + pack against the playback duration of one
 * window, plus the health counters of the windowing path. A deadline miss is
 * an audible underrun on the DAC; it is reported here, never raised.
 */
struct AudioStats {
    uint32_t cycleCount;           // Render cycles since the last snapshot
    uint32_t messagesApplied;      // Control messages drained in those cycles
    uint32_t avgCycleTime;         // Average cycle time in microseconds
    uint32_t maxCycleTime;         // Maximum cycle time in microseconds
    uint32_t windowDuration;       // Playback duration of the last window in microseconds
    uint32_t deadlineMissCount;    // Total cycles slower than their window
    uint32_t stalledWindowCount;   // Total windows shorter than one frame
    uint32_t ignoredMessageCount;  // Total messages the engine absorbed as no-ops
    uint64_t bytesRendered;        // Total bytes handed to the ring
    uint8_t coreId;                // CPU core running the render context
};

/**
 * @brief JSON serialization for AudioStats
 */
inline void to_json(nlohmann::json& j, const AudioStats& s) {
    j = nlohmann::json{
        {"type", "render"},
        {"cycleCount", s.cycleCount},
        {"messagesApplied", s.messagesApplied},
        {"avgCycleTime", s.avgCycleTime},
        {"maxCycleTime", s.maxCycleTime},
        {"windowDuration", s.windowDuration},
        {"deadlineMissCount", s.deadlineMissCount},
        {"stalledWindowCount", s.stalledWindowCount},
        {"ignoredMessageCount", s.ignoredMessageCount},
        {"bytesRendered", s.bytesRendered},
        {"coreId", s.coreId}
    };
}

} // namespace platform
