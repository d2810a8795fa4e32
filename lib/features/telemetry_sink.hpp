#pragma once

#include <nlohmann/json.hpp>
#include <cstdio>

namespace features {

/**
 * @brief Abstract interface for telemetry output
 * 
 * Template parameter allows use with any telemetry data structure.
 * Implementations handle platform-specific transport (FreeRTOS queue, stream, etc.)
 * Use NoTelemetrySink for platforms or builds without telemetry.
 * 
 * @tparam TelemetryDataT Type of telemetry data structure
 */
template<typename TelemetryDataT>
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;
    
    /**
     * @brief Hand a snapshot to the platform-specific destination (non-blocking)
     * @param data Telemetry data to send
     */
    virtual void sendTelemetry(const TelemetryDataT& data) = 0;
};

/**
 * @brief Null object implementation - does nothing
 * 
 * @tparam TelemetryDataT Type of telemetry data structure
 */
template<typename TelemetryDataT>
class NoTelemetrySink : public TelemetrySink<TelemetryDataT> {
public:
    void sendTelemetry(const TelemetryDataT& /*data*/) override {
    }
};

/**
 * @brief Writes each snapshot as one JSON Lines record to a stdio stream
 * 
 * Host-side sink. Serialization happens on the calling thread, so only use it
 * where the render loop has slack (the Linux build); the ESP32 build defers
 * serialization to a background task instead.
 * 
 * @tparam TelemetryDataT Type of telemetry data (must have a to_json function)
 */
template<typename TelemetryDataT>
class JsonLinesTelemetrySink : public TelemetrySink<TelemetryDataT> {
public:
    explicit JsonLinesTelemetrySink(FILE* stream = stderr)
        : stream_(stream) {
    }

    void sendTelemetry(const TelemetryDataT& data) override {
        nlohmann::json j = data;
        fprintf(stream_, "%s\n", j.dump().c_str());
        fflush(stream_);
    }

private:
    FILE* stream_;
};

} // namespace features
