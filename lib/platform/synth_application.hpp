#pragma once

#include <synth_config.hpp>
#include <engine.hpp>
#include <control_channel.hpp>
#include <hardware_ring_buffer.hpp>
#include <render_cycle.hpp>
#include <telemetry_sink.hpp>
#include <audio_stats.hpp>
#include <log.hpp>
#include <memory>
#include <utility>

namespace platform {

/**
 * @brief Platform-agnostic synthesizer application
 *
 * Wires the engine, the control channel, the DMA ring and the render cycle
 * together from one SynthConfig. Platform code supplies the control producer
 * (stdin, demo task, ...) and the audio transport; everything between them
 * lives here and is identical on Linux and ESP32.
 */
class SynthApplication {
public:
    /**
     * @param config Validated before anything is built
     * @param telemetry Destination for render statistics (nullptr disables)
     * @param coreId Core reported in telemetry
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit SynthApplication(const SynthConfig& config,
                              std::unique_ptr<features::TelemetrySink<AudioStats>> telemetry = nullptr,
                              uint8_t coreId = 0)
        : config_(validated(config))
        , engine_(config_.engineSettings())
        , channel_(config_.channelCapacity)
        , ring_(config_.ringConfig())
        , telemetry_(std::move(telemetry))
        , coreId_(coreId) {

        auto ends = channel_.split();
        producer_ = std::move(ends.first);
        cycle_ = std::make_unique<audio::RenderCycle>(
            engine_, std::move(ends.second), config_.format, ring_.maxDescriptorLength());

        if (!telemetry_) {
            telemetry_ = std::make_unique<features::NoTelemetrySink<AudioStats>>();
        }

        logInfo("Synthesizer ready: %d voices, %.0f Hz, %d-bit samples in %d-byte slots",
                config_.voiceCount, config_.sampleRate,
                config_.format.bitsPerSample, config_.format.slotBytes);
    }

    SynthApplication(const SynthApplication&) = delete;
    SynthApplication& operator=(const SynthApplication&) = delete;

    /**
     * @brief Hand the producer end of the control channel to the input context
     *
     * Only the first call returns a connected producer.
     */
    control::ControlProducer takeProducer() {
        if (!producer_.isConnected()) {
            logWarn("Control producer already taken");
        }
        return std::move(producer_);
    }

    /**
     * @brief Fill the whole ring with rendered audio before playback starts
     */
    size_t prime() {
        return cycle_->prime(ring_);
    }

    /**
     * @brief One iteration of the playback loop
     *
     * Hands the next filled descriptor to the transport, whose transfer()
     * blocks until the hardware accepts it, then refills every window that
     * became available.
     *
     * @tparam Sink Anything with transfer(const uint8_t* data, size_t bytes)
     */
    template<typename Sink>
    void pump(Sink& sink) {
        if (ring_.transferPending()) {
            audio::Window window = ring_.transferWindow();
            sink.transfer(ring_.data() + window.offset, window.length);
            ring_.completeTransfer();
        }

        while (ring_.windowAvailable()) {
            if (cycle_->fill(ring_) == 0) {
                break;
            }
            cyclesSinceTelemetry_++;
        }

        if (cyclesSinceTelemetry_ >= config_.telemetryInterval) {
            cyclesSinceTelemetry_ = 0;
            telemetry_->sendTelemetry(cycle_->takeStats(coreId_));
        }
    }

    const SynthConfig& getConfig() const { return config_; }
    const synth::Engine& getEngine() const { return engine_; }
    const audio::HardwareRingBuffer& getRing() const { return ring_; }
    audio::RenderCycle& getRenderCycle() { return *cycle_; }

private:
    static const SynthConfig& validated(const SynthConfig& config) {
        config.validate();
        return config;
    }

    SynthConfig config_;
    synth::Engine engine_;
    control::ControlChannel channel_;
    control::ControlProducer producer_;
    audio::HardwareRingBuffer ring_;
    std::unique_ptr<audio::RenderCycle> cycle_;
    std::unique_ptr<features::TelemetrySink<AudioStats>> telemetry_;
    uint8_t coreId_;
    uint32_t cyclesSinceTelemetry_ = 0;
};

} // namespace platform
