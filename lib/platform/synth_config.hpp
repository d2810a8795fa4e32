#pragma once

#include <engine.hpp>
#include <hardware_ring_buffer.hpp>
#include <sample_format.hpp>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace platform {

/**
 * @brief Every build/configuration time constant of the synthesizer
 *
 * Defaults describe the reference board: three voices into a 16-bit stereo
 * I2S DAC through a 2052-byte, 3-descriptor DMA ring.
 */
struct SynthConfig {
    uint8_t voiceCount = 3;
    float sampleRate = 44100.0f;
    float defaultFrequency = 77.0f;
    float defaultVolume = 0.9f;
    float masterGain = 0.85f;
    float volumeSmoothing = 0.99f;
    float minFrequency = 20.0f;
    float maxFrequency = 20000.0f;

    size_t channelCapacity = 8;

    size_t ringBufferBytes = 2052;
    size_t descriptorCount = audio::DEFAULT_DESCRIPTOR_COUNT;
    size_t smallBufferThreshold = audio::DEFAULT_SMALL_BUFFER_THRESHOLD;
    audio::SampleFormat format = audio::SampleFormat::pcm16();

    uint32_t telemetryInterval = 1000;  // Render cycles between snapshots

    /**
     * @brief Reject any configuration that could not play correctly
     * @throws std::invalid_argument naming the first violated rule
     */
    void validate() const {
        if (voiceCount == 0 || voiceCount > synth::Engine::MAX_VOICES) {
            throw std::invalid_argument("Voice count must be between 1 and "
                + std::to_string(synth::Engine::MAX_VOICES));
        }
        if (!(sampleRate >= synth::Engine::MIN_SAMPLE_RATE) || !std::isfinite(sampleRate)) {
            throw std::invalid_argument("Sample rate must be at least 8000 Hz");
        }
        if (!(defaultVolume >= 0.0f && defaultVolume <= 1.0f)) {
            throw std::invalid_argument("Default volume must be within [0, 1]");
        }
        if (!(masterGain >= 0.0f && masterGain <= 1.0f)) {
            throw std::invalid_argument("Master gain must be within [0, 1]");
        }
        if (!(volumeSmoothing >= 0.0f && volumeSmoothing < 1.0f)) {
            throw std::invalid_argument("Volume smoothing must be within [0, 1)");
        }
        if (!(minFrequency > 0.0f && minFrequency <= maxFrequency)) {
            throw std::invalid_argument("Frequency range must be positive and ordered");
        }
        if (channelCapacity == 0) {
            throw std::invalid_argument("Control channel capacity must be positive");
        }
        if (!format.isValid()) {
            throw std::invalid_argument("Sample format must use 2 or 4 byte slots holding 8 to 32 bits");
        }
        if (telemetryInterval == 0) {
            throw std::invalid_argument("Telemetry interval must be positive");
        }
        std::string ringError = ringConfig().validate();
        if (!ringError.empty()) {
            throw std::invalid_argument("Invalid ring buffer configuration: " + ringError);
        }
    }

    synth::EngineSettings engineSettings() const {
        synth::EngineSettings settings;
        settings.voiceCount = voiceCount;
        settings.sampleRate = sampleRate;
        settings.defaultFrequency = defaultFrequency;
        settings.defaultVolume = defaultVolume;
        settings.masterGain = masterGain;
        settings.volumeSmoothing = volumeSmoothing;
        settings.minFrequency = minFrequency;
        settings.maxFrequency = maxFrequency;
        return settings;
    }

    audio::RingBufferConfig ringConfig() const {
        audio::RingBufferConfig ring;
        ring.totalBytes = ringBufferBytes;
        ring.frameBytes = format.frameBytes();
        ring.descriptorCount = descriptorCount;
        ring.smallBufferThreshold = smallBufferThreshold;
        return ring;
    }

    /**
     * @brief Frames carried by one descriptor (the DMA buffer length)
     */
    size_t descriptorFrames() const {
        return ringBufferBytes / descriptorCount / format.frameBytes();
    }
};

} // namespace platform
