#ifndef ENGINE_HPP
#define ENGINE_HPP

#include "voice.hpp"
#include "output_processor.hpp"
#include <message.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace synth {

/**
 * @brief Construction-time parameters of the Engine
 */
struct EngineSettings {
    uint8_t voiceCount = 3;
    float sampleRate = 44100.0f;
    float defaultFrequency = 77.0f;
    float defaultVolume = 0.9f;
    float masterGain = 0.85f;        // Headroom after normalization
    float volumeSmoothing = 0.99f;   // One-pole coefficient, 0 = immediate
    float minFrequency = 20.0f;
    float maxFrequency = 20000.0f;   // Additionally capped at Nyquist
};

/**
 * @brief Synth-wide render state: a fixed set of voices plus the shared output chain
 *
 * The Engine is owned by the render context. Other contexts influence it only
 * through control::Message values delivered by the ControlChannel.
 *
 * Contract:
 * - processMessage() is total over every Message variant and never fails.
 *   Out-of-range indices, a missing selection and non-finite payloads are
 *   silently absorbed (counted in getIgnoredMessageCount()).
 * - render() runs in time linear in count * voiceCount, never allocates and
 *   never blocks. Every sample it writes lies in [-1.0, 1.0].
 */
class Engine {
public:
    static constexpr uint8_t MAX_VOICES = 16;
    static constexpr float MIN_SAMPLE_RATE = 8000.0f;

    /**
     * @throws std::invalid_argument if voiceCount is 0 or above MAX_VOICES,
     *         or the sample rate is below MIN_SAMPLE_RATE
     */
    explicit Engine(const EngineSettings& settings = EngineSettings());

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Apply one control message to the engine state
     */
    void processMessage(const control::Message& msg);

    /**
     * @brief Render exactly count stereo frames into destination
     *
     * Each frame is the sum of every voice's stereo tick divided by the fixed
     * voice count (so all voices at full volume cannot clip), scaled by the
     * master gain, then passed through the shared output chain.
     */
    void render(StereoFrame* destination, size_t count);

    uint8_t getVoiceCount() const { return static_cast<uint8_t>(voices_.size()); }

    /**
     * @brief Read-only view of a voice (diagnostics, UI mirrors, tests)
     * @param index Must be < getVoiceCount()
     */
    const Voice& getVoice(uint8_t index) const { return voices_[index]; }

    bool hasSelection() const { return hasSelection_; }
    uint8_t getSelectedVoice() const { return selectedVoice_; }
    float getSampleRate() const { return sampleRate_; }
    float getMasterGain() const { return masterGain_; }
    uint32_t getIgnoredMessageCount() const { return ignoredMessages_; }

    const OutputProcessor& getOutputProcessor() const { return output_; }

private:
    Voice* selectedVoice();
    bool acceptValue(float value);
    float clampFrequency(float hz) const;

    std::vector<Voice> voices_;
    bool hasSelection_ = false;
    uint8_t selectedVoice_ = 0;
    float sampleRate_;
    float normalization_;
    float masterGain_;
    float minFrequency_;
    float maxFrequency_;
    OutputProcessor output_;
    uint32_t ignoredMessages_ = 0;
};

} // namespace synth

#endif // ENGINE_HPP
