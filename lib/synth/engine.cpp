#include "engine.hpp"
#include <log.hpp>
#include <cmath>
#include <stdexcept>

namespace synth {

namespace {

inline float clampSample(float sample) {
    if (sample > 1.0f) return 1.0f;
    if (sample < -1.0f) return -1.0f;
    if (sample != sample) return 0.0f;  // NaN from an unstable filter setting
    return sample;
}

} // namespace

Engine::Engine(const EngineSettings& settings)
    : sampleRate_(settings.sampleRate)
    , normalization_(1.0f)
    , masterGain_(settings.masterGain)
    , minFrequency_(settings.minFrequency)
    , maxFrequency_(settings.maxFrequency)
    , output_(settings.sampleRate)
{
    if (settings.voiceCount == 0 || settings.voiceCount > MAX_VOICES) {
        throw std::invalid_argument("Engine voice count must be between 1 and 16");
    }
    if (!(settings.sampleRate >= MIN_SAMPLE_RATE) || !std::isfinite(settings.sampleRate)) {
        throw std::invalid_argument("Engine sample rate must be at least 8000 Hz");
    }

    float nyquist = sampleRate_ * 0.5f;
    if (maxFrequency_ > nyquist) maxFrequency_ = nyquist;
    if (minFrequency_ < 0.0f) minFrequency_ = 0.0f;
    if (minFrequency_ > maxFrequency_) minFrequency_ = maxFrequency_;

    // Fixed normalization by the voice count, not by the number of active voices
    normalization_ = 1.0f / static_cast<float>(settings.voiceCount);

    // All voices are created up front; the render path never allocates
    voices_.reserve(settings.voiceCount);
    for (uint8_t i = 0; i < settings.voiceCount; ++i) {
        voices_.emplace_back(clampFrequency(settings.defaultFrequency),
                             sampleRate_,
                             settings.defaultVolume,
                             settings.volumeSmoothing);
    }

    logInfo("Engine ready: %d voices at %.0f Hz, normalization 1/%d, master gain %.2f",
            settings.voiceCount, sampleRate_, settings.voiceCount, masterGain_);
}

void Engine::processMessage(const control::Message& msg) {
    using Type = control::Message::Type;

    switch (msg.type) {
        case Type::SelectVoice:
            if (msg.index < voices_.size()) {
                selectedVoice_ = msg.index;
                hasSelection_ = true;
            } else {
                ignoredMessages_++;
            }
            break;

        case Type::ClearSelection:
            hasSelection_ = false;
            break;

        case Type::ToggleVoice:
            if (msg.index < voices_.size()) {
                Voice& voice = voices_[msg.index];
                voice.setActive(!voice.isActive());
            } else {
                ignoredMessages_++;
            }
            break;

        case Type::SetFrequency: {
            Voice* voice = selectedVoice();
            if (voice != nullptr && acceptValue(msg.value)) {
                voice->setFrequency(clampFrequency(msg.value));
            }
            break;
        }

        case Type::SetVolume: {
            Voice* voice = selectedVoice();
            if (voice != nullptr && acceptValue(msg.value)) {
                voice->setVolume(msg.value);
            }
            break;
        }

        case Type::SetPan: {
            Voice* voice = selectedVoice();
            if (voice != nullptr && acceptValue(msg.value)) {
                voice->setPan(msg.value);
            }
            break;
        }

        case Type::SetFilterCutoff:
            if (acceptValue(msg.value)) {
                output_.getPostFilter().setCutoff(msg.value);
            }
            break;

        case Type::SetFilterResonance:
            if (acceptValue(msg.value)) {
                output_.getPostFilter().setQ(msg.value);
            }
            break;

        case Type::SetFilterMode: {
            BiquadFilter::Mode mode;
            if (BiquadFilter::modeFromIndex(msg.index, mode)) {
                output_.getPostFilter().setMode(mode);
            } else {
                ignoredMessages_++;
            }
            break;
        }

        case Type::SetDrive:
            if (acceptValue(msg.value)) {
                output_.setDrive(msg.value);
            }
            break;

        case Type::SetOutputMode:
            if (!output_.setModeIndex(msg.index)) {
                ignoredMessages_++;
            }
            break;
    }
}

void Engine::render(StereoFrame* destination, size_t count) {
    const float gain = normalization_ * masterGain_;

    for (size_t frame = 0; frame < count; ++frame) {
        float left = 0.0f;
        float right = 0.0f;
        for (auto& voice : voices_) {
            StereoFrame sample = voice.tick();
            left += sample.left;
            right += sample.right;
        }
        destination[frame].left = left * gain;
        destination[frame].right = right * gain;
    }

    output_.processBuffer(destination, count);

    for (size_t frame = 0; frame < count; ++frame) {
        destination[frame].left = clampSample(destination[frame].left);
        destination[frame].right = clampSample(destination[frame].right);
    }
}

Voice* Engine::selectedVoice() {
    if (!hasSelection_ || selectedVoice_ >= voices_.size()) {
        ignoredMessages_++;
        return nullptr;
    }
    return &voices_[selectedVoice_];
}

bool Engine::acceptValue(float value) {
    if (!std::isfinite(value)) {
        ignoredMessages_++;
        return false;
    }
    return true;
}

float Engine::clampFrequency(float hz) const {
    if (hz < minFrequency_) return minFrequency_;
    if (hz > maxFrequency_) return maxFrequency_;
    return hz;
}

} // namespace synth
