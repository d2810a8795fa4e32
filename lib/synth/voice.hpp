#ifndef VOICE_HPP
#define VOICE_HPP

#include "oscillator.hpp"

namespace synth {

/**
 * @brief One stereo sample: left and right channel values
 */
struct StereoFrame {
    float left;
    float right;
};

/**
 * @brief One instrument instance: oscillator, volume, on/off state and stereo placement
 *
 * Volume is clamped on every set. Pan gains are cached and only recomputed
 * when the pan changes, never per sample. Volume changes are smoothed with a
 * one-pole filter so that parameter updates do not produce zipper noise.
 *
 * An inactive voice returns silence and does not advance its oscillator, so
 * reactivation resumes from the phase where the voice stopped.
 */
class Voice {
public:
    Voice(float frequency = 440.0f,
          float sampleRate = 44100.0f,
          float volume = 0.9f,
          float smoothing = 0.0f)
        : osc_(frequency, sampleRate)
        , volume_(clampUnit(volume))
        , smoothedVolume_(volume_)
        , smoothing_(smoothing) {
        if (smoothing_ < 0.0f) smoothing_ = 0.0f;
        if (smoothing_ > 0.9999f) smoothing_ = 0.9999f;
        setPan(0.0f);
    }

    inline void setFrequency(float frequency) {
        osc_.setFrequency(frequency);
    }

    /**
     * @brief Set target volume, clamped to [0, 1]
     */
    inline void setVolume(float volume) {
        volume_ = clampUnit(volume);
    }

    /**
     * @brief Set stereo position
     * @param pan -1.0 = hard left, 0.0 = center, 1.0 = hard right (clamped)
     *
     * Uses a balance law: the center position leaves both channels at unity
     * and moving away from it only attenuates the opposite channel.
     */
    inline void setPan(float pan) {
        if (pan < -1.0f) pan = -1.0f;
        if (pan > 1.0f) pan = 1.0f;
        pan_ = pan;
        leftGain_ = (pan > 0.0f) ? 1.0f - pan : 1.0f;
        rightGain_ = (pan < 0.0f) ? 1.0f + pan : 1.0f;
    }

    inline void setActive(bool active) {
        active_ = active;
    }

    /**
     * @brief Generate the next stereo frame
     *
     * A single oscillator sample feeds both channels, scaled by the cached
     * pan gains.
     */
    inline StereoFrame tick() {
        if (!active_) {
            return StereoFrame{0.0f, 0.0f};
        }

        smoothedVolume_ = volume_ + smoothing_ * (smoothedVolume_ - volume_);

        float sample = osc_.tick() * smoothedVolume_;
        return StereoFrame{sample * leftGain_, sample * rightGain_};
    }

    inline float getFrequency() const { return osc_.getFrequency(); }
    inline float getVolume() const { return volume_; }
    inline float getPan() const { return pan_; }
    inline float getLeftGain() const { return leftGain_; }
    inline float getRightGain() const { return rightGain_; }
    inline bool isActive() const { return active_; }
    inline const Oscillator& getOscillator() const { return osc_; }

private:
    static float clampUnit(float value) {
        if (!(value > 0.0f)) return 0.0f;  // Also catches NaN
        if (value > 1.0f) return 1.0f;
        return value;
    }

    Oscillator osc_;
    float volume_;
    float smoothedVolume_;
    float smoothing_;
    float pan_ = 0.0f;
    float leftGain_ = 1.0f;
    float rightGain_ = 1.0f;
    bool active_ = false;
};

} // namespace synth

#endif // VOICE_HPP
