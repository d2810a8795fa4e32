#ifndef BIQUAD_FILTER_HPP
#define BIQUAD_FILTER_HPP

#include "voice.hpp"
#include <cmath>
#include <cstddef>

namespace synth {

/**
 * @brief Stereo biquad filter (2nd order IIR) for the shared output chain
 *
 * One set of coefficients drives two independent delay lines, one per channel.
 * Uses Direct Form II Transposed structure. Coefficients follow Robert
 * Bristow-Johnson's cookbook and are recalculated lazily, on the first sample
 * after a parameter change.
 *
 * The filter starts bypassed; enabling it (setCutoff with a positive value)
 * clears the delay lines so stale state never leaks into the output.
 */
class BiquadFilter {
public:
    enum class Mode {
        LOWPASS,
        HIGHPASS,
        BANDPASS,
        NOTCH
    };

    static constexpr size_t MODE_COUNT = 4;

    BiquadFilter(float sampleRate = 44100.0f)
        : sampleRate_(sampleRate) {
        reset();
    }

    /**
     * @brief Map a control index onto a mode
     * @return false (and leaves mode untouched) if index is out of range
     */
    static bool modeFromIndex(size_t index, Mode& mode) {
        if (index >= MODE_COUNT) {
            return false;
        }
        mode = static_cast<Mode>(index);
        return true;
    }

    inline void setMode(Mode mode) {
        if (mode_ != mode) {
            mode_ = mode;
            coeffsDirty_ = true;
        }
    }

    /**
     * @brief Set cutoff frequency in Hz, or bypass the filter
     * @param frequencyHz Cutoff (clamped to 20Hz - 0.99 * Nyquist); <= 0 bypasses
     */
    inline void setCutoff(float frequencyHz) {
        if (frequencyHz <= 0.0f) {
            enabled_ = false;
            return;
        }

        float nyquist = sampleRate_ * 0.5f;
        if (frequencyHz < 20.0f) frequencyHz = 20.0f;
        if (frequencyHz > nyquist * 0.99f) frequencyHz = nyquist * 0.99f;

        if (!enabled_) {
            enabled_ = true;
            reset();
            coeffsDirty_ = true;
        }
        if (cutoffHz_ != frequencyHz) {
            cutoffHz_ = frequencyHz;
            coeffsDirty_ = true;
        }
    }

    /**
     * @brief Set Q factor (resonance/bandwidth), clamped to [0.1, 20]
     */
    inline void setQ(float q) {
        if (q < 0.1f) q = 0.1f;
        if (q > 20.0f) q = 20.0f;

        if (q_ != q) {
            q_ = q;
            coeffsDirty_ = true;
        }
    }

    /**
     * @brief Filter a block of stereo frames in-place
     */
    inline void processBuffer(StereoFrame* frames, size_t numFrames) {
        if (!enabled_) {
            return;
        }
        if (coeffsDirty_) {
            updateCoefficients();
        }

        for (size_t i = 0; i < numFrames; ++i) {
            frames[i].left = processChannel(frames[i].left, left_);
            frames[i].right = processChannel(frames[i].right, right_);
        }
    }

    inline void reset() {
        left_ = DelayLine{};
        right_ = DelayLine{};
    }

    inline bool isEnabled() const { return enabled_; }
    inline float getCutoff() const { return cutoffHz_; }
    inline float getQ() const { return q_; }
    inline Mode getMode() const { return mode_; }

private:
    struct DelayLine {
        float z1 = 0.0f;
        float z2 = 0.0f;
    };

    inline float processChannel(float input, DelayLine& state) const {
        float output = b0_ * input + state.z1;
        state.z1 = b1_ * input - a1_ * output + state.z2;
        state.z2 = b2_ * input - a2_ * output;
        return output;
    }

    inline void updateCoefficients() {
        const float PI = 3.14159265358979323846f;

        float w0 = 2.0f * PI * cutoffHz_ / sampleRate_;
        float cosw0 = std::cos(w0);
        float sinw0 = std::sin(w0);
        float alpha = sinw0 / (2.0f * q_);

        float b0 = 1.0f, b1 = 0.0f, b2 = 0.0f;
        float a0 = 1.0f + alpha;
        float a1 = -2.0f * cosw0;
        float a2 = 1.0f - alpha;

        switch (mode_) {
            case Mode::LOWPASS:
                b0 = (1.0f - cosw0) / 2.0f;
                b1 = 1.0f - cosw0;
                b2 = b0;
                break;
            case Mode::HIGHPASS:
                b0 = (1.0f + cosw0) / 2.0f;
                b1 = -(1.0f + cosw0);
                b2 = b0;
                break;
            case Mode::BANDPASS:
                b0 = alpha;
                b1 = 0.0f;
                b2 = -alpha;
                break;
            case Mode::NOTCH:
                b0 = 1.0f;
                b1 = -2.0f * cosw0;
                b2 = 1.0f;
                break;
        }

        b0_ = b0 / a0;
        b1_ = b1 / a0;
        b2_ = b2 / a0;
        a1_ = a1 / a0;
        a2_ = a2 / a0;

        coeffsDirty_ = false;
    }

    float sampleRate_;

    Mode mode_ = Mode::LOWPASS;
    float cutoffHz_ = 10000.0f;
    float q_ = 0.707f;  // Butterworth
    bool enabled_ = false;

    float b0_ = 1.0f, b1_ = 0.0f, b2_ = 0.0f;
    float a1_ = 0.0f, a2_ = 0.0f;

    DelayLine left_;
    DelayLine right_;

    bool coeffsDirty_ = true;
};

} // namespace synth

#endif // BIQUAD_FILTER_HPP
