#ifndef OUTPUT_PROCESSOR_HPP
#define OUTPUT_PROCESSOR_HPP

#include <cmath>
#include <cstddef>
#include <vector>
#include <memory>
#include "biquad_filter.hpp"
#include "voice.hpp"

namespace synth {

/**
 * @brief Base class for output shaping stages
 *
 * The set of implementations is closed: OutputProcessor builds all of them at
 * construction time and a control message only picks one by index. Stages are
 * stateless strategy objects.
 */
class ShapingAlgorithm {
public:
    virtual ~ShapingAlgorithm() = default;

    /**
     * @brief Shape a block of stereo frames in-place
     * @param frames Mixed frames to process
     * @param numFrames Number of frames
     * @param drive Input gain applied before the transfer function
     */
    virtual void processBuffer(StereoFrame* frames, size_t numFrames, float drive) const = 0;

    virtual const char* getName() const = 0;
};

/**
 * @brief Pass-through stage; the mix reaches the post filter untouched
 */
class CleanShaping : public ShapingAlgorithm {
public:
    const char* getName() const override { return "Clean"; }

    void processBuffer(StereoFrame* /*frames*/, size_t /*numFrames*/, float /*drive*/) const override {
    }
};

/**
 * @brief Soft saturation: output = tanh(input * drive)
 */
class TanhShaping : public ShapingAlgorithm {
public:
    const char* getName() const override { return "Tanh"; }

    void processBuffer(StereoFrame* frames, size_t numFrames, float drive) const override {
        for (size_t i = 0; i < numFrames; ++i) {
            frames[i].left = std::tanh(frames[i].left * drive);
            frames[i].right = std::tanh(frames[i].right * drive);
        }
    }
};

/**
 * @brief Wave folder: peaks beyond +-1.0 fold back into range
 */
class WaveFoldShaping : public ShapingAlgorithm {
public:
    const char* getName() const override { return "WaveFolder"; }

    void processBuffer(StereoFrame* frames, size_t numFrames, float drive) const override {
        for (size_t i = 0; i < numFrames; ++i) {
            frames[i].left = fold(frames[i].left * drive);
            frames[i].right = fold(frames[i].right * drive);
        }
    }

    static inline float fold(float x) {
        x = x * 0.5f + 0.5f;
        x = std::fmod(x, 2.0f);
        if (x < 0.0f) x += 2.0f;
        if (x > 1.0f) x = 2.0f - x;
        return x * 2.0f - 1.0f;
    }
};

/**
 * @brief Wave folder with tanh-rounded fold points for a warmer character
 */
class SoftWaveFoldShaping : public ShapingAlgorithm {
public:
    const char* getName() const override { return "SoftWaveFolder"; }

    void processBuffer(StereoFrame* frames, size_t numFrames, float drive) const override {
        const float norm = 1.0f / std::tanh(SOFTNESS);
        for (size_t i = 0; i < numFrames; ++i) {
            frames[i].left = std::tanh(WaveFoldShaping::fold(frames[i].left * drive) * SOFTNESS) * norm;
            frames[i].right = std::tanh(WaveFoldShaping::fold(frames[i].right * drive) * SOFTNESS) * norm;
        }
    }

private:
    static constexpr float SOFTNESS = 3.0f;
};

/**
 * @brief Shared effect chain applied to the normalized voice mix
 *
 * Processing chain: mix -> shaping stage -> post filter. The clean stage with
 * a bypassed filter is the default, which leaves the mix bit-identical.
 */
class OutputProcessor {
public:
    static constexpr size_t MODE_CLEAN = 0;

    OutputProcessor(float sampleRate = 44100.0f)
        : drive_(0.5f)
        , postFilter_(sampleRate)
        , activeIndex_(MODE_CLEAN) {
        algorithms_.push_back(std::make_unique<CleanShaping>());
        algorithms_.push_back(std::make_unique<TanhShaping>());
        algorithms_.push_back(std::make_unique<WaveFoldShaping>());
        algorithms_.push_back(std::make_unique<SoftWaveFoldShaping>());
    }

    OutputProcessor(const OutputProcessor&) = delete;
    OutputProcessor& operator=(const OutputProcessor&) = delete;

    /**
     * @brief Process mixed frames in-place
     *
     * One virtual call per block, then the post filter.
     */
    void processBuffer(StereoFrame* frames, size_t numFrames) {
        // Normalized drive [0, 1] maps exponentially onto [0.1, 10], 0.5 = unity
        float actualDrive = 0.1f * std::pow(100.0f, drive_);

        algorithms_[activeIndex_]->processBuffer(frames, numFrames, actualDrive);
        postFilter_.processBuffer(frames, numFrames);
    }

    /**
     * @brief Select shaping stage by index
     * @return false if index is out of range (selection unchanged)
     *
     * The post filter is cleared on a real switch to avoid transients.
     */
    bool setModeIndex(size_t index) {
        if (index >= algorithms_.size()) {
            return false;
        }
        if (index != activeIndex_) {
            activeIndex_ = index;
            postFilter_.reset();
        }
        return true;
    }

    inline size_t getModeIndex() const { return activeIndex_; }
    inline size_t getModeCount() const { return algorithms_.size(); }

    /**
     * @brief Set normalized drive, clamped to [0, 1]
     */
    void setDrive(float drive) {
        if (drive < 0.0f) drive = 0.0f;
        if (drive > 1.0f) drive = 1.0f;
        drive_ = drive;
    }

    float getDrive() const { return drive_; }

    const char* getName() const {
        return algorithms_[activeIndex_]->getName();
    }

    BiquadFilter& getPostFilter() { return postFilter_; }
    const BiquadFilter& getPostFilter() const { return postFilter_; }

private:
    float drive_;
    BiquadFilter postFilter_;
    std::vector<std::unique_ptr<ShapingAlgorithm>> algorithms_;
    size_t activeIndex_;
};

} // namespace synth

#endif // OUTPUT_PROCESSOR_HPP
