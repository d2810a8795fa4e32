#ifndef OSCILLATOR_HPP
#define OSCILLATOR_HPP

#include <cmath>
#include <cstddef>

namespace synth {

/**
 * @brief Shared sine lookup table
 *
 * One period of a sine wave with a guard point at the end so that linear
 * interpolation never has to wrap the upper index. Built once on first use
 * and shared by every oscillator (read-only afterwards).
 */
class SineTable {
public:
    static constexpr size_t TABLE_SIZE = 1024;  // Must stay a power of two

    static const SineTable& instance() {
        static const SineTable table;
        return table;
    }

    /**
     * @brief Look up sin(2*pi*phase) with linear interpolation
     * @param phase Normalized phase in [0, 1)
     * @return Approximation in [-1.0, 1.0]
     */
    inline float lookup(float phase) const {
        float tablePos = phase * TABLE_SIZE;
        size_t index0 = static_cast<size_t>(tablePos) & (TABLE_SIZE - 1);
        float frac = tablePos - std::floor(tablePos);
        return table_[index0] + (table_[index0 + 1] - table_[index0]) * frac;
    }

private:
    SineTable() {
        const double twoPi = 6.283185307179586;
        for (size_t i = 0; i <= TABLE_SIZE; ++i) {
            table_[i] = static_cast<float>(std::sin(twoPi * static_cast<double>(i) / TABLE_SIZE));
        }
        // Pin the zero crossings so the table is exactly odd-symmetric around them
        table_[0] = 0.0f;
        table_[TABLE_SIZE / 2] = 0.0f;
        table_[TABLE_SIZE] = 0.0f;
    }

    float table_[TABLE_SIZE + 1];
};

/**
 * @brief Phase-accumulator sine oscillator
 *
 * The increment is derived from frequency / sample rate and only recomputed
 * when the frequency changes. Changing frequency never resets the phase, so
 * pitch changes are click-free.
 */
class Oscillator {
public:
    Oscillator(float frequency = 440.0f, float sampleRate = 44100.0f)
        : frequency_(frequency)
        , sampleRate_(sampleRate)
        , increment_(frequency / sampleRate)
        , table_(&SineTable::instance()) {
    }

    /**
     * @brief Change frequency without touching the phase
     */
    inline void setFrequency(float frequency) {
        frequency_ = frequency;
        increment_ = frequency / sampleRate_;
    }

    /**
     * @brief Generate the next sample and advance the phase
     * @return Sample in range [-1.0, 1.0]
     */
    inline float tick() {
        float sample = table_->lookup(phase_);

        phase_ += increment_;
        if (phase_ >= 1.0f || phase_ < 0.0f) {
            phase_ -= std::floor(phase_);
            // A tiny negative phase can round up to exactly 1.0
            if (phase_ >= 1.0f) phase_ = 0.0f;
        }

        return sample;
    }

    inline float getFrequency() const { return frequency_; }
    inline float getIncrement() const { return increment_; }
    inline float getPhase() const { return phase_; }
    inline float getSampleRate() const { return sampleRate_; }

private:
    float frequency_;
    float sampleRate_;
    float increment_;
    float phase_ = 0.0f;
    const SineTable* table_;
};

} // namespace synth

#endif // OSCILLATOR_HPP
