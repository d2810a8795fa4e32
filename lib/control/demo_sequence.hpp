#ifndef DEMO_SEQUENCE_HPP
#define DEMO_SEQUENCE_HPP

#include "message.hpp"
#include <cstdint>
#include <cstddef>

namespace control {

/**
 * @brief Scripted control producer for running without physical inputs
 *
 * Brings up the three default voices as a harmonic stack
 * (220/440/660 Hz), spreads them across the stereo field and then keeps
 * sweeping voice 1 up and down while toggling voice 2 on and off.
 *
 * Platform code drives it: call next() to get the following message and the
 * delay to wait before sending the one after it.
 */
class DemoSequence {
public:
    struct Step {
        Message message;
        uint32_t delayMs;
    };

    DemoSequence(float sweepLowHz = 330.0f, float sweepHighHz = 880.0f, float sweepStepHz = 10.0f)
        : sweepLowHz_(sweepLowHz)
        , sweepHighHz_(sweepHighHz)
        , sweepStepHz_(sweepStepHz)
        , sweepHz_(sweepLowHz) {
    }

    /**
     * @brief Produce the next step of the sequence (never ends)
     */
    Step next() {
        if (introIndex_ < introLength()) {
            return introStep(introIndex_++);
        }

        // Sweep phase: every 40 steps toggle voice 2, otherwise move voice 1
        sweepCount_++;
        if (sweepCount_ % 40 == 0) {
            return Step{Message::toggleVoice(2), 20};
        }

        sweepHz_ += rising_ ? sweepStepHz_ : -sweepStepHz_;
        if (sweepHz_ >= sweepHighHz_) {
            sweepHz_ = sweepHighHz_;
            rising_ = false;
        } else if (sweepHz_ <= sweepLowHz_) {
            sweepHz_ = sweepLowHz_;
            rising_ = true;
        }
        return Step{Message::setFrequency(sweepHz_), 20};
    }

    size_t introLength() const { return 15; }

private:
    Step introStep(size_t index) const {
        switch (index) {
            case 0:  return Step{Message::selectVoice(0), 0};
            case 1:  return Step{Message::setFrequency(220.0f), 0};
            case 2:  return Step{Message::setPan(-0.5f), 0};
            case 3:  return Step{Message::toggleVoice(0), 500};
            case 4:  return Step{Message::selectVoice(1), 0};
            case 5:  return Step{Message::setFrequency(440.0f), 0};
            case 6:  return Step{Message::setVolume(0.7f), 0};
            case 7:  return Step{Message::toggleVoice(1), 500};
            case 8:  return Step{Message::selectVoice(2), 0};
            case 9:  return Step{Message::setFrequency(660.0f), 0};
            case 10: return Step{Message::setPan(0.5f), 0};
            case 11: return Step{Message::setVolume(0.5f), 0};
            case 12: return Step{Message::toggleVoice(2), 500};
            case 13: return Step{Message::setFilterCutoff(4000.0f), 0};
            default: return Step{Message::selectVoice(1), 0};
        }
    }

    float sweepLowHz_;
    float sweepHighHz_;
    float sweepStepHz_;
    float sweepHz_;
    bool rising_ = true;
    size_t introIndex_ = 0;
    uint32_t sweepCount_ = 0;
};

} // namespace control

#endif // DEMO_SEQUENCE_HPP
