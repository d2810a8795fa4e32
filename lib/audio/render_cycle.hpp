#ifndef RENDER_CYCLE_HPP
#define RENDER_CYCLE_HPP

#include "hardware_ring_buffer.hpp"
#include "sample_format.hpp"
#include <engine.hpp>
#include <control_channel.hpp>
#include <audio_stats.hpp>
#include <clock.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

/**
 * @brief The cooperative task run each time a ring window becomes available
 *
 * Per invocation:
 *  1. drain the control channel completely, applying messages in FIFO order
 *  2. complete_frames = window_length / frame_size (remainder bytes untouched)
 *  3. render that many frames
 *  4. pack them into the DAC wire format
 *  5. report complete_frames * frame_size bytes consumed
 *
 * The cycle owns the consumer end of the control channel and drives the
 * engine; neither is touched by any other context. Scratch memory is sized
 * once in the constructor, the cycle itself never allocates.
 */
class RenderCycle {
public:
    /**
     * @param engine Engine driven by this cycle (must outlive it)
     * @param consumer Consumer end of the control channel
     * @param format Wire format of the ring
     * @param maxWindowBytes Largest window the cycle will be asked to fill
     * @param clock Microsecond clock used for deadline accounting
     * @throws std::invalid_argument for an invalid format
     */
    RenderCycle(synth::Engine& engine,
                control::ControlConsumer consumer,
                const SampleFormat& format,
                size_t maxWindowBytes,
                platform::MicrosClock clock = platform::microsNow);

    RenderCycle(const RenderCycle&) = delete;
    RenderCycle& operator=(const RenderCycle&) = delete;

    /**
     * @brief Run one cycle over a raw window
     * @param window Start of the window granted to the render context
     * @param length Window length in bytes (not necessarily frame aligned)
     * @return Bytes consumed: a multiple of the frame size, never more than length
     */
    size_t render(uint8_t* window, size_t length);

    /**
     * @brief Run one cycle over the ring's current window and commit it
     * @return Bytes committed (0 if no window was available or it was stalled)
     */
    size_t fill(HardwareRingBuffer& ring);

    /**
     * @brief Fill every free descriptor with rendered frames before playback starts
     * @return Total bytes rendered
     */
    size_t prime(HardwareRingBuffer& ring);

    /**
     * @brief Apply every pending control message to the engine
     * @return Number of messages applied
     */
    size_t drainMessages();

    /**
     * @brief Snapshot the statistics and restart the per-interval counters
     *
     * Totals (deadline misses, stalled windows, bytes) keep accumulating.
     */
    platform::AudioStats takeStats(uint8_t coreId = 0);

    const SampleFormat& getFormat() const { return format_; }
    uint32_t getDeadlineMissCount() const { return deadlineMisses_; }
    uint32_t getStalledWindowCount() const { return stalledWindows_; }
    uint64_t getBytesRendered() const { return bytesRendered_; }

private:
    void recordCycle(uint32_t elapsed, uint32_t windowDuration);

    synth::Engine& engine_;
    control::ControlConsumer consumer_;
    SampleFormat format_;
    size_t frameBytes_;
    std::vector<synth::StereoFrame> scratch_;
    platform::MicrosClock clock_;

    // Per-interval counters
    uint32_t cycleCount_ = 0;
    uint32_t messagesApplied_ = 0;
    uint64_t totalCycleTime_ = 0;
    uint32_t maxCycleTime_ = 0;
    uint32_t lastWindowDuration_ = 0;

    // Totals
    uint32_t deadlineMisses_ = 0;
    uint32_t stalledWindows_ = 0;
    uint64_t bytesRendered_ = 0;
};

} // namespace audio

#endif // RENDER_CYCLE_HPP
