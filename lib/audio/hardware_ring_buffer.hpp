#ifndef HARDWARE_RING_BUFFER_HPP
#define HARDWARE_RING_BUFFER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

constexpr size_t DEFAULT_DESCRIPTOR_COUNT = 3;
constexpr size_t DEFAULT_SMALL_BUFFER_THRESHOLD = 8184;

constexpr size_t gcd(size_t a, size_t b) {
    return b == 0 ? a : gcd(b, a % b);
}

constexpr size_t lcm(size_t a, size_t b) {
    return (a == 0 || b == 0) ? 0 : (a / gcd(a, b)) * b;
}

/**
 * @brief Ring sizing law for a descriptor-split DMA buffer
 *
 * Every descriptor window must hold a whole number of frames, which holds
 * exactly when totalBytes % lcm(descriptorCount, frameBytes) == 0. Above the
 * small-buffer threshold the driver splits the buffer differently, so such
 * lengths are rejected as well.
 *
 * constexpr so that firmware can static_assert its ring constant.
 */
constexpr bool isValidRingLength(size_t totalBytes,
                                 size_t frameBytes,
                                 size_t descriptorCount = DEFAULT_DESCRIPTOR_COUNT,
                                 size_t smallBufferThreshold = DEFAULT_SMALL_BUFFER_THRESHOLD) {
    return totalBytes > 0
        && frameBytes > 0
        && descriptorCount > 0
        && totalBytes <= smallBufferThreshold
        && totalBytes % lcm(descriptorCount, frameBytes) == 0;
}

/**
 * @brief Sizing of the DMA ring, fixed at configuration time
 */
struct RingBufferConfig {
    size_t totalBytes = 2052;
    size_t frameBytes = 4;
    size_t descriptorCount = DEFAULT_DESCRIPTOR_COUNT;
    size_t smallBufferThreshold = DEFAULT_SMALL_BUFFER_THRESHOLD;

    /**
     * @brief Check the sizing law
     * @return Empty string if valid, otherwise a description of the violation
     */
    std::string validate() const;
};

/**
 * @brief Byte range of the ring granted to one party
 */
struct Window {
    size_t offset;
    size_t length;
};

/**
 * @brief Model of the DAC's circular transfer memory
 *
 * The arena is split into descriptorCount contiguous descriptors. Each
 * descriptor is owned either by the render side (being filled) or by the
 * hardware side (queued for or in transfer). The render context only ever
 * writes inside the window returned by acquireWindow(); ownership moves by
 * index, no lock is involved.
 *
 * Construction validates the sizing law and throws std::invalid_argument on
 * violation, so a misaligned ring can never reach playback.
 */
class HardwareRingBuffer {
public:
    explicit HardwareRingBuffer(const RingBufferConfig& config);

    HardwareRingBuffer(const HardwareRingBuffer&) = delete;
    HardwareRingBuffer& operator=(const HardwareRingBuffer&) = delete;

    // --- Render side ---

    /**
     * @brief True if the current render descriptor is free for refill
     */
    bool windowAvailable() const;

    /**
     * @brief Unfilled tail of the current render descriptor
     * @return {offset, 0} if no window is available
     */
    Window acquireWindow() const;

    uint8_t* windowData(const Window& window) { return arena_.data() + window.offset; }

    /**
     * @brief Mark bytes of the current window as filled
     * @param bytes Bytes written from the window start; clamped to the window
     * @return Bytes actually committed
     *
     * A full descriptor is handed to the hardware side.
     */
    size_t commit(size_t bytes);

    // --- Hardware side ---

    /**
     * @brief True if a filled descriptor is waiting for transfer
     */
    bool transferPending() const;

    /**
     * @brief Descriptor the hardware will send next ({offset, 0} if none)
     */
    Window transferWindow() const;

    /**
     * @brief Hardware finished sending the transfer window; return it for refill
     */
    void completeTransfer();

    // --- Layout ---

    size_t totalBytes() const { return arena_.size(); }
    size_t frameBytes() const { return frameBytes_; }
    size_t descriptorCount() const { return descriptors_.size(); }
    size_t descriptorOffset(size_t index) const { return descriptors_[index].offset; }
    size_t descriptorLength(size_t index) const { return descriptors_[index].length; }
    size_t maxDescriptorLength() const;
    const uint8_t* data() const { return arena_.data(); }

    /**
     * @brief Commits that asked for more than the window (clamped)
     */
    uint32_t overrunCommitCount() const { return overrunCommits_; }

private:
    struct Descriptor {
        size_t offset;
        size_t length;
        size_t filled;
        bool hardwareOwned;
    };

    std::vector<uint8_t> arena_;
    std::vector<Descriptor> descriptors_;
    size_t frameBytes_;
    size_t fillIndex_ = 0;
    size_t transferIndex_ = 0;
    uint32_t overrunCommits_ = 0;
};

} // namespace audio

#endif // HARDWARE_RING_BUFFER_HPP
