#ifndef SAMPLE_FORMAT_HPP
#define SAMPLE_FORMAT_HPP

#include <voice.hpp>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace audio {

/**
 * @brief How the two output slots of a frame are fed
 */
enum class ChannelLayout : uint8_t {
    Stereo,          // Left and right rendered independently
    MonoDuplicated   // (left + right) / 2 written to both slots
};

/**
 * @brief DAC wire format of one stereo frame
 *
 * Each channel occupies one slot of slotBytes bytes. The payload has
 * bitsPerSample bits of precision and is left-justified into the most
 * significant bits of the slot (the low bits are zero). Byte order is the
 * platform's native order, which is what the I2S peripheral shifts out.
 */
struct SampleFormat {
    uint8_t bitsPerSample;
    uint8_t slotBytes;
    ChannelLayout layout;

    static SampleFormat pcm16(ChannelLayout layout = ChannelLayout::Stereo) {
        return SampleFormat{16, 2, layout};
    }

    static SampleFormat pcm24In32(ChannelLayout layout = ChannelLayout::Stereo) {
        return SampleFormat{24, 4, layout};
    }

    static SampleFormat pcm32(ChannelLayout layout = ChannelLayout::Stereo) {
        return SampleFormat{32, 4, layout};
    }

    size_t frameBytes() const { return static_cast<size_t>(slotBytes) * 2; }

    bool isValid() const {
        return (slotBytes == 2 || slotBytes == 4)
            && bitsPerSample >= 8
            && bitsPerSample <= slotBytes * 8;
    }
};

/**
 * @brief Convert a normalized sample to a left-justified slot word
 *
 * The sample is clamped to [-1, 1] and scaled by 2^(bits-1) - 1, so full
 * scale never overflows the payload width.
 */
inline int32_t toSlotWord(float sample, const SampleFormat& format) {
    if (sample > 1.0f) sample = 1.0f;
    if (sample < -1.0f) sample = -1.0f;
    if (sample != sample) sample = 0.0f;

    const int bits = format.bitsPerSample;
    const double scale = static_cast<double>((1LL << (bits - 1)) - 1);
    int64_t payload = static_cast<int64_t>(static_cast<double>(sample) * scale);

    const int shift = format.slotBytes * 8 - bits;
    // Shift as unsigned to keep negative payloads well defined
    uint32_t word = static_cast<uint32_t>(static_cast<uint64_t>(payload) << shift);
    if (format.slotBytes == 2) {
        return static_cast<int16_t>(static_cast<uint16_t>(word & 0xFFFFu));
    }
    return static_cast<int32_t>(word);
}

/**
 * @brief Pack one frame into its wire representation
 * @param frame Rendered frame
 * @param format Target format
 * @param out Destination, at least format.frameBytes() bytes
 */
inline void packFrame(const synth::StereoFrame& frame, const SampleFormat& format, uint8_t* out) {
    float left = frame.left;
    float right = frame.right;
    if (format.layout == ChannelLayout::MonoDuplicated) {
        left = (frame.left + frame.right) * 0.5f;
        right = left;
    }

    if (format.slotBytes == 2) {
        int16_t words[2] = {
            static_cast<int16_t>(toSlotWord(left, format)),
            static_cast<int16_t>(toSlotWord(right, format))
        };
        std::memcpy(out, words, sizeof(words));
    } else {
        int32_t words[2] = {toSlotWord(left, format), toSlotWord(right, format)};
        std::memcpy(out, words, sizeof(words));
    }
}

} // namespace audio

#endif // SAMPLE_FORMAT_HPP
