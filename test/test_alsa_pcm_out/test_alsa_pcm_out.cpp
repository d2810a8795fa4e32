#include <unity.h>
#include <alsa_pcm_out.hpp>
#include <sample_format.hpp>
#include <voice.hpp>
#include <cstdint>

// Reads one slot the way ALSA interprets the given format
static int32_t decodeSlot(const uint8_t* bytes, snd_pcm_format_t pcmFormat) {
    const int width = snd_pcm_format_physical_width(pcmFormat) / 8;
    const bool littleEndian = snd_pcm_format_little_endian(pcmFormat) == 1;

    uint32_t word = 0;
    for (int i = 0; i < width; ++i) {
        const uint32_t byte = bytes[littleEndian ? i : width - 1 - i];
        word |= byte << (8 * i);
    }
    if (width == 2) {
        return static_cast<int16_t>(static_cast<uint16_t>(word));
    }
    return static_cast<int32_t>(word);
}

static void assertDeviceReadsPackedFrame(const audio::SampleFormat& format) {
    snd_pcm_format_t pcmFormat = alsa::AlsaPcmOut::pcmFormatFor(format);
    TEST_ASSERT_EQUAL_INT_MESSAGE(format.slotBytes * 8, snd_pcm_format_physical_width(pcmFormat),
                                  "PCM sample width should equal the slot width");
    TEST_ASSERT_EQUAL_INT_MESSAGE(1, snd_pcm_format_signed(pcmFormat), "PCM format should be signed");

    synth::StereoFrame frame;
    frame.left = 0.5f;
    frame.right = -0.25f;
    uint8_t bytes[8] = {0};
    audio::packFrame(frame, format, bytes);

    TEST_ASSERT_EQUAL_INT32_MESSAGE(audio::toSlotWord(0.5f, format), decodeSlot(bytes, pcmFormat),
                                    "Left slot should decode to the packed word");
    TEST_ASSERT_EQUAL_INT32_MESSAGE(audio::toSlotWord(-0.25f, format),
                                    decodeSlot(bytes + format.slotBytes, pcmFormat),
                                    "Right slot should decode to the packed word");
}

void setUp(void) {
}

void tearDown(void) {
}

void test_pcmFormatFor_pcm16_shouldMatchPackedByteOrder(void) {
    assertDeviceReadsPackedFrame(audio::SampleFormat::pcm16());
}

void test_pcmFormatFor_pcm24In32_shouldMatchPackedByteOrder(void) {
    assertDeviceReadsPackedFrame(audio::SampleFormat::pcm24In32());
}

void test_pcmFormatFor_pcm32_shouldMatchPackedByteOrder(void) {
    assertDeviceReadsPackedFrame(audio::SampleFormat::pcm32());
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_pcmFormatFor_pcm16_shouldMatchPackedByteOrder);
    RUN_TEST(test_pcmFormatFor_pcm24In32_shouldMatchPackedByteOrder);
    RUN_TEST(test_pcmFormatFor_pcm32_shouldMatchPackedByteOrder);
    return UNITY_END();
}

extern "C" {
#ifdef PLATFORM_ESP32
void app_main() {
    RUN_UNITY_TESTS();
}
#endif

#ifdef PLATFORM_NATIVE
int main(int argc, char **argv) {
    return RUN_UNITY_TESTS();
}
#endif
}
