#include <unity.h>
#include <render_cycle.hpp>
#include <hardware_ring_buffer.hpp>
#include <sample_format.hpp>
#include <engine.hpp>
#include <control_channel.hpp>
#include <cstring>
#include <vector>

#define ENABLE_MEMORY_TRACKING
#include "memory_tracker.hpp"

using audio::RenderCycle;
using audio::SampleFormat;
using control::Message;

// Fake clock: each reading advances by fakeClockStep microseconds
static uint32_t fakeClockNow = 0;
static uint32_t fakeClockStep = 0;

static uint32_t fakeClock() {
    fakeClockNow += fakeClockStep;
    return fakeClockNow;
}

static audio::RingBufferConfig referenceRing() {
    audio::RingBufferConfig config;
    config.totalBytes = 2052;
    config.frameBytes = 4;
    return config;
}

static void queueVoiceStart(control::ControlProducer& producer, uint8_t index, float hz) {
    producer.push(Message::selectVoice(index));
    producer.push(Message::setFrequency(hz));
    producer.push(Message::toggleVoice(index));
}

static bool allZero(const uint8_t* bytes, size_t length) {
    for (size_t i = 0; i < length; ++i) {
        if (bytes[i] != 0) return false;
    }
    return true;
}

void setUp(void) {
    fakeClockNow = 0;
    fakeClockStep = 0;
}

void tearDown(void) {
}

void test_render_shouldApplyQueuedMessagesBeforeRendering(void) {
    synth::Engine engine;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), 684, fakeClock);
    queueVoiceStart(ends.first, 0, 440.0f);
    std::vector<uint8_t> window(684, 0);

    size_t consumed = cycle.render(window.data(), window.size());

    TEST_ASSERT_EQUAL_UINT(684, consumed);
    TEST_ASSERT_TRUE_MESSAGE(engine.getVoice(0).isActive(), "Toggle queued before the cycle should be applied");
    TEST_ASSERT_EQUAL_FLOAT(440.0f, engine.getVoice(0).getFrequency());
    TEST_ASSERT_TRUE(channel.empty());
    TEST_ASSERT_FALSE_MESSAGE(allZero(window.data(), window.size()), "The new voice should be audible in this very window");
}

void test_render_shouldMatchEngineOutputPackedToWireFormat(void) {
    synth::Engine engine;
    synth::Engine twin;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), 400, fakeClock);
    queueVoiceStart(ends.first, 1, 330.0f);
    twin.processMessage(Message::selectVoice(1));
    twin.processMessage(Message::setFrequency(330.0f));
    twin.processMessage(Message::toggleVoice(1));

    std::vector<uint8_t> window(400);
    cycle.render(window.data(), window.size());

    std::vector<synth::StereoFrame> frames(100);
    twin.render(frames.data(), frames.size());
    std::vector<uint8_t> expected(400);
    for (size_t i = 0; i < frames.size(); ++i) {
        audio::packFrame(frames[i], SampleFormat::pcm16(), expected.data() + i * 4);
    }
    TEST_ASSERT_EQUAL_MEMORY(expected.data(), window.data(), 400);
}

void test_render_smallScratch_shouldRenderInChunksWithoutGlitch(void) {
    synth::Engine engine;
    synth::Engine twin;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    // Scratch holds 16 frames, the window 100
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), 64, fakeClock);
    queueVoiceStart(ends.first, 0, 1000.0f);
    twin.processMessage(Message::selectVoice(0));
    twin.processMessage(Message::setFrequency(1000.0f));
    twin.processMessage(Message::toggleVoice(0));

    std::vector<uint8_t> window(400);
    TEST_ASSERT_EQUAL_UINT(400, cycle.render(window.data(), window.size()));

    std::vector<synth::StereoFrame> frames(100);
    twin.render(frames.data(), frames.size());
    std::vector<uint8_t> expected(400);
    for (size_t i = 0; i < frames.size(); ++i) {
        audio::packFrame(frames[i], SampleFormat::pcm16(), expected.data() + i * 4);
    }
    TEST_ASSERT_EQUAL_MEMORY(expected.data(), window.data(), 400);
}

void test_render_unalignedWindow_shouldLeaveRemainderUntouched(void) {
    synth::Engine engine;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), 64, fakeClock);
    std::vector<uint8_t> window(43, 0xAB);

    size_t consumed = cycle.render(window.data(), window.size());

    TEST_ASSERT_EQUAL_UINT_MESSAGE(40, consumed, "Only complete frames are consumed");
    for (size_t i = 40; i < 43; ++i) {
        TEST_ASSERT_EQUAL_HEX8_MESSAGE(0xAB, window[i], "Remainder bytes must not be written");
    }
}

void test_render_windowShorterThanFrame_shouldCountStall(void) {
    synth::Engine engine;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), 64, fakeClock);
    ends.first.push(Message::toggleVoice(0));
    uint8_t window[3] = {1, 2, 3};

    size_t consumed = cycle.render(window, sizeof(window));

    TEST_ASSERT_EQUAL_UINT(0, consumed);
    TEST_ASSERT_EQUAL_UINT32(1, cycle.getStalledWindowCount());
    TEST_ASSERT_EQUAL_UINT8(3, window[2]);
    TEST_ASSERT_TRUE_MESSAGE(engine.getVoice(0).isActive(), "Messages are still drained on a stalled window");
}

void test_render_slowCycle_shouldCountDeadlineMiss(void) {
    synth::Engine engine;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), 256, fakeClock);
    std::vector<uint8_t> window(256);  // 64 frames = 1451 us at 44.1 kHz

    fakeClockStep = 1000;
    cycle.render(window.data(), window.size());
    TEST_ASSERT_EQUAL_UINT32_MESSAGE(0, cycle.getDeadlineMissCount(), "1000 us fits in a 1451 us window");

    fakeClockStep = 5000;
    cycle.render(window.data(), window.size());
    TEST_ASSERT_EQUAL_UINT32(1, cycle.getDeadlineMissCount());

    platform::AudioStats stats = cycle.takeStats(1);
    TEST_ASSERT_EQUAL_UINT32(2, stats.cycleCount);
    TEST_ASSERT_EQUAL_UINT32(3000, stats.avgCycleTime);
    TEST_ASSERT_EQUAL_UINT32(5000, stats.maxCycleTime);
    TEST_ASSERT_EQUAL_UINT32(1451, stats.windowDuration);
    TEST_ASSERT_EQUAL_UINT32(1, stats.deadlineMissCount);
    TEST_ASSERT_EQUAL_UINT8(1, stats.coreId);
}

void test_takeStats_shouldResetIntervalCountersButKeepTotals(void) {
    synth::Engine engine;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), 256, fakeClock);
    std::vector<uint8_t> window(256);
    ends.first.push(Message::selectVoice(9));
    ends.first.push(Message::toggleVoice(0));

    cycle.render(window.data(), window.size());
    platform::AudioStats first = cycle.takeStats();
    platform::AudioStats second = cycle.takeStats();

    TEST_ASSERT_EQUAL_UINT32(1, first.cycleCount);
    TEST_ASSERT_EQUAL_UINT32(2, first.messagesApplied);
    TEST_ASSERT_EQUAL_UINT32(1, first.ignoredMessageCount);
    TEST_ASSERT_EQUAL_UINT32(256, static_cast<uint32_t>(first.bytesRendered));
    TEST_ASSERT_EQUAL_UINT32(0, second.cycleCount);
    TEST_ASSERT_EQUAL_UINT32(0, second.messagesApplied);
    TEST_ASSERT_EQUAL_UINT32(256, static_cast<uint32_t>(second.bytesRendered));
}

void test_prime_shouldFillEveryDescriptorWithRenderedAudio(void) {
    synth::Engine engine;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    audio::HardwareRingBuffer ring(referenceRing());
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), ring.maxDescriptorLength(), fakeClock);
    queueVoiceStart(ends.first, 0, 220.0f);

    size_t primed = cycle.prime(ring);

    TEST_ASSERT_EQUAL_UINT(2052, primed);
    TEST_ASSERT_FALSE(ring.windowAvailable());
    TEST_ASSERT_TRUE(ring.transferPending());
    for (size_t i = 0; i < ring.descriptorCount(); ++i) {
        TEST_ASSERT_FALSE_MESSAGE(allZero(ring.data() + ring.descriptorOffset(i), ring.descriptorLength(i)),
                                  "Every descriptor should hold rendered frames");
    }
}

void test_fill_afterTransfer_shouldRefillReleasedDescriptor(void) {
    synth::Engine engine;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    audio::HardwareRingBuffer ring(referenceRing());
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), ring.maxDescriptorLength(), fakeClock);
    cycle.prime(ring);

    TEST_ASSERT_EQUAL_UINT_MESSAGE(0, cycle.fill(ring), "Nothing to fill while hardware owns the ring");

    ring.completeTransfer();
    TEST_ASSERT_EQUAL_UINT(684, cycle.fill(ring));
    TEST_ASSERT_FALSE(ring.windowAvailable());
}

void test_render_shouldNotAllocateMemory(void) {
    synth::Engine engine;
    control::ControlChannel channel(8);
    auto ends = channel.split();
    audio::HardwareRingBuffer ring(referenceRing());
    RenderCycle cycle(engine, std::move(ends.second), SampleFormat::pcm16(), ring.maxDescriptorLength(), fakeClock);
    cycle.prime(ring);
    queueVoiceStart(ends.first, 2, 660.0f);

    TEST_NO_HEAP_ALLOCATIONS({
        ring.completeTransfer();
        cycle.fill(ring);
    });
}

void test_constructor_invalidFormat_shouldThrow(void) {
    synth::Engine engine;
    control::ControlChannel channel(8);
    auto ends = channel.split();

    bool thrown = false;
    try {
        RenderCycle cycle(engine, std::move(ends.second), SampleFormat{16, 3, audio::ChannelLayout::Stereo}, 64, fakeClock);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_render_shouldApplyQueuedMessagesBeforeRendering);
    RUN_TEST(test_render_shouldMatchEngineOutputPackedToWireFormat);
    RUN_TEST(test_render_smallScratch_shouldRenderInChunksWithoutGlitch);
    RUN_TEST(test_render_unalignedWindow_shouldLeaveRemainderUntouched);
    RUN_TEST(test_render_windowShorterThanFrame_shouldCountStall);
    RUN_TEST(test_render_slowCycle_shouldCountDeadlineMiss);
    RUN_TEST(test_takeStats_shouldResetIntervalCountersButKeepTotals);
    RUN_TEST(test_prime_shouldFillEveryDescriptorWithRenderedAudio);
    RUN_TEST(test_fill_afterTransfer_shouldRefillReleasedDescriptor);
    RUN_TEST(test_render_shouldNotAllocateMemory);
    RUN_TEST(test_constructor_invalidFormat_shouldThrow);
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
