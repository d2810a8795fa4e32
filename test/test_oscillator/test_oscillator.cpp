#include <unity.h>
#include <oscillator.hpp>
#include <cmath>

void setUp(void) {
}

void tearDown(void) {
}

void test_constructor_shouldStartAtZeroPhaseWithDerivedIncrement(void) {
    synth::Oscillator osc(441.0f, 44100.0f);

    TEST_ASSERT_EQUAL_FLOAT_MESSAGE(0.0f, osc.getPhase(), "New oscillator should start at phase 0");
    TEST_ASSERT_EQUAL_FLOAT_MESSAGE(0.01f, osc.getIncrement(), "Increment should be frequency / sample rate");
    TEST_ASSERT_EQUAL_FLOAT(441.0f, osc.getFrequency());
}

void test_tick_shouldReturnSampleForCurrentPhaseThenAdvance(void) {
    synth::Oscillator osc(441.0f, 44100.0f);

    float first = osc.tick();

    TEST_ASSERT_FLOAT_WITHIN_MESSAGE(1e-6f, 0.0f, first, "First sample should be sin(0)");
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.01f, osc.getPhase());
}

void test_tick_shouldTrackSineWithinTableError(void) {
    synth::Oscillator osc(1000.0f, 44100.0f);
    const double twoPi = 6.283185307179586;

    float maxError = 0.0f;
    for (int i = 0; i < 2000; ++i) {
        float phase = osc.getPhase();
        float sample = osc.tick();
        float error = std::fabs(sample - static_cast<float>(std::sin(twoPi * phase)));
        if (error > maxError) maxError = error;
    }

    TEST_ASSERT_TRUE_MESSAGE(maxError < 1e-4f, "Interpolated table should stay within 1e-4 of sin()");
}

void test_tick_highFrequency_shouldKeepPhaseInUnitRange(void) {
    synth::Oscillator osc(21000.0f, 44100.0f);

    for (int i = 0; i < 100000; ++i) {
        osc.tick();
        float phase = osc.getPhase();
        if (phase < 0.0f || phase >= 1.0f) {
            TEST_FAIL_MESSAGE("Phase left [0, 1)");
        }
    }
}

void test_tick_shouldStayWithinUnitAmplitude(void) {
    synth::Oscillator osc(77.0f, 44100.0f);

    for (int i = 0; i < 44100; ++i) {
        float sample = osc.tick();
        if (sample > 1.0f || sample < -1.0f) {
            TEST_FAIL_MESSAGE("Sample outside [-1, 1]");
        }
    }
}

void test_setFrequency_shouldKeepPhaseAndRecomputeIncrement(void) {
    synth::Oscillator osc(440.0f, 44100.0f);
    for (int i = 0; i < 37; ++i) {
        osc.tick();
    }
    float phaseBefore = osc.getPhase();

    osc.setFrequency(880.0f);

    TEST_ASSERT_EQUAL_FLOAT_MESSAGE(phaseBefore, osc.getPhase(), "Frequency change must not reset phase");
    TEST_ASSERT_EQUAL_FLOAT(880.0f / 44100.0f, osc.getIncrement());
}

void test_setFrequency_shouldNotJumpOutput(void) {
    synth::Oscillator osc(200.0f, 44100.0f);
    float previous = 0.0f;
    for (int i = 0; i < 100; ++i) {
        previous = osc.tick();
    }

    osc.setFrequency(210.0f);
    float next = osc.tick();

    // At 210 Hz one step moves the sine by at most 2*pi*210/44100
    TEST_ASSERT_TRUE_MESSAGE(std::fabs(next - previous) < 0.031f, "Output should be continuous across a frequency change");
}

void test_lookup_shouldBeOddSymmetric(void) {
    const synth::SineTable& table = synth::SineTable::instance();

    for (int i = 1; i < 100; ++i) {
        float phase = static_cast<float>(i) / 200.0f;
        TEST_ASSERT_FLOAT_WITHIN(1e-5f, -table.lookup(phase), table.lookup(1.0f - phase));
    }
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.0f, table.lookup(0.25f));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, -1.0f, table.lookup(0.75f));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.0f, table.lookup(0.5f));
}

void test_twoOscillators_sameFrequency_shouldProduceIdenticalSequences(void) {
    synth::Oscillator a(523.25f, 44100.0f);
    synth::Oscillator b(523.25f, 44100.0f);

    for (int i = 0; i < 1000; ++i) {
        TEST_ASSERT_EQUAL_FLOAT(a.tick(), b.tick());
    }
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_constructor_shouldStartAtZeroPhaseWithDerivedIncrement);
    RUN_TEST(test_tick_shouldReturnSampleForCurrentPhaseThenAdvance);
    RUN_TEST(test_tick_shouldTrackSineWithinTableError);
    RUN_TEST(test_tick_highFrequency_shouldKeepPhaseInUnitRange);
    RUN_TEST(test_tick_shouldStayWithinUnitAmplitude);
    RUN_TEST(test_setFrequency_shouldKeepPhaseAndRecomputeIncrement);
    RUN_TEST(test_setFrequency_shouldNotJumpOutput);
    RUN_TEST(test_lookup_shouldBeOddSymmetric);
    RUN_TEST(test_twoOscillators_sameFrequency_shouldProduceIdenticalSequences);
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
