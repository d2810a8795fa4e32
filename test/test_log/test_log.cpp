#include <unity.h>
#include <log.hpp>
#include <cstdio>
#include <string>

static FILE* capture = nullptr;

static std::string captured() {
    fflush(capture);
    rewind(capture);
    std::string text;
    char buffer[128];
    while (fgets(buffer, sizeof(buffer), capture) != nullptr) {
        text += buffer;
    }
    return text;
}

void setUp(void) {
    capture = tmpfile();
}

void tearDown(void) {
    if (capture != nullptr) {
        fclose(capture);
        capture = nullptr;
    }
}

void test_hostLog_shouldPrefixProjectAndLevel(void) {
    TEST_ASSERT_NOT_NULL(capture);

    TRIVOX_LOG(capture, "WARN: ", "Render cycle took %d us", 4200);

    TEST_ASSERT_EQUAL_STRING("[trivox] WARN: Render cycle took 4200 us\n", captured().c_str());
}

void test_hostLog_withoutArguments_shouldPrintFormatVerbatim(void) {
    TEST_ASSERT_NOT_NULL(capture);

    TRIVOX_LOG(capture, "", "Playback stopped.");

    TEST_ASSERT_EQUAL_STRING("[trivox] Playback stopped.\n", captured().c_str());
}

void test_logMacros_shouldAcceptFormatsWithAndWithoutArguments(void) {
    // Compile-time check that every level expands for both call shapes
    logInfo("info");
    logInfo("info %d", 1);
    logWarn("warn");
    logWarn("warn %s", "x");
    logError("error");
    logError("error %u", 2u);
    logDebug("debug");
    logDebug("debug %d", 3);

    TEST_PASS();
}

int RUN_UNITY_TESTS() {
    UNITY_BEGIN();
    RUN_TEST(test_hostLog_shouldPrefixProjectAndLevel);
    RUN_TEST(test_hostLog_withoutArguments_shouldPrintFormatVerbatim);
    RUN_TEST(test_logMacros_shouldAcceptFormatsWithAndWithoutArguments);
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
