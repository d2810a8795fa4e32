#pragma once

// printf-style logging. The render path only uses logWarn, and only rate-limited.

#ifdef PLATFORM_ESP32
    #include <esp_log.h>
    #define TRIVOX_LOG_TAG "TRIVOX"

    #define logInfo(fmt, ...) ESP_LOGI(TRIVOX_LOG_TAG, fmt, ##__VA_ARGS__)
    #define logWarn(fmt, ...) ESP_LOGW(TRIVOX_LOG_TAG, fmt, ##__VA_ARGS__)
    #define logError(fmt, ...) ESP_LOGE(TRIVOX_LOG_TAG, fmt, ##__VA_ARGS__)
    #define logDebug(fmt, ...) ESP_LOGD(TRIVOX_LOG_TAG, fmt, ##__VA_ARGS__)
#else
    #include <cstdio>

    // Warnings and errors go to stderr
    #define TRIVOX_LOG(stream, level, fmt, ...) \
        fprintf(stream, "[trivox] " level fmt "\n", ##__VA_ARGS__)

    #define logInfo(fmt, ...) TRIVOX_LOG(stdout, "", fmt, ##__VA_ARGS__)
    #define logWarn(fmt, ...) TRIVOX_LOG(stderr, "WARN: ", fmt, ##__VA_ARGS__)
    #define logError(fmt, ...) TRIVOX_LOG(stderr, "ERROR: ", fmt, ##__VA_ARGS__)
    #define logDebug(fmt, ...) TRIVOX_LOG(stdout, "DEBUG: ", fmt, ##__VA_ARGS__)
#endif
