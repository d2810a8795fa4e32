#include <i2s_dma_sink.hpp>
#include <esp32_demo_task.hpp>
#include <esp32_telemetry_sink.hpp>
#include <synth_application.hpp>
#include <synth_config.hpp>
#include <audio_stats.hpp>
#include <log.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <memory>
#include <stdexcept>

// DMA ring of the reference board: 3 descriptors of 171 stereo 16-bit frames
static constexpr size_t RING_BYTES = 2052;
static constexpr size_t FRAME_BYTES = 4;
static_assert(audio::isValidRingLength(RING_BYTES, FRAME_BYTES),
              "DMA ring length must split into whole frames per descriptor");

// Global instances
static std::unique_ptr<platform::SynthApplication> gSynth;
static std::unique_ptr<esp32::I2sDmaSink> gAudioSink;
static std::unique_ptr<esp32::DemoTask> gDemo;

/**
 * @brief Render loop - pinned to core 1, paced by the blocking I2S write
 */
void audioTask(void* parameter) {
    logInfo("Audio task started on core %d", xPortGetCoreID());

    gSynth->prime();

    while (true) {
        gSynth->pump(*gAudioSink);
    }
}

extern "C" void app_main(void) {
    logInfo("Trivox Synthesizer - ESP32");
    logInfo("==========================");

    platform::SynthConfig config;
    config.ringBufferBytes = RING_BYTES;
    config.format = audio::SampleFormat::pcm16();

    if (config.format.frameBytes() != FRAME_BYTES) {
        logError("Sample format does not match the compile-time frame size");
        return;
    }

    // Create I2S output first to learn the rate the clock dividers achieve
    logInfo("Initializing I2S audio output...");
    gAudioSink = std::make_unique<esp32::I2sDmaSink>(config);
    if (!gAudioSink->isInstalled()) {
        logError("I2S output unavailable, not starting playback");
        return;
    }
    config.sampleRate = static_cast<float>(gAudioSink->getSampleRate());

    logInfo("Initializing synthesizer...");
    auto telemetry = std::make_unique<esp32::Esp32TelemetrySink<platform::AudioStats>>("audio_telem", 0, 0);
    try {
        gSynth = std::make_unique<platform::SynthApplication>(config, std::move(telemetry), 1);
    } catch (const std::exception& e) {
        logError("Invalid configuration: %s", e.what());
        return;
    }

    gDemo = std::make_unique<esp32::DemoTask>(gSynth->takeProducer());

    logInfo("Creating audio task on core 1...");

    TaskHandle_t audioTaskHandle = nullptr;
    xTaskCreatePinnedToCore(
        audioTask,
        "audio",
        8192,
        nullptr,
        2,     // Above the demo and telemetry tasks
        &audioTaskHandle,
        1      // Core 1 (APP_CPU) - dedicated to audio
    );

    if (audioTaskHandle == nullptr) {
        logError("Failed to create audio task!");
        return;
    }

    logInfo("Playback started, app_main running on core %d", xPortGetCoreID());

    while (true) {
        vTaskDelay(pdMS_TO_TICKS(10000));
    }
}
