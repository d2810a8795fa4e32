#pragma once

#include <synth_config.hpp>
#include <log.hpp>
#include <driver/i2s.h>
#include <cstddef>
#include <cstdint>

namespace esp32 {

/**
 * @brief ESP32 I2S output whose DMA descriptors mirror the render ring
 *
 * dma_buf_count equals the ring's descriptor count and dma_buf_len its
 * frames per descriptor, so each transfer() hands exactly one descriptor to
 * the driver. i2s_write blocks until a DMA buffer is free, which paces the
 * render loop at the DAC's sample rate.
 *
 * Pin configuration for PCM5102:
 * - I2S_BCK (bit clock) -> GPIO 26
 * - I2S_WS (word select/LRCK) -> GPIO 25
 * - I2S_DATA_OUT -> GPIO 22
 *
 * PCM5102 analog side: FLT, DEMP and FMT to GND, XSMT to 3v3.
 */
class I2sDmaSink {
public:
    explicit I2sDmaSink(const platform::SynthConfig& config, i2s_port_t i2sPort = I2S_NUM_0)
        : i2sPort_(i2sPort)
        , sampleRate_(static_cast<uint32_t>(config.sampleRate)) {

        i2s_bits_per_sample_t bits = config.format.slotBytes == 2
            ? I2S_BITS_PER_SAMPLE_16BIT
            : I2S_BITS_PER_SAMPLE_32BIT;

        i2s_config_t i2s_config = {
            .mode = (i2s_mode_t)(I2S_MODE_MASTER | I2S_MODE_TX),
            .sample_rate = sampleRate_,
            .bits_per_sample = bits,
            .channel_format = I2S_CHANNEL_FMT_RIGHT_LEFT,
            .communication_format = I2S_COMM_FORMAT_STAND_I2S,
            .intr_alloc_flags = ESP_INTR_FLAG_LEVEL1,
            .dma_buf_count = static_cast<int>(config.descriptorCount),
            .dma_buf_len = static_cast<int>(config.descriptorFrames()),
            .use_apll = true,
            .tx_desc_auto_clear = true,  // Underrun plays silence, not stale audio
            .fixed_mclk = 0,
            .mclk_multiple = I2S_MCLK_MULTIPLE_256,
            .bits_per_chan = I2S_BITS_PER_CHAN_DEFAULT
        };

        i2s_pin_config_t pin_config = {
            .mck_io_num = I2S_PIN_NO_CHANGE,
            .bck_io_num = 26,
            .ws_io_num = 25,
            .data_out_num = 22,
            .data_in_num = I2S_PIN_NO_CHANGE
        };

        esp_err_t err = i2s_driver_install(i2sPort_, &i2s_config, 0, nullptr);
        if (err != ESP_OK) {
            logError("Failed to install I2S driver: %d", err);
            return;
        }

        err = i2s_set_pin(i2sPort_, &pin_config);
        if (err != ESP_OK) {
            i2s_driver_uninstall(i2sPort_);
            logError("Failed to set I2S pins: %d", err);
            return;
        }

        // ESP32 I2S has limited clock divider options, so the achieved rate may differ
        uint32_t actualSampleRate = static_cast<uint32_t>(i2s_get_clk(i2sPort_));
        if (actualSampleRate != sampleRate_) {
            logWarn("I2S actual sample rate %lu Hz differs from requested %lu Hz",
                    static_cast<unsigned long>(actualSampleRate), static_cast<unsigned long>(sampleRate_));
            sampleRate_ = actualSampleRate;
        }

        installed_ = true;
        logInfo("I2S DMA: %lu Hz, %d descriptors x %d frames, %d-bit slots",
                static_cast<unsigned long>(sampleRate_), i2s_config.dma_buf_count,
                i2s_config.dma_buf_len, config.format.slotBytes * 8);
    }

    ~I2sDmaSink() {
        if (installed_) {
            i2s_driver_uninstall(i2sPort_);
        }
    }

    I2sDmaSink(const I2sDmaSink&) = delete;
    I2sDmaSink& operator=(const I2sDmaSink&) = delete;

    /**
     * @brief Queue one descriptor for DMA, blocking until the driver takes it
     */
    void transfer(const uint8_t* data, size_t bytes) {
        size_t bytesWritten = 0;
        esp_err_t err = i2s_write(i2sPort_, data, bytes, &bytesWritten, portMAX_DELAY);

        if (err != ESP_OK) {
            logError("I2S write failed: %d", err);
        }

        if (bytesWritten < bytes) {
            partialWriteCount_++;
            if (partialWriteCount_ % 100 == 1) {
                logWarn("I2S partial write: %d/%d bytes (#%lu)",
                        static_cast<int>(bytesWritten), static_cast<int>(bytes),
                        static_cast<unsigned long>(partialWriteCount_));
            }
        }
    }

    bool isInstalled() const { return installed_; }
    uint32_t getSampleRate() const { return sampleRate_; }
    uint32_t getPartialWriteCount() const { return partialWriteCount_; }

private:
    i2s_port_t i2sPort_;
    uint32_t sampleRate_;
    bool installed_ = false;
    uint32_t partialWriteCount_ = 0;
};

} // namespace esp32
