#ifndef ALSA_PCM_OUT_HPP
#define ALSA_PCM_OUT_HPP

#include <sample_format.hpp>
#include <log.hpp>
#include <alsa/asoundlib.h>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace alsa {

/**
 * @brief ALSA playback device fed with ring descriptors
 *
 * Plays the same role as the I2S peripheral on the board: each transfer()
 * hands one filled descriptor to the device and blocks until it is accepted,
 * which is what paces the render loop. The PCM format matches the slot width
 * of the ring in native byte order (S16 or S32, as packFrame writes them), and
the period is one descriptor.
 */
class AlsaPcmOut {
public:
    /**
     * @brief Native-endian signed PCM format whose sample width is the slot width
     */
    static snd_pcm_format_t pcmFormatFor(const audio::SampleFormat& format) {
        return format.slotBytes == 2 ? SND_PCM_FORMAT_S16 : SND_PCM_FORMAT_S32;
    }

    AlsaPcmOut(const char* deviceName,
               const audio::SampleFormat& format,
               unsigned int sampleRate,
               unsigned int periodFrames)
        : frameBytes_(format.frameBytes())
        , sampleRate_(sampleRate)
        , periodFrames_(periodFrames) {

        int err;

        if ((err = snd_pcm_open(&pcmHandle_, deviceName, SND_PCM_STREAM_PLAYBACK, 0)) < 0) {
            pcmHandle_ = nullptr;
            throw std::runtime_error(std::string("Cannot open audio device: ") + snd_strerror(err));
        }

        snd_pcm_hw_params_t* hwParams;
        snd_pcm_hw_params_alloca(&hwParams);
        snd_pcm_hw_params_any(pcmHandle_, hwParams);

        snd_pcm_format_t pcmFormat = pcmFormatFor(format);
        snd_pcm_hw_params_set_access(pcmHandle_, hwParams, SND_PCM_ACCESS_RW_INTERLEAVED);
        if ((err = snd_pcm_hw_params_set_format(pcmHandle_, hwParams, pcmFormat)) < 0) {
            snd_pcm_close(pcmHandle_);
            throw std::runtime_error(std::string("Sample format not supported: ") + snd_strerror(err));
        }
        snd_pcm_hw_params_set_channels(pcmHandle_, hwParams, 2);
        snd_pcm_hw_params_set_rate_near(pcmHandle_, hwParams, &sampleRate_, 0);
        snd_pcm_hw_params_set_period_size_near(pcmHandle_, hwParams, &periodFrames_, 0);

        if ((err = snd_pcm_hw_params(pcmHandle_, hwParams)) < 0) {
            snd_pcm_close(pcmHandle_);
            throw std::runtime_error(std::string("Cannot set hardware parameters: ") + snd_strerror(err));
        }

        if (sampleRate_ != sampleRate) {
            logWarn("ALSA rate %u Hz differs from requested %u Hz; pitch will be off",
                    sampleRate_, sampleRate);
        }
    }

    ~AlsaPcmOut() {
        if (pcmHandle_) {
            snd_pcm_drain(pcmHandle_);
            snd_pcm_close(pcmHandle_);
        }
    }

    AlsaPcmOut(const AlsaPcmOut&) = delete;
    AlsaPcmOut& operator=(const AlsaPcmOut&) = delete;

    /**
     * @brief Write one descriptor of packed frames, blocking until accepted
     * @throws std::runtime_error if the device cannot recover
     */
    void transfer(const uint8_t* data, size_t bytes) {
        snd_pcm_uframes_t remaining = bytes / frameBytes_;
        while (remaining > 0) {
            snd_pcm_sframes_t frames = snd_pcm_writei(pcmHandle_, data, remaining);

            if (frames < 0) {
                underrunCount_++;
                if (underrunCount_ % 100 == 1) {
                    logWarn("ALSA write error: %s (underrun #%lu)",
                            snd_strerror(static_cast<int>(frames)),
                            static_cast<unsigned long>(underrunCount_));
                }
                frames = snd_pcm_recover(pcmHandle_, static_cast<int>(frames), 1);
            }

            if (frames < 0) {
                throw std::runtime_error(std::string("Audio write failed: ") + snd_strerror(static_cast<int>(frames)));
            }

            data += static_cast<size_t>(frames) * frameBytes_;
            remaining -= static_cast<snd_pcm_uframes_t>(frames);
        }
    }

    unsigned int getSampleRate() const { return sampleRate_; }
    unsigned int getPeriodFrames() const { return static_cast<unsigned int>(periodFrames_); }
    uint32_t getUnderrunCount() const { return underrunCount_; }

private:
    snd_pcm_t* pcmHandle_ = nullptr;
    size_t frameBytes_;
    unsigned int sampleRate_;
    snd_pcm_uframes_t periodFrames_;
    uint32_t underrunCount_ = 0;
};

} // namespace alsa

#endif // ALSA_PCM_OUT_HPP
