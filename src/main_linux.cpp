#include <alsa_pcm_out.hpp>
#include <synth_application.hpp>
#include <synth_config.hpp>
#include <command_reader.hpp>
#include <demo_sequence.hpp>
#include <telemetry_sink.hpp>
#include <audio_stats.hpp>
#include <log.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>
#include <thread>
#include <utility>
#include <unistd.h>

std::atomic<bool> running(true);

void signalHandler(int signum) {
    running = false;
}

/**
 * @brief Producer thread: one text command per line from stdin
 */
static void runCommandReader(control::ControlProducer producer) {
    control::CommandReader reader(STDIN_FILENO, std::move(producer));
    try {
        reader.run(running);
    } catch (const std::exception& e) {
        logError("Command input stopped: %s", e.what());
    }
    logInfo("Command input closed after %lu commands", static_cast<unsigned long>(reader.getAcceptedCount()));
}

/**
 * @brief Producer thread: scripted demo sequence
 */
static void runDemo(control::ControlProducer producer) {
    control::DemoSequence sequence;
    while (running) {
        control::DemoSequence::Step step = sequence.next();
        producer.push(step.message);
        std::this_thread::sleep_for(std::chrono::milliseconds(step.delayMs > 0 ? step.delayMs : 1));
    }
}

extern "C" {
  int app_main(const char* pcmDevice, bool demo);
  int main(int argc, char** argv);
}

int app_main(const char* pcmDevice, bool demo) {
    try {
        logInfo("Trivox Synthesizer - Linux");
        logInfo("==========================");

        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);

        platform::SynthConfig config;
        config.validate();

        logInfo("Opening audio device: %s", pcmDevice);
        alsa::AlsaPcmOut audioSink(pcmDevice, config.format,
                                   static_cast<unsigned int>(config.sampleRate),
                                   static_cast<unsigned int>(config.descriptorFrames()));
        config.sampleRate = static_cast<float>(audioSink.getSampleRate());
        logInfo("Audio: %u Hz, %u frames/period", audioSink.getSampleRate(), audioSink.getPeriodFrames());

        platform::SynthApplication synth(
            config,
            std::make_unique<features::JsonLinesTelemetrySink<platform::AudioStats>>(stderr));

        std::thread producerThread;
        if (demo) {
            logInfo("Playing demo sequence (Ctrl+C to stop)");
            producerThread = std::thread(runDemo, synth.takeProducer());
        } else {
            logInfo("Reading commands from stdin (Ctrl+C to stop)");
            logInfo("  select N | deselect | toggle N | freq HZ | vol V | pan P");
            logInfo("  cutoff HZ | res Q | fmode N | drive D | mode N");
            producerThread = std::thread(runCommandReader, synth.takeProducer());
        }

        try {
            synth.prime();
            while (running) {
                synth.pump(audioSink);
            }
        } catch (...) {
            running = false;
            if (producerThread.joinable()) {
                producerThread.join();
            }
            throw;
        }

        if (producerThread.joinable()) {
            producerThread.join();
        }

        logInfo("Playback stopped.");
        return 0;

    } catch (const std::exception& e) {
        logError("Error: %s", e.what());
        return 1;
    }
}

int main(int argc, char** argv) {
    const char* pcmDevice = "default";
    bool demo = false;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--demo") == 0) {
            demo = true;
        } else {
            pcmDevice = argv[i];
        }
    }
    return app_main(pcmDevice, demo);
}
