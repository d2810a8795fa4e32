#include "render_cycle.hpp"
#include <log.hpp>
#include <stdexcept>
#include <utility>

namespace audio {

RenderCycle::RenderCycle(synth::Engine& engine,
                         control::ControlConsumer consumer,
                         const SampleFormat& format,
                         size_t maxWindowBytes,
                         platform::MicrosClock clock)
    : engine_(engine)
    , consumer_(std::move(consumer))
    , format_(format)
    , frameBytes_(format.frameBytes())
    , clock_(clock)
{
    if (!format_.isValid()) {
        throw std::invalid_argument("Render cycle needs a valid sample format");
    }

    size_t maxFrames = maxWindowBytes / frameBytes_;
    if (maxFrames == 0) {
        maxFrames = 1;
    }
    scratch_.resize(maxFrames);
}

size_t RenderCycle::drainMessages() {
    size_t applied = 0;
    control::Message msg;
    while (consumer_.pop(msg)) {
        engine_.processMessage(msg);
        applied++;
    }
    return applied;
}

size_t RenderCycle::render(uint8_t* window, size_t length) {
    uint32_t start = clock_();

    // Everything enqueued before this point is visible in this window's audio
    messagesApplied_ += static_cast<uint32_t>(drainMessages());

    size_t completeFrames = length / frameBytes_;
    if (completeFrames == 0) {
        stalledWindows_++;
        if (stalledWindows_ % 100 == 1) {
            logWarn("Window of %zu bytes holds no complete %zu-byte frame (stall #%lu)",
                    length, frameBytes_, static_cast<unsigned long>(stalledWindows_));
        }
        recordCycle(clock_() - start, 0);
        return 0;
    }

    uint8_t* out = window;
    size_t remaining = completeFrames;
    while (remaining > 0) {
        size_t chunk = remaining < scratch_.size() ? remaining : scratch_.size();
        engine_.render(scratch_.data(), chunk);
        for (size_t i = 0; i < chunk; ++i) {
            packFrame(scratch_[i], format_, out);
            out += frameBytes_;
        }
        remaining -= chunk;
    }

    size_t consumed = completeFrames * frameBytes_;
    bytesRendered_ += consumed;

    uint32_t windowDuration = static_cast<uint32_t>(
        static_cast<double>(completeFrames) * 1000000.0 / static_cast<double>(engine_.getSampleRate()));
    recordCycle(clock_() - start, windowDuration);

    return consumed;
}

size_t RenderCycle::fill(HardwareRingBuffer& ring) {
    if (!ring.windowAvailable()) {
        return 0;
    }
    Window window = ring.acquireWindow();
    size_t consumed = render(ring.windowData(window), window.length);
    return ring.commit(consumed);
}

size_t RenderCycle::prime(HardwareRingBuffer& ring) {
    size_t total = 0;
    while (ring.windowAvailable()) {
        size_t bytes = fill(ring);
        if (bytes == 0) {
            logError("Priming stalled after %zu bytes; ring layout does not match the frame size", total);
            break;
        }
        total += bytes;
    }
    logInfo("Ring primed with %zu bytes of rendered audio", total);
    return total;
}

void RenderCycle::recordCycle(uint32_t elapsed, uint32_t windowDuration) {
    cycleCount_++;
    totalCycleTime_ += elapsed;
    if (elapsed > maxCycleTime_) {
        maxCycleTime_ = elapsed;
    }

    if (windowDuration > 0) {
        lastWindowDuration_ = windowDuration;
        if (elapsed > windowDuration) {
            deadlineMisses_++;
            if (deadlineMisses_ % 100 == 1) {
                logWarn("Render cycle took %lu us for a %lu us window (miss #%lu)",
                        static_cast<unsigned long>(elapsed),
                        static_cast<unsigned long>(windowDuration),
                        static_cast<unsigned long>(deadlineMisses_));
            }
        }
    }
}

platform::AudioStats RenderCycle::takeStats(uint8_t coreId) {
    platform::AudioStats stats;
    stats.cycleCount = cycleCount_;
    stats.messagesApplied = messagesApplied_;
    stats.avgCycleTime = cycleCount_ > 0 ? static_cast<uint32_t>(totalCycleTime_ / cycleCount_) : 0;
    stats.maxCycleTime = maxCycleTime_;
    stats.windowDuration = lastWindowDuration_;
    stats.deadlineMissCount = deadlineMisses_;
    stats.stalledWindowCount = stalledWindows_;
    stats.ignoredMessageCount = engine_.getIgnoredMessageCount();
    stats.bytesRendered = bytesRendered_;
    stats.coreId = coreId;

    cycleCount_ = 0;
    messagesApplied_ = 0;
    totalCycleTime_ = 0;
    maxCycleTime_ = 0;

    return stats;
}

} // namespace audio
