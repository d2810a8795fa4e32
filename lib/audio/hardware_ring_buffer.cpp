#include "hardware_ring_buffer.hpp"
#include <log.hpp>
#include <stdexcept>

namespace audio {

std::string RingBufferConfig::validate() const {
    if (frameBytes == 0) {
        return "frame size must be positive";
    }
    if (descriptorCount == 0) {
        return "descriptor count must be positive";
    }
    if (totalBytes == 0) {
        return "ring buffer length must be positive";
    }
    if (totalBytes > smallBufferThreshold) {
        return "ring buffer length " + std::to_string(totalBytes)
            + " exceeds the " + std::to_string(smallBufferThreshold)
            + " byte small-buffer threshold";
    }
    size_t unit = lcm(descriptorCount, frameBytes);
    if (totalBytes % unit != 0) {
        return "ring buffer length " + std::to_string(totalBytes)
            + " is not a multiple of lcm(" + std::to_string(descriptorCount)
            + ", " + std::to_string(frameBytes) + ") = " + std::to_string(unit)
            + "; descriptors would end mid-frame";
    }
    return std::string();
}

HardwareRingBuffer::HardwareRingBuffer(const RingBufferConfig& config)
    : frameBytes_(config.frameBytes)
{
    std::string error = config.validate();
    if (!error.empty()) {
        throw std::invalid_argument("Invalid ring buffer configuration: " + error);
    }

    arena_.assign(config.totalBytes, 0);

    // Contiguous split; with a valid size every descriptor is total / count
    size_t base = config.totalBytes / config.descriptorCount;
    size_t extra = config.totalBytes % config.descriptorCount;
    size_t offset = 0;
    descriptors_.reserve(config.descriptorCount);
    for (size_t i = 0; i < config.descriptorCount; ++i) {
        size_t length = base + (i < extra ? 1 : 0);
        descriptors_.push_back(Descriptor{offset, length, 0, false});
        offset += length;
    }

    logInfo("Ring buffer: %zu bytes, %zu descriptors of %zu bytes (%zu frames each)",
            config.totalBytes, config.descriptorCount, base, base / frameBytes_);
}

bool HardwareRingBuffer::windowAvailable() const {
    return !descriptors_[fillIndex_].hardwareOwned;
}

Window HardwareRingBuffer::acquireWindow() const {
    const Descriptor& descriptor = descriptors_[fillIndex_];
    if (descriptor.hardwareOwned) {
        return Window{descriptor.offset, 0};
    }
    return Window{descriptor.offset + descriptor.filled, descriptor.length - descriptor.filled};
}

size_t HardwareRingBuffer::commit(size_t bytes) {
    Descriptor& descriptor = descriptors_[fillIndex_];
    if (descriptor.hardwareOwned) {
        if (bytes > 0) {
            overrunCommits_++;
        }
        return 0;
    }

    size_t remaining = descriptor.length - descriptor.filled;
    if (bytes > remaining) {
        overrunCommits_++;
        bytes = remaining;
    }

    descriptor.filled += bytes;
    if (descriptor.filled == descriptor.length) {
        descriptor.hardwareOwned = true;
        fillIndex_ = (fillIndex_ + 1) % descriptors_.size();
    }
    return bytes;
}

bool HardwareRingBuffer::transferPending() const {
    return descriptors_[transferIndex_].hardwareOwned;
}

Window HardwareRingBuffer::transferWindow() const {
    const Descriptor& descriptor = descriptors_[transferIndex_];
    if (!descriptor.hardwareOwned) {
        return Window{descriptor.offset, 0};
    }
    return Window{descriptor.offset, descriptor.length};
}

void HardwareRingBuffer::completeTransfer() {
    Descriptor& descriptor = descriptors_[transferIndex_];
    if (!descriptor.hardwareOwned) {
        return;
    }
    descriptor.filled = 0;
    descriptor.hardwareOwned = false;
    transferIndex_ = (transferIndex_ + 1) % descriptors_.size();
}

size_t HardwareRingBuffer::maxDescriptorLength() const {
    size_t longest = 0;
    for (const auto& descriptor : descriptors_) {
        if (descriptor.length > longest) {
            longest = descriptor.length;
        }
    }
    return longest;
}

} // namespace audio
