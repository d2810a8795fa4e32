#ifndef CONTROL_CHANNEL_HPP
#define CONTROL_CHANNEL_HPP

#include "message.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace control {

/**
 * @brief Fixed-capacity single-producer/single-consumer ring
 *
 * Storage is allocated once in the constructor (capacity + 1 slots, one slot
 * stays empty to tell "full" from "empty"). After that neither side allocates,
 * locks or blocks: push fails when full, pop fails when empty.
 *
 * The ring is never used directly by application code. split() hands out one
 * Producer and one Consumer handle; each is move-only, so the single-producer
 * single-consumer discipline is carried by ownership of the handles.
 *
 * @tparam T Trivially copyable element type
 */
template<typename T>
class SpscChannel {
public:
    class Producer;
    class Consumer;

    explicit SpscChannel(size_t capacity)
        : slots_(capacity + 1) {
        if (capacity == 0) {
            throw std::invalid_argument("Control channel capacity must be positive");
        }
    }

    SpscChannel(const SpscChannel&) = delete;
    SpscChannel& operator=(const SpscChannel&) = delete;

    /**
     * @brief Hand out the producer and consumer ends
     *
     * May be called once. The channel must outlive both handles.
     * @throws std::logic_error on a second call
     */
    std::pair<Producer, Consumer> split() {
        if (split_) {
            throw std::logic_error("Control channel already split into producer/consumer");
        }
        split_ = true;
        return std::make_pair(Producer(this), Consumer(this));
    }

    size_t capacity() const { return slots_.size() - 1; }

    size_t size() const {
        size_t write = writePos_.load(std::memory_order_acquire);
        size_t read = readPos_.load(std::memory_order_acquire);
        return (write >= read) ? write - read : write + slots_.size() - read;
    }

    bool empty() const { return size() == 0; }

    /**
     * @brief Producer end. Owned by exactly one input context.
     */
    class Producer {
    public:
        Producer() = default;
        Producer(Producer&& other) : channel_(other.channel_), dropped_(other.dropped_) {
            other.channel_ = nullptr;
        }
        Producer& operator=(Producer&& other) {
            channel_ = other.channel_;
            dropped_ = other.dropped_;
            other.channel_ = nullptr;
            return *this;
        }
        Producer(const Producer&) = delete;
        Producer& operator=(const Producer&) = delete;

        /**
         * @brief Enqueue without blocking
         * @return false if the channel is full; the item is dropped
         */
        bool push(const T& item) {
            if (channel_ == nullptr || !channel_->tryPush(item)) {
                dropped_++;
                return false;
            }
            return true;
        }

        /**
         * @brief Number of items this producer had to drop
         */
        uint32_t droppedCount() const { return dropped_; }

        bool isConnected() const { return channel_ != nullptr; }

    private:
        friend class SpscChannel;
        explicit Producer(SpscChannel* channel) : channel_(channel) {}

        SpscChannel* channel_ = nullptr;
        uint32_t dropped_ = 0;
    };

    /**
     * @brief Consumer end. Owned by the render context.
     */
    class Consumer {
    public:
        Consumer() = default;
        Consumer(Consumer&& other) : channel_(other.channel_) {
            other.channel_ = nullptr;
        }
        Consumer& operator=(Consumer&& other) {
            channel_ = other.channel_;
            other.channel_ = nullptr;
            return *this;
        }
        Consumer(const Consumer&) = delete;
        Consumer& operator=(const Consumer&) = delete;

        /**
         * @brief Dequeue the oldest item without blocking
         * @return false if the channel is empty (item untouched)
         */
        bool pop(T& item) {
            return channel_ != nullptr && channel_->tryPop(item);
        }

        bool isConnected() const { return channel_ != nullptr; }

    private:
        friend class SpscChannel;
        explicit Consumer(SpscChannel* channel) : channel_(channel) {}

        SpscChannel* channel_ = nullptr;
    };

private:
    size_t next(size_t pos) const { return (pos + 1) % slots_.size(); }

    bool tryPush(const T& item) {
        size_t write = writePos_.load(std::memory_order_relaxed);
        size_t nextWrite = next(write);
        if (nextWrite == readPos_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[write] = item;
        writePos_.store(nextWrite, std::memory_order_release);
        return true;
    }

    bool tryPop(T& item) {
        size_t read = readPos_.load(std::memory_order_relaxed);
        if (read == writePos_.load(std::memory_order_acquire)) {
            return false;
        }
        item = slots_[read];
        readPos_.store(next(read), std::memory_order_release);
        return true;
    }

    std::vector<T> slots_;
    std::atomic<size_t> readPos_{0};
    std::atomic<size_t> writePos_{0};
    bool split_ = false;
};

using ControlChannel = SpscChannel<Message>;
using ControlProducer = ControlChannel::Producer;
using ControlConsumer = ControlChannel::Consumer;

} // namespace control

#endif // CONTROL_CHANNEL_HPP
