#ifndef COMMAND_READER_HPP
#define COMMAND_READER_HPP

#include "command_parser.hpp"
#include "control_channel.hpp"
#include <log.hpp>
#include <poll.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

namespace control {

/**
 * @brief Host producer that turns lines from a file descriptor into Messages
 *
 * Waits on the descriptor with poll() and a timeout instead of a blocking
 * getline, so the owning thread notices a stop request within one timeout
 * and can be joined before the channel it pushes into goes away.
 */
class CommandReader {
public:
    CommandReader(int fd, ControlProducer producer)
        : fd_(fd)
        , producer_(std::move(producer)) {
    }

    CommandReader(const CommandReader&) = delete;
    CommandReader& operator=(const CommandReader&) = delete;

    /**
     * @brief Read and dispatch whatever arrives within the timeout
     * @param timeoutMs poll() timeout in milliseconds
     * @return false once the descriptor reached end of file
     * @throws std::runtime_error if poll() or read() fails
     */
    bool pollOnce(int timeoutMs) {
        if (eof_) {
            return false;
        }

        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                return true;
            }
            throw std::runtime_error(std::string("Command input poll failed: ") + std::strerror(errno));
        }
        if (ready == 0) {
            return true;
        }

        char buffer[256];
        ssize_t bytesRead = ::read(fd_, buffer, sizeof(buffer));
        if (bytesRead < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                return true;
            }
            throw std::runtime_error(std::string("Command input read failed: ") + std::strerror(errno));
        }
        if (bytesRead == 0) {
            // A last line without newline still counts
            if (!pending_.empty()) {
                dispatch(pending_);
                pending_.clear();
            }
            eof_ = true;
            return false;
        }

        for (ssize_t i = 0; i < bytesRead; ++i) {
            if (buffer[i] == '\n') {
                dispatch(pending_);
                pending_.clear();
            } else {
                pending_ += buffer[i];
            }
        }
        return true;
    }

    /**
     * @brief Dispatch lines until stopped or end of file
     * @param running Cleared by another thread to stop within one timeout
     */
    void run(const std::atomic<bool>& running, int timeoutMs = 100) {
        while (running && pollOnce(timeoutMs)) {
        }
    }

    uint32_t getAcceptedCount() const { return accepted_; }
    uint32_t getRejectedCount() const { return rejected_; }
    uint32_t getDroppedCount() const { return producer_.droppedCount(); }

private:
    void dispatch(const std::string& line) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            return;
        }
        Message msg;
        if (!CommandParser::parse(line, msg)) {
            rejected_++;
            logWarn("Unrecognized command: %s", line.c_str());
            return;
        }
        if (!producer_.push(msg)) {
            logWarn("Control channel full, dropped %s", typeName(msg.type));
            return;
        }
        accepted_++;
    }

    int fd_;
    ControlProducer producer_;
    std::string pending_;
    bool eof_ = false;
    uint32_t accepted_ = 0;
    uint32_t rejected_ = 0;
};

} // namespace control

#endif // COMMAND_READER_HPP
