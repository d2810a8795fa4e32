#ifndef COMMAND_PARSER_HPP
#define COMMAND_PARSER_HPP

#include "message.hpp"
#include <cstdlib>
#include <cerrno>
#include <cmath>
#include <string>
#include <sstream>

namespace control {

/**
 * @brief Text command front-end for the host build
 *
 * Turns one line of text into a Message. This is the host stand-in for the
 * physical controls (buttons, pots, encoders) and only performs syntax
 * checks; range policy stays with the Engine.
 *
 *   select N     deselect     toggle N
 *   freq HZ      vol V        pan P
 *   cutoff HZ    res Q        fmode N
 *   drive D      mode N
 */
class CommandParser {
public:
    /**
     * @brief Parse one command line
     * @param line Input text (leading/trailing whitespace ignored)
     * @param out Receives the message on success
     * @return false for empty, unknown or malformed lines
     */
    static bool parse(const std::string& line, Message& out) {
        std::istringstream in(line);
        std::string command;
        if (!(in >> command)) {
            return false;
        }

        std::string argument;
        bool hasArgument = static_cast<bool>(in >> argument);
        std::string extra;
        if (in >> extra) {
            return false;  // Trailing garbage
        }

        if (command == "deselect") {
            if (hasArgument) return false;
            out = Message::clearSelection();
            return true;
        }

        if (!hasArgument) {
            return false;
        }

        uint8_t index = 0;
        float value = 0.0f;

        if (command == "select" && parseIndex(argument, index)) {
            out = Message::selectVoice(index);
        } else if (command == "toggle" && parseIndex(argument, index)) {
            out = Message::toggleVoice(index);
        } else if (command == "fmode" && parseIndex(argument, index)) {
            out = Message::setFilterMode(index);
        } else if (command == "mode" && parseIndex(argument, index)) {
            out = Message::setOutputMode(index);
        } else if (command == "freq" && parseValue(argument, value)) {
            out = Message::setFrequency(value);
        } else if (command == "vol" && parseValue(argument, value)) {
            out = Message::setVolume(value);
        } else if (command == "pan" && parseValue(argument, value)) {
            out = Message::setPan(value);
        } else if (command == "cutoff" && parseValue(argument, value)) {
            out = Message::setFilterCutoff(value);
        } else if (command == "res" && parseValue(argument, value)) {
            out = Message::setFilterResonance(value);
        } else if (command == "drive" && parseValue(argument, value)) {
            out = Message::setDrive(value);
        } else {
            return false;
        }
        return true;
    }

private:
    static bool parseIndex(const std::string& text, uint8_t& index) {
        char* end = nullptr;
        errno = 0;
        long parsed = std::strtol(text.c_str(), &end, 10);
        if (errno != 0 || end == text.c_str() || *end != '\0') {
            return false;
        }
        if (parsed < 0 || parsed > 255) {
            return false;
        }
        index = static_cast<uint8_t>(parsed);
        return true;
    }

    static bool parseValue(const std::string& text, float& value) {
        char* end = nullptr;
        errno = 0;
        float parsed = std::strtof(text.c_str(), &end);
        if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(parsed)) {
            return false;
        }
        value = parsed;
        return true;
    }
};

} // namespace control

#endif // COMMAND_PARSER_HPP
