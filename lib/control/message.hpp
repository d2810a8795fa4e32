#ifndef MESSAGE_HPP
#define MESSAGE_HPP

#include <cstdint>

namespace control {

/**
 * @brief Control command sent from input producers to the render context
 *
 * A closed set of tagged variants, each carrying at most one numeric payload.
 * Messages are small and trivially copyable so they can travel through the
 * lock-free ControlChannel by value.
 *
 * Payloads are not validated by the sender. The Engine clamps or ignores
 * whatever arrives. New capabilities are added as new Type values; the
 * Engine's dispatch switch has no default case, so the compiler flags any
 * variant left unhandled.
 */
struct Message {
    enum class Type : uint8_t {
        SelectVoice,        // index
        ClearSelection,     // no payload
        ToggleVoice,        // index
        SetFrequency,       // value (Hz), selected voice
        SetVolume,          // value [0, 1], selected voice
        SetPan,             // value [-1, 1], selected voice
        SetFilterCutoff,    // value (Hz), <= 0 bypasses the post filter
        SetFilterResonance, // value (Q)
        SetFilterMode,      // index
        SetDrive,           // value [0, 1]
        SetOutputMode       // index
    };

    Type type;
    union {
        uint8_t index;
        float value;
    };

    static Message selectVoice(uint8_t index) { return withIndex(Type::SelectVoice, index); }
    static Message clearSelection() { return withIndex(Type::ClearSelection, 0); }
    static Message toggleVoice(uint8_t index) { return withIndex(Type::ToggleVoice, index); }
    static Message setFrequency(float hz) { return withValue(Type::SetFrequency, hz); }
    static Message setVolume(float level) { return withValue(Type::SetVolume, level); }
    static Message setPan(float pan) { return withValue(Type::SetPan, pan); }
    static Message setFilterCutoff(float hz) { return withValue(Type::SetFilterCutoff, hz); }
    static Message setFilterResonance(float q) { return withValue(Type::SetFilterResonance, q); }
    static Message setFilterMode(uint8_t index) { return withIndex(Type::SetFilterMode, index); }
    static Message setDrive(float drive) { return withValue(Type::SetDrive, drive); }
    static Message setOutputMode(uint8_t index) { return withIndex(Type::SetOutputMode, index); }

    /**
     * @brief True if the variant carries an index payload
     */
    bool hasIndex() const {
        return type == Type::SelectVoice
            || type == Type::ToggleVoice
            || type == Type::SetFilterMode
            || type == Type::SetOutputMode;
    }

    /**
     * @brief True if the variant carries a float payload
     */
    bool hasValue() const {
        return !hasIndex() && type != Type::ClearSelection;
    }

    bool operator==(const Message& other) const {
        if (type != other.type) return false;
        if (hasIndex()) return index == other.index;
        if (hasValue()) return value == other.value;
        return true;
    }

    bool operator!=(const Message& other) const { return !(*this == other); }

private:
    static Message withIndex(Type type, uint8_t index) {
        Message msg;
        msg.type = type;
        msg.value = 0.0f;
        msg.index = index;
        return msg;
    }

    static Message withValue(Type type, float value) {
        Message msg;
        msg.type = type;
        msg.value = value;
        return msg;
    }
};

/**
 * @brief Human readable variant name (logging and diagnostics)
 */
inline const char* typeName(Message::Type type) {
    switch (type) {
        case Message::Type::SelectVoice: return "SelectVoice";
        case Message::Type::ClearSelection: return "ClearSelection";
        case Message::Type::ToggleVoice: return "ToggleVoice";
        case Message::Type::SetFrequency: return "SetFrequency";
        case Message::Type::SetVolume: return "SetVolume";
        case Message::Type::SetPan: return "SetPan";
        case Message::Type::SetFilterCutoff: return "SetFilterCutoff";
        case Message::Type::SetFilterResonance: return "SetFilterResonance";
        case Message::Type::SetFilterMode: return "SetFilterMode";
        case Message::Type::SetDrive: return "SetDrive";
        case Message::Type::SetOutputMode: return "SetOutputMode";
    }
    return "Unknown";
}

} // namespace control

#endif // MESSAGE_HPP
