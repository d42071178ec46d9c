#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "loopy/priv/CommonTypes.hpp"

namespace loopy {

    // A MIDI 1.0 channel voice message. This is what live input delivers and what
    // SoundEngine implementations ultimately emit (as UMP).
    struct MidiMessage {
        enum class Type : uint8_t {
            NOTE_OFF = 0x80,
            NOTE_ON = 0x90,
            POLY_PRESSURE = 0xA0,
            CONTROL_CHANGE = 0xB0,
            PROGRAM_CHANGE = 0xC0,
            CHANNEL_PRESSURE = 0xD0,
            PITCH_BEND = 0xE0
        };

        uint8_t status{0};
        uint8_t data1{0};
        uint8_t data2{0};

        static MidiMessage noteOn(uint8_t channel, uint8_t note, uint8_t velocity) {
            return {static_cast<uint8_t>(0x90 | (channel & 0xF)), note, velocity};
        }
        static MidiMessage noteOff(uint8_t channel, uint8_t note, uint8_t velocity = 0) {
            return {static_cast<uint8_t>(0x80 | (channel & 0xF)), note, velocity};
        }
        static MidiMessage controlChange(uint8_t channel, uint8_t index, uint8_t value) {
            return {static_cast<uint8_t>(0xB0 | (channel & 0xF)), index, value};
        }
        static MidiMessage programChange(uint8_t channel, uint8_t program) {
            return {static_cast<uint8_t>(0xC0 | (channel & 0xF)), program, 0};
        }

        Type type() const { return static_cast<Type>(status & 0xF0); }
        uint8_t channel() const { return status & 0xF; }
        MidiMessage withChannel(uint8_t channel) const {
            return {static_cast<uint8_t>((status & 0xF0) | (channel & 0xF)), data1, data2};
        }

        // note-on with velocity 0 counts as a note-off, as in MIDI 1.0 running status streams.
        bool isNoteOn() const { return type() == Type::NOTE_ON && data2 > 0; }
        bool isNoteOff() const { return type() == Type::NOTE_OFF || (type() == Type::NOTE_ON && data2 == 0); }

        // Encodes as a MIDI 1.0 channel voice UMP (message type 2).
        loopy_ump_t toUmp(uint8_t group = 0) const;
        // Decodes a MIDI 1.0 or MIDI 2.0 channel voice UMP. MIDI 2.0 values are downscaled
        // to 7 bits. Returns nullopt for other message types.
        static std::optional<MidiMessage> fromUmp(const loopy_ump_t* ump, size_t sizeInBytes);

        bool operator==(const MidiMessage& other) const = default;
    };

}
