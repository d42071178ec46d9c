#include "loopy/loopy.hpp"
#include "cmidi2.h"

namespace loopy {

    loopy_ump_t MidiMessage::toUmp(uint8_t group) const {
        return cmidi2_ump_midi1_message(group, status & 0xF0, status & 0xF, data1 & 0x7F, data2 & 0x7F);
    }

    std::optional<MidiMessage> MidiMessage::fromUmp(const loopy_ump_t* ump, size_t sizeInBytes) {
        if (ump == nullptr || sizeInBytes < sizeof(loopy_ump_t))
            return std::nullopt;
        auto u = const_cast<cmidi2_ump*>(reinterpret_cast<const cmidi2_ump*>(ump));
        if (cmidi2_ump_get_message_size_bytes(u) > sizeInBytes)
            return std::nullopt;

        auto code = cmidi2_ump_get_status_code(u);
        auto channel = cmidi2_ump_get_channel(u);
        MidiMessage msg{static_cast<uint8_t>(code | channel), 0, 0};

        switch (cmidi2_ump_get_message_type(u)) {
            case CMIDI2_MESSAGE_TYPE_MIDI_1_CHANNEL:
                msg.data1 = cmidi2_ump_get_midi1_byte2(u);
                msg.data2 = cmidi2_ump_get_midi1_byte3(u);
                return msg;
            case CMIDI2_MESSAGE_TYPE_MIDI_2_CHANNEL:
                switch (code) {
                    case CMIDI2_STATUS_NOTE_ON:
                    case CMIDI2_STATUS_NOTE_OFF: {
                        msg.data1 = cmidi2_ump_get_midi2_note_note(u);
                        auto velocity = static_cast<uint8_t>(cmidi2_ump_get_midi2_note_velocity(u) >> 9);
                        // a MIDI 2.0 note-on never means note-off, even with tiny velocity.
                        if (code == CMIDI2_STATUS_NOTE_ON && velocity == 0)
                            velocity = 1;
                        msg.data2 = velocity;
                        return msg;
                    }
                    case CMIDI2_STATUS_PAF:
                        msg.data1 = cmidi2_ump_get_midi2_paf_note(u);
                        msg.data2 = static_cast<uint8_t>(cmidi2_ump_get_midi2_paf_data(u) >> 25);
                        return msg;
                    case CMIDI2_STATUS_CC:
                        msg.data1 = cmidi2_ump_get_midi2_cc_index(u);
                        msg.data2 = static_cast<uint8_t>(cmidi2_ump_get_midi2_cc_data(u) >> 25);
                        return msg;
                    case CMIDI2_STATUS_PROGRAM:
                        msg.data1 = cmidi2_ump_get_midi2_program_program(u);
                        return msg;
                    case CMIDI2_STATUS_CAF:
                        msg.data1 = static_cast<uint8_t>(cmidi2_ump_get_midi2_caf_data(u) >> 25);
                        return msg;
                    case CMIDI2_STATUS_PITCH_BEND: {
                        auto bend = cmidi2_ump_get_midi2_pitch_bend_data(u) >> 18;
                        msg.data1 = static_cast<uint8_t>(bend & 0x7F);
                        msg.data2 = static_cast<uint8_t>((bend >> 7) & 0x7F);
                        return msg;
                    }
                    default:
                        // RPN/NRPN and per-note controllers have no MIDI 1.0 single-message form.
                        return std::nullopt;
                }
            default:
                return std::nullopt;
        }
    }

}
