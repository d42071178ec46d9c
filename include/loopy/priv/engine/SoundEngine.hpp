#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "loopy/priv/midi/MidiMessage.hpp"

namespace loopy {

    enum class SoundEngineStatus {
        OK,
        INVALID_ARGUMENT,
        // The outgoing queue is full; the caller may retry.
        QUEUE_FULL,
        // The synthesis backend cannot accept events (e.g. the port went away).
        BACKEND_UNAVAILABLE
    };

    const char* toString(SoundEngineStatus status);

    // Boundary to the synthesis backend. Calls come from the playback thread and from
    // live MIDI input threads, so implementations must not block: queue if necessary.
    class SoundEngine {
    public:
        virtual ~SoundEngine() = default;

        virtual SoundEngineStatus noteOn(uint8_t channel, uint8_t note, uint8_t velocity) = 0;
        virtual SoundEngineStatus noteOff(uint8_t channel, uint8_t note) = 0;
        virtual SoundEngineStatus programChange(uint8_t channel, uint8_t program) = 0;
        // Raw passthrough of any MIDI 1.0 channel message.
        virtual SoundEngineStatus send(const MidiMessage& message) = 0;
        virtual bool available() const = 0;
        // Tries to bring an unavailable backend back. Returns available().
        virtual bool reconnect() { return available(); }
    };

    struct MidiOutputOptions {
        // libremidi API name ("ALSA", "PIPEWIRE", "JACK", ...); empty picks the platform default.
        std::string api_name{};
        // Name of the virtual output port loopy creates.
        std::string port_name{"loopy"};
        // If non-empty, connect to the first existing output port whose name contains
        // this text instead of creating a virtual port.
        std::string connect_to{};
        size_t queue_capacity{4096};
    };

    // SoundEngine that emits UMP to a libremidi output port through a lock-free queue
    // and a dedicated sender thread. Throws BackendUnavailable if the port cannot be opened.
    std::unique_ptr<SoundEngine> createLibreMidiSoundEngine(const MidiOutputOptions& options);

    // Names of the output ports visible through the given API. Throws BackendUnavailable
    // when there is no UMP-capable API.
    std::vector<std::string> listMidiOutputPorts(const std::string& apiName = "");

}
