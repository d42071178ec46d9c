#pragma once

#include <memory>
#include <string>
#include <vector>

#include "loopy/priv/channels/InstrumentChannel.hpp"

namespace loopy {

    struct MidiInputOptions {
        // libremidi API name; empty picks the platform default.
        std::string api_name{};
        // Name of the virtual input port created when `connect_to` is empty.
        std::string port_name{"loopy In"};
        // If non-empty, listen on the first existing input port whose name contains this text.
        std::string connect_to{};
    };

    // A live MIDI source. Incoming channel voice messages are decoded from UMP and
    // handed to the receiver on the backend's input thread; anything else is ignored.
    class MidiInputDevice {
    public:
        virtual ~MidiInputDevice() = default;

        virtual const std::string& portName() const = 0;
        // Replaces the receiver. nullptr stops forwarding.
        virtual void receiver(std::shared_ptr<LiveEventReceiver> receiver) = 0;
        virtual uint64_t receivedCount() const = 0;
    };

    // Throws BackendUnavailable when the port cannot be opened.
    std::unique_ptr<MidiInputDevice> createLibreMidiInputDevice(const MidiInputOptions& options,
                                                                std::shared_ptr<LiveEventReceiver> receiver);

    std::vector<std::string> listMidiInputPorts(const std::string& apiName = "");

}
