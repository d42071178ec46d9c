#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <libremidi/libremidi.hpp>
#include "loopy/loopy.hpp"

namespace loopy {

    class LibreMidiInputDevice : public MidiInputDevice {
        std::string port_name_;
        std::shared_ptr<LiveEventReceiver> receiver_;
        std::atomic<uint64_t> received_{0};
        std::unique_ptr<libremidi::midi_in> midi_in_;

        void inputCallback(libremidi::ump&& message);

    public:
        LibreMidiInputDevice(const MidiInputOptions& options, std::shared_ptr<LiveEventReceiver> receiver);
        ~LibreMidiInputDevice() override;

        const std::string& portName() const override { return port_name_; }
        void receiver(std::shared_ptr<LiveEventReceiver> receiver) override;
        uint64_t receivedCount() const override { return received_.load(); }
    };

}
