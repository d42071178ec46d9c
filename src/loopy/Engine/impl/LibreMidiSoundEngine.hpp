#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

#include <libremidi/libremidi.hpp>
#include "blockingconcurrentqueue.h"
#include "loopy/loopy.hpp"

namespace loopy {

    class LibreMidiSoundEngine : public SoundEngine {
        MidiOutputOptions options_;
        libremidi::API api_;

        std::mutex port_mutex_;
        std::unique_ptr<libremidi::midi_out> midi_out_;

        moodycamel::BlockingConcurrentQueue<loopy_ump_t> queue_;
        std::atomic<size_t> pending_{0};
        std::atomic<bool> available_{false};
        std::atomic<bool> running_{true};
        std::atomic<uint64_t> dropped_{0};
        std::thread sender_;

        std::unique_ptr<libremidi::midi_out> openPort();
        void onBackendError(std::string_view text);
        SoundEngineStatus enqueue(const MidiMessage& message);
        void runSender();

    public:
        explicit LibreMidiSoundEngine(MidiOutputOptions options);
        ~LibreMidiSoundEngine() override;

        SoundEngineStatus noteOn(uint8_t channel, uint8_t note, uint8_t velocity) override;
        SoundEngineStatus noteOff(uint8_t channel, uint8_t note) override;
        SoundEngineStatus programChange(uint8_t channel, uint8_t program) override;
        SoundEngineStatus send(const MidiMessage& message) override;
        bool available() const override { return available_.load(std::memory_order_acquire); }
        bool reconnect() override;
    };

}
