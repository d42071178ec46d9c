#pragma once

#include <atomic>
#include <chrono>
#include <mutex>

#include "InstrumentChannel.hpp"

namespace loopy {

    enum class ClickMode {
        // click on ticks aligned to stepsPerBeat
        EveryBeat,
        EveryStep
    };

    struct ClickSettings {
        bool enabled{true};
        uint8_t note{60};
        uint8_t velocity{100};
        // Downbeat velocity, as a percentage of `velocity` (clamped to 127).
        uint8_t accentVelocity{127};
        bool accent{true};
        ClickMode mode{ClickMode::EveryBeat};
        // Capped at one beat.
        Nanoseconds clickLength{std::chrono::milliseconds{50}};
    };

    // The audible metronome: a short click on every beat (or step), accented on downbeats.
    class FreeMetronomeChannel : public InstrumentChannel, public TickReceiver {
        mutable std::mutex settings_mutex_;
        ClickSettings settings_;
        std::atomic<uint64_t> clicks_{0};

    public:
        FreeMetronomeChannel(std::string name, InstrumentEntry instrument, ClickSettings settings = {});

        ClickSettings settings() const;
        // Throws InvalidArgument for out-of-range note/velocity or a non-positive click length.
        void settings(const ClickSettings& settings);
        void setEnabled(bool enabled);
        void setMode(ClickMode mode);

        uint64_t clickCount() const { return clicks_.load(); }

        // Velocity of a click, given whether it falls on a downbeat.
        static uint8_t clickVelocity(const ClickSettings& settings, bool downbeat);

        TickReceiver* tickReceiver() override { return this; }

        void onTick(const Tick& tick, NoteOffScheduler& notes) override;
    };

    const char* toString(ClickMode mode);

}
