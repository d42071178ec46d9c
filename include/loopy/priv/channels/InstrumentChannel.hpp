#pragma once

#include <atomic>
#include <string>

#include "loopy/priv/midi/MidiMessage.hpp"
#include "loopy/priv/project/InstrumentRegistry.hpp"
#include "loopy/priv/sequencer/Metronome.hpp"
#include "loopy/priv/sequencer/NoteOffScheduler.hpp"

namespace loopy {

    // Capability: reacts to Metronome ticks on the playback thread.
    class TickReceiver {
    public:
        virtual ~TickReceiver() = default;
        virtual void onTick(const Tick& tick, NoteOffScheduler& notes) = 0;
    };

    // Capability: forwards live MIDI input. Called on MIDI input threads.
    class LiveEventReceiver {
    public:
        virtual ~LiveEventReceiver() = default;
        virtual void onLiveEvent(const MidiMessage& message) = 0;
    };

    // loopy's routing unit: decides what, if anything, is sent to the SoundEngine for the
    // instrument it is bound to. Variants expose their capabilities through
    // `tickReceiver()` / `liveEventReceiver()`; a channel has one of them, not both.
    class InstrumentChannel {
    public:
        enum class Kind {
            StepSequencer,
            FreeMidi,
            FreeMetronome
        };

    private:
        Kind kind_;
        std::string name_;
        InstrumentEntry instrument_;
        std::atomic<uint8_t> volume_{kFullVolume};

    protected:
        InstrumentChannel(Kind kind, std::string name, InstrumentEntry instrument)
            : kind_(kind), name_(std::move(name)), instrument_(std::move(instrument)) {
        }

    public:
        static constexpr uint8_t kFullVolume = 100;

        virtual ~InstrumentChannel() = default;

        Kind kind() const { return kind_; }
        const std::string& name() const { return name_; }
        const InstrumentEntry& instrument() const { return instrument_; }

        // Percentage applied to the velocity of every note the channel generates on ticks.
        // Live input is forwarded as played. Throws InvalidArgument above 100.
        uint8_t volume() const { return volume_.load(std::memory_order_relaxed); }
        void volume(uint8_t percent);
        // `velocity` scaled by volume(), rounded. 0 means the note is not sent.
        uint8_t scaledVelocity(uint8_t velocity) const;

        virtual TickReceiver* tickReceiver() { return nullptr; }
        virtual LiveEventReceiver* liveEventReceiver() { return nullptr; }

        // Transport is about to start. Called while the playback thread is not running.
        virtual void rewind() {}
        // Release every note this channel sounded outside of the NoteOffScheduler.
        // Returns the number of note-offs sent.
        virtual size_t releaseAll() { return 0; }
    };

    const char* toString(InstrumentChannel::Kind kind);

}
