#pragma once

#include <atomic>
#include <mutex>
#include <set>
#include <vector>

#include "InstrumentChannel.hpp"
#include "loopy/priv/engine/SoundEngine.hpp"

namespace loopy {

    // Forwards live MIDI input to its instrument's MIDI channel. Ignores ticks.
    //
    // Every note-on it forwards is paired with exactly one note-off: repeated note-ons
    // for a held note and note-offs for notes that are not held are dropped, and
    // disarming or removing the channel releases whatever is still held.
    class FreeMidiChannel : public InstrumentChannel, public LiveEventReceiver {
        SoundEngine& engine_;
        std::atomic<bool> armed_{true};
        std::mutex held_mutex_;
        std::set<uint8_t> held_;

        SoundEngineStatus sendNoteOff(uint8_t note);

    public:
        FreeMidiChannel(std::string name, InstrumentEntry instrument, SoundEngine& engine);

        bool armed() const { return armed_.load(); }
        // Disarming releases every held note and drops further input.
        void setArmed(bool armed);

        std::vector<uint8_t> heldNotes();

        LiveEventReceiver* liveEventReceiver() override { return this; }
        size_t releaseAll() override;

        void onLiveEvent(const MidiMessage& message) override;
    };

}
