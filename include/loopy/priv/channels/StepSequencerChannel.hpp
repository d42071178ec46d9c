#pragma once

#include <atomic>
#include <memory>

#include "InstrumentChannel.hpp"
#include "loopy/priv/sequencer/Sequence.hpp"

namespace loopy {

    // Plays its Sequence, one Step per tick.
    class StepSequencerChannel : public InstrumentChannel, public TickReceiver {
        Sequence sequence_;
        std::atomic<bool> muted_{false};
        std::atomic<uint64_t> triggered_{0};

    public:
        StepSequencerChannel(std::string name, InstrumentEntry instrument, size_t length = 16);

        Sequence& sequence() { return sequence_; }
        const Sequence& sequence() const { return sequence_; }

        bool muted() const { return muted_.load(); }
        void muted(bool value) { muted_.store(value); }

        // Note-ons this channel handed to the scheduler and the engine accepted.
        uint64_t triggeredCount() const { return triggered_.load(); }

        TickReceiver* tickReceiver() override { return this; }
        void rewind() override { sequence_.rewind(); }

        void onTick(const Tick& tick, NoteOffScheduler& notes) override;
    };

}
