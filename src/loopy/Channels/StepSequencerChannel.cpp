#include "loopy/loopy.hpp"

#include <algorithm>

namespace loopy {

    StepSequencerChannel::StepSequencerChannel(std::string name, InstrumentEntry instrument, size_t length)
        : InstrumentChannel(Kind::StepSequencer, std::move(name), std::move(instrument)),
          sequence_(length) {
    }

    void StepSequencerChannel::onTick(const Tick& tick, NoteOffScheduler& notes) {
        // the head moves on every tick, muted or not, so that unmuting stays in phase.
        auto step = sequence_.advance();
        if (!step || !step->sounds() || muted_.load(std::memory_order_relaxed))
            return;
        auto velocity = scaledVelocity(step->velocity);
        if (velocity == 0)
            return;

        auto duration = step->duration.count() == 0 ? tick.interval : step->duration;
        // a note must be released before the same step comes around again.
        auto loopLength = tick.interval * static_cast<Nanoseconds::rep>(sequence_.length());
        if (loopLength.count() > 0)
            duration = std::min(duration, loopLength);

        const auto midiChannel = instrument().channel;
        if (notes.trigger(midiChannel, step->note, velocity, tick.time + duration) == SoundEngineStatus::OK)
            triggered_.fetch_add(1, std::memory_order_relaxed);
    }

}
