#include "loopy/loopy.hpp"

#include <format>

namespace loopy {

    void InstrumentChannel::volume(uint8_t percent) {
        if (percent > kFullVolume)
            throw InvalidArgument(std::format("volume {} is out of range (0-100)", static_cast<int>(percent)));
        volume_.store(percent, std::memory_order_relaxed);
    }

    uint8_t InstrumentChannel::scaledVelocity(uint8_t velocity) const {
        auto percent = volume();
        if (percent == kFullVolume)
            return velocity;
        return static_cast<uint8_t>((velocity * percent + kFullVolume / 2) / kFullVolume);
    }

    const char* toString(InstrumentChannel::Kind kind) {
        switch (kind) {
            case InstrumentChannel::Kind::StepSequencer: return "step_sequencer";
            case InstrumentChannel::Kind::FreeMidi: return "free_midi";
            case InstrumentChannel::Kind::FreeMetronome: return "free_metronome";
        }
        return "unknown";
    }

}
