#include "loopy/loopy.hpp"

#include <algorithm>
#include <format>

namespace loopy {

    namespace {
        void validateSettings(const ClickSettings& settings) {
            if (settings.note > MIDI_DATA_MAX)
                throw InvalidArgument(std::format("click note {} is out of range (0-127)", static_cast<int>(settings.note)));
            if (settings.velocity > MIDI_DATA_MAX)
                throw InvalidArgument(std::format("click velocity {} is out of range (0-127)", static_cast<int>(settings.velocity)));
            if (settings.clickLength.count() <= 0)
                throw InvalidArgument("click length must be positive");
        }
    }

    const char* toString(ClickMode mode) {
        switch (mode) {
            case ClickMode::EveryBeat: return "beat";
            case ClickMode::EveryStep: return "step";
        }
        return "unknown";
    }

    FreeMetronomeChannel::FreeMetronomeChannel(std::string name, InstrumentEntry instrument, ClickSettings settings)
        : InstrumentChannel(Kind::FreeMetronome, std::move(name), std::move(instrument)) {
        validateSettings(settings);
        settings_ = settings;
    }

    ClickSettings FreeMetronomeChannel::settings() const {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        return settings_;
    }

    void FreeMetronomeChannel::settings(const ClickSettings& settings) {
        validateSettings(settings);
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_ = settings;
    }

    void FreeMetronomeChannel::setEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_.enabled = enabled;
    }

    void FreeMetronomeChannel::setMode(ClickMode mode) {
        std::lock_guard<std::mutex> lock(settings_mutex_);
        settings_.mode = mode;
    }

    uint8_t FreeMetronomeChannel::clickVelocity(const ClickSettings& settings, bool downbeat) {
        if (!downbeat || !settings.accent)
            return settings.velocity;
        auto accented = static_cast<int>(settings.accentVelocity) * settings.velocity / 100;
        return static_cast<uint8_t>(std::clamp(accented, 0, static_cast<int>(MIDI_DATA_MAX)));
    }

    void FreeMetronomeChannel::onTick(const Tick& tick, NoteOffScheduler& notes) {
        auto current = settings();
        if (!current.enabled)
            return;
        if (current.mode == ClickMode::EveryBeat && !tick.isBeat())
            return;

        auto velocity = scaledVelocity(clickVelocity(current, tick.isDownbeat()));
        if (velocity == 0)
            return;
        auto length = std::min(current.clickLength, tick.interval * tick.stepsPerBeat);
        if (notes.trigger(instrument().channel, current.note, velocity, tick.time + length) == SoundEngineStatus::OK)
            clicks_.fetch_add(1, std::memory_order_relaxed);
    }

}
