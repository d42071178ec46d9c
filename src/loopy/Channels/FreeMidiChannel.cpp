#include "loopy/loopy.hpp"

namespace loopy {

    FreeMidiChannel::FreeMidiChannel(std::string name, InstrumentEntry instrument, SoundEngine& engine)
        : InstrumentChannel(Kind::FreeMidi, std::move(name), std::move(instrument)),
          engine_(engine) {
    }

    SoundEngineStatus FreeMidiChannel::sendNoteOff(uint8_t note) {
        const auto midiChannel = instrument().channel;
        auto status = engine_.noteOff(midiChannel, note);
        if (status != SoundEngineStatus::OK)
            status = engine_.noteOff(midiChannel, note);
        if (status != SoundEngineStatus::OK)
            Logger::global()->logError("%s: note-off (channel %d, note %d) could not be delivered: %s",
                                       name().c_str(), midiChannel, note, toString(status));
        return status;
    }

    void FreeMidiChannel::setArmed(bool armed) {
        armed_.store(armed);
        if (!armed)
            releaseAll();
    }

    std::vector<uint8_t> FreeMidiChannel::heldNotes() {
        std::lock_guard<std::mutex> lock(held_mutex_);
        return {held_.begin(), held_.end()};
    }

    size_t FreeMidiChannel::releaseAll() {
        std::lock_guard<std::mutex> lock(held_mutex_);
        const auto released = held_.size();
        for (auto note : held_)
            sendNoteOff(note);
        held_.clear();
        return released;
    }

    void FreeMidiChannel::onLiveEvent(const MidiMessage& message) {
        if (!armed_.load(std::memory_order_acquire))
            return;

        const auto midiChannel = instrument().channel;
        if (message.isNoteOn()) {
            std::lock_guard<std::mutex> lock(held_mutex_);
            // re-checked under the lock so that a concurrent disarm cannot leave a note held.
            if (!armed_.load(std::memory_order_acquire) || held_.contains(message.data1))
                return;
            if (auto status = engine_.noteOn(midiChannel, message.data1, message.data2); status != SoundEngineStatus::OK) {
                Logger::global()->logWarning("%s: live note-on %d dropped: %s", name().c_str(), message.data1, toString(status));
                return;
            }
            held_.insert(message.data1);
        } else if (message.isNoteOff()) {
            std::lock_guard<std::mutex> lock(held_mutex_);
            if (held_.erase(message.data1) == 0)
                return;
            sendNoteOff(message.data1);
        } else {
            if (auto status = engine_.send(message.withChannel(midiChannel)); status != SoundEngineStatus::OK)
                Logger::global()->logWarning("%s: live message 0x%02X dropped: %s", name().c_str(), message.status, toString(status));
        }
    }

}
