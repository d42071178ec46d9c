#include "loopy/loopy.hpp"

namespace loopy {

    NoteOffScheduler::NoteOffScheduler(SoundEngine& engine)
        : engine_(engine) {
        std::vector<PendingNoteOff> storage;
        storage.reserve(kVoiceCount);
        queue_ = decltype(queue_){FiresLater{}, std::move(storage)};
        sounding_.reserve(kVoiceCount);
        firing_.reserve(kVoiceCount);
    }

    void NoteOffScheduler::dropStaleLocked() const {
        while (!queue_.empty()) {
            const auto& top = queue_.top();
            auto it = sounding_.find(keyOf(top.channel, top.note));
            if (it != sounding_.end() && it->second == top.serial)
                return;
            queue_.pop();
        }
    }

    void NoteOffScheduler::deliverNoteOff(uint8_t channel, uint8_t note) {
        auto status = engine_.noteOff(channel, note);
        if (status != SoundEngineStatus::OK)
            status = engine_.noteOff(channel, note);
        if (status == SoundEngineStatus::OK) {
            delivered_note_offs_++;
            return;
        }
        failed_note_offs_++;
        Logger::global()->logError("Note-off (channel %d, note %d) could not be delivered: %s",
                                   channel, note, toString(status));
    }

    SoundEngineStatus NoteOffScheduler::trigger(uint8_t channel, uint8_t note, uint8_t velocity, TimePoint releaseAt) {
        const auto key = keyOf(channel, note);
        bool retriggered = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retriggered = sounding_.erase(key) > 0;
        }
        if (retriggered)
            deliverNoteOff(channel, note);

        auto status = engine_.noteOn(channel, note, velocity);

        std::lock_guard<std::mutex> lock(mutex_);
        if (status != SoundEngineStatus::OK) {
            if (!muted_) {
                muted_ = true;
                Logger::global()->logWarning("Sound engine rejected a note-on (%s); new notes are muted until it recovers",
                                             toString(status));
            }
            return status;
        }
        if (muted_) {
            muted_ = false;
            Logger::global()->logInfo("Sound engine accepts notes again");
        }
        auto serial = next_serial_++;
        sounding_[key] = serial;
        queue_.push(PendingNoteOff{releaseAt, serial, channel, note});
        accepted_note_ons_++;
        return status;
    }

    size_t NoteOffScheduler::collectLocked(std::optional<TimePoint> until) {
        firing_.clear();
        while (true) {
            dropStaleLocked();
            if (queue_.empty() || (until && queue_.top().due > *until))
                break;
            firing_.push_back(queue_.top());
            sounding_.erase(keyOf(queue_.top().channel, queue_.top().note));
            queue_.pop();
        }
        return firing_.size();
    }

    size_t NoteOffScheduler::fireDue(TimePoint now) {
        std::lock_guard<std::mutex> firing(firing_mutex_);
        size_t count;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            count = collectLocked(now);
        }
        for (auto& entry : firing_)
            deliverNoteOff(entry.channel, entry.note);
        return count;
    }

    size_t NoteOffScheduler::panic() {
        std::lock_guard<std::mutex> firing(firing_mutex_);
        size_t count;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            count = collectLocked(std::nullopt);
        }
        for (auto& entry : firing_)
            deliverNoteOff(entry.channel, entry.note);
        if (count > 0)
            Logger::global()->logDiagnostic("Panic: released %zu sounding note(s)", count);
        return count;
    }

    std::optional<TimePoint> NoteOffScheduler::nextDue() const {
        std::lock_guard<std::mutex> lock(mutex_);
        dropStaleLocked();
        if (queue_.empty())
            return std::nullopt;
        return queue_.top().due;
    }

    size_t NoteOffScheduler::soundingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sounding_.size();
    }

}
