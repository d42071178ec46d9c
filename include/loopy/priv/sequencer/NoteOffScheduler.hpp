#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <unordered_map>
#include <vector>

#include "loopy/priv/CommonTypes.hpp"
#include "loopy/priv/engine/SoundEngine.hpp"

namespace loopy {

    // Pending note-off timers, one per triggered note, ordered by absolute fire time.
    // Serviced by the Metronome's playback thread through Project.
    //
    // Every note-on accepted through `trigger()` is resolved by exactly one note-off:
    // by its own timer (`fireDue()`), by a retrigger of the same (channel, note), or by
    // `panic()`. Entries do not belong to a channel, so notes of a removed channel still
    // get released.
    class NoteOffScheduler {
        struct PendingNoteOff {
            TimePoint due;
            uint64_t serial;
            uint8_t channel;
            uint8_t note;
        };
        struct FiresLater {
            bool operator()(const PendingNoteOff& a, const PendingNoteOff& b) const {
                return a.due != b.due ? a.due > b.due : a.serial > b.serial;
            }
        };

        // every (channel, note) pair can be pending at once.
        static constexpr size_t kVoiceCount = MIDI_CHANNEL_COUNT * (MIDI_DATA_MAX + 1);

        SoundEngine& engine_;
        mutable std::mutex mutex_;
        // serializes fireDue() and panic(), which share `firing_`.
        std::mutex firing_mutex_;
        // reserved once, so firing on the playback thread does not allocate.
        std::vector<PendingNoteOff> firing_;
        mutable std::priority_queue<PendingNoteOff, std::vector<PendingNoteOff>, FiresLater> queue_;
        // (channel << 8 | note) -> serial of the pending note-off that currently owns it.
        std::unordered_map<uint16_t, uint64_t> sounding_;
        uint64_t next_serial_{0};
        bool muted_{false};
        std::atomic<uint64_t> accepted_note_ons_{0};
        std::atomic<uint64_t> delivered_note_offs_{0};
        std::atomic<uint64_t> failed_note_offs_{0};

        static uint16_t keyOf(uint8_t channel, uint8_t note) { return static_cast<uint16_t>((channel << 8) | note); }
        void dropStaleLocked() const;
        // Moves the live entries due at or before `until` (all of them when nullopt) into `firing_`.
        size_t collectLocked(std::optional<TimePoint> until);
        void deliverNoteOff(uint8_t channel, uint8_t note);

    public:
        explicit NoteOffScheduler(SoundEngine& engine);

        // Sends the note-on now and schedules its note-off at `releaseAt`. A still sounding
        // (channel, note) is released first. If the engine rejects the note-on, nothing
        // is scheduled and the status is returned.
        SoundEngineStatus trigger(uint8_t channel, uint8_t note, uint8_t velocity, TimePoint releaseAt);

        // Sends the note-offs due at or before `now`. Returns how many were sent.
        size_t fireDue(TimePoint now);

        // Sends every pending note-off immediately. Returns how many were sent.
        size_t panic();

        std::optional<TimePoint> nextDue() const;
        size_t soundingCount() const;

        uint64_t acceptedNoteOns() const { return accepted_note_ons_.load(); }
        uint64_t deliveredNoteOffs() const { return delivered_note_offs_.load(); }
        uint64_t failedNoteOffs() const { return failed_note_offs_.load(); }
    };

}
