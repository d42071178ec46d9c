#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

#include "loopy/priv/CommonTypes.hpp"

namespace loopy {

    struct Tick {
        // Ticks since start(). Never wraps.
        uint64_t index{0};
        // The absolute time this tick was scheduled for (not the time it was dispatched).
        TimePoint time{};
        Nanoseconds interval{};
        int32_t stepsPerBeat{4};
        int32_t beatsPerBar{4};
        // Position within the bar, counted from the last meter change.
        int32_t stepInBar{0};

        bool isBeat() const { return stepInBar % stepsPerBeat == 0; }
        bool isDownbeat() const { return stepInBar == 0; }
    };

    // The master time source. It owns the playback thread, which emits ticks at
    // `60 / bpm / stepsPerBeat` second intervals and services the listener's timers
    // (pending note-offs) in between.
    //
    // Tick times are derived from an absolute anchor (time, index) and the current
    // interval, so there is no cumulative drift however long the session runs. Tempo
    // and meter changes move the anchor to the next scheduled tick: that tick keeps its
    // time, later ticks follow the new interval.
    class Metronome {
    public:
        class Listener {
        public:
            virtual ~Listener() = default;
            // Invoked on the playback thread for every tick, in index order.
            virtual void onTick(const Tick& tick) = 0;
            // Fire every timer due at or before `now`.
            virtual void onTimers(TimePoint now) = 0;
            virtual std::optional<TimePoint> nextTimerDeadline() = 0;
        };

    private:
        mutable std::mutex mutex_;
        std::condition_variable wakeup_;
        std::thread thread_;
        Listener* listener_{nullptr};

        bool running_{false};
        bool wake_requested_{false};
        double bpm_;
        int32_t steps_per_beat_;
        int32_t beats_per_bar_;
        double interval_ns_;
        TimePoint anchor_time_{};
        uint64_t anchor_index_{0};
        uint64_t meter_anchor_index_{0};
        uint64_t next_index_{0};

        TimePoint tickTimeLocked(uint64_t index) const;
        void rebaseLocked();
        void run();

    public:
        explicit Metronome(double bpm = 120.0, int32_t stepsPerBeat = 4, int32_t beatsPerBar = 4);
        ~Metronome();

        static double intervalInNanoseconds(double bpm, int32_t stepsPerBeat);
        // Bounds of the step interval. Tempo and steps-per-beat changes that leave them
        // throw InvalidArgument.
        static constexpr Nanoseconds kMinInterval{std::chrono::microseconds(100)};
        static constexpr Nanoseconds kMaxInterval{std::chrono::minutes(5)};

        // Set before start(); not synchronized with a running playback thread.
        void listener(Listener* listener) { listener_ = listener; }

        // Starts the playback thread. Tick 0 fires immediately. No-op while running.
        void start();
        // Starts without a thread: ticks are emitted only by explicit process() calls.
        void startAt(TimePoint origin);
        // Stops tick generation and joins the playback thread. Idempotent.
        void stop();
        bool running() const;

        // Throws InvalidArgument for non-positive or non-finite values, and for values
        // that put the step interval outside [kMinInterval, kMaxInterval].
        void setTempo(double bpm);
        double tempo() const;
        void setStepsPerBeat(int32_t stepsPerBeat);
        int32_t stepsPerBeat() const;
        void setBeatsPerBar(int32_t beatsPerBar);
        int32_t beatsPerBar() const;
        Nanoseconds interval() const;

        std::optional<TimePoint> nextTickTime() const;
        uint64_t nextTickIndex() const;

        // Emits every tick due at or before `now` (timers due before each tick are fired
        // first), then fires the timers due at `now`. Returns the number of ticks emitted.
        size_t process(TimePoint now);

        // Interrupts the playback thread's wait so that it re-reads its deadlines.
        void wake();
    };

}
