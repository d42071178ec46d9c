#include "loopy/loopy.hpp"

#include <cmath>
#include <format>

namespace loopy {

    namespace {
        void validateTempo(double bpm) {
            if (!std::isfinite(bpm) || bpm <= 0)
                throw InvalidArgument(std::format("tempo must be a positive number of beats per minute (got {})", bpm));
        }

        void validatePositive(int32_t value, const char* name) {
            if (value <= 0)
                throw InvalidArgument(std::format("{} must be positive (got {})", name, value));
        }

        // keeps tick times representable and the playback thread out of a tick storm.
        void validateInterval(double bpm, int32_t stepsPerBeat) {
            auto interval = Metronome::intervalInNanoseconds(bpm, stepsPerBeat);
            if (interval < static_cast<double>(Metronome::kMinInterval.count()) ||
                interval > static_cast<double>(Metronome::kMaxInterval.count()))
                throw InvalidArgument(std::format("{} BPM at {} steps per beat gives a step interval outside {}-{} ns",
                                                  bpm, stepsPerBeat, Metronome::kMinInterval.count(), Metronome::kMaxInterval.count()));
        }
    }

    Metronome::Metronome(double bpm, int32_t stepsPerBeat, int32_t beatsPerBar) {
        validateTempo(bpm);
        validatePositive(stepsPerBeat, "steps per beat");
        validatePositive(beatsPerBar, "beats per bar");
        validateInterval(bpm, stepsPerBeat);
        bpm_ = bpm;
        steps_per_beat_ = stepsPerBeat;
        beats_per_bar_ = beatsPerBar;
        interval_ns_ = intervalInNanoseconds(bpm, stepsPerBeat);
    }

    Metronome::~Metronome() {
        stop();
        if (thread_.joinable())
            thread_.detach();
    }

    double Metronome::intervalInNanoseconds(double bpm, int32_t stepsPerBeat) {
        return 60.0e9 / bpm / stepsPerBeat;
    }

    TimePoint Metronome::tickTimeLocked(uint64_t index) const {
        auto offset = static_cast<double>(index - anchor_index_) * interval_ns_;
        return anchor_time_ + Nanoseconds{std::llround(offset)};
    }

    void Metronome::rebaseLocked() {
        if (!running_)
            return;
        anchor_time_ = tickTimeLocked(next_index_);
        anchor_index_ = next_index_;
    }

    void Metronome::start() {
        if (thread_.joinable()) {
            // a previous stop() came from the playback thread itself and could not join.
            if (running())
                return;
            thread_.join();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (running_)
                return;
        }
        startAt(Clock::now());
        thread_ = std::thread([this] { run(); });
    }

    void Metronome::startAt(TimePoint origin) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_)
            return;
        anchor_time_ = origin;
        anchor_index_ = 0;
        meter_anchor_index_ = 0;
        next_index_ = 0;
        wake_requested_ = false;
        running_ = true;
    }

    void Metronome::stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        wakeup_.notify_all();
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
            thread_.join();
    }

    bool Metronome::running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }

    void Metronome::setTempo(double bpm) {
        validateTempo(bpm);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            validateInterval(bpm, steps_per_beat_);
            rebaseLocked();
            bpm_ = bpm;
            interval_ns_ = intervalInNanoseconds(bpm_, steps_per_beat_);
        }
        wake();
    }

    double Metronome::tempo() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bpm_;
    }

    void Metronome::setStepsPerBeat(int32_t stepsPerBeat) {
        validatePositive(stepsPerBeat, "steps per beat");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            validateInterval(bpm_, stepsPerBeat);
            rebaseLocked();
            steps_per_beat_ = stepsPerBeat;
            interval_ns_ = intervalInNanoseconds(bpm_, steps_per_beat_);
            meter_anchor_index_ = next_index_;
        }
        wake();
    }

    int32_t Metronome::stepsPerBeat() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return steps_per_beat_;
    }

    void Metronome::setBeatsPerBar(int32_t beatsPerBar) {
        validatePositive(beatsPerBar, "beats per bar");
        std::lock_guard<std::mutex> lock(mutex_);
        beats_per_bar_ = beatsPerBar;
        meter_anchor_index_ = next_index_;
    }

    int32_t Metronome::beatsPerBar() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return beats_per_bar_;
    }

    Nanoseconds Metronome::interval() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return Nanoseconds{std::llround(interval_ns_)};
    }

    std::optional<TimePoint> Metronome::nextTickTime() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_)
            return std::nullopt;
        return tickTimeLocked(next_index_);
    }

    uint64_t Metronome::nextTickIndex() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return next_index_;
    }

    size_t Metronome::process(TimePoint now) {
        size_t emitted = 0;
        while (true) {
            Tick tick;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!running_)
                    break;
                auto due = tickTimeLocked(next_index_);
                if (due > now)
                    break;
                const auto stepsPerBar = static_cast<uint64_t>(steps_per_beat_) * static_cast<uint64_t>(beats_per_bar_);
                tick.index = next_index_;
                tick.time = due;
                tick.interval = Nanoseconds{std::llround(interval_ns_)};
                tick.stepsPerBeat = steps_per_beat_;
                tick.beatsPerBar = beats_per_bar_;
                tick.stepInBar = static_cast<int32_t>((next_index_ - meter_anchor_index_) % stepsPerBar);
                next_index_++;
            }
            if (listener_) {
                listener_->onTimers(tick.time);
                listener_->onTick(tick);
            }
            emitted++;
        }
        if (listener_)
            listener_->onTimers(now);
        return emitted;
    }

    void Metronome::wake() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            wake_requested_ = true;
        }
        wakeup_.notify_all();
    }

    void Metronome::run() {
        setCurrentThreadNameIfPossible("loopy-metronome");
        Logger::global()->logDiagnostic("Metronome thread started");
        while (true) {
            try {
                process(Clock::now());
            } catch (const std::exception& e) {
                // the clock must keep running whatever a listener does.
                Logger::global()->logError("Metronome listener failed: %s", e.what());
            }

            auto timer = listener_ ? listener_->nextTimerDeadline() : std::nullopt;

            std::unique_lock<std::mutex> lock(mutex_);
            if (!running_)
                break;
            auto deadline = tickTimeLocked(next_index_);
            if (timer && *timer < deadline)
                deadline = *timer;
            wakeup_.wait_until(lock, deadline, [this] { return !running_ || wake_requested_; });
            wake_requested_ = false;
            if (!running_)
                break;
        }
        Logger::global()->logDiagnostic("Metronome thread stopped");
    }

}
