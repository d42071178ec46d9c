#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "InstrumentRegistry.hpp"
#include "loopy/priv/channels/FreeMetronomeChannel.hpp"
#include "loopy/priv/channels/FreeMidiChannel.hpp"
#include "loopy/priv/channels/StepSequencerChannel.hpp"
#include "loopy/priv/engine/SoundEngine.hpp"
#include "loopy/priv/sequencer/Metronome.hpp"
#include "loopy/priv/sequencer/NoteOffScheduler.hpp"

namespace loopy {

    // One session: the Metronome, the InstrumentRegistry, the pending note-offs and the
    // ordered channel collection, plus the transport state.
    //
    // Every method may be called from the editing surface while playing. The channel list
    // is a copy-on-write snapshot, so adding or removing channels never blocks tick
    // dispatch. Channels are evaluated in insertion order.
    class Project : private Metronome::Listener {
    public:
        typedef std::vector<std::shared_ptr<InstrumentChannel>> ChannelList;

    private:
        std::shared_ptr<SoundEngine> engine_;
        InstrumentRegistry registry_;
        NoteOffScheduler scheduler_;
        Metronome metronome_;

        std::mutex transport_mutex_;
        std::mutex channels_mutex_;
        std::shared_ptr<const ChannelList> channels_;
        std::atomic<uint64_t> tick_failures_{0};

        void onTick(const Tick& tick) override;
        void onTimers(TimePoint now) override;
        std::optional<TimePoint> nextTimerDeadline() override;

        std::shared_ptr<const ChannelList> loadChannels() const {
            return std::atomic_load_explicit(&channels_, std::memory_order_acquire);
        }
        void rewindChannels();
        size_t releaseLiveNotes();

    public:
        explicit Project(std::shared_ptr<SoundEngine> engine, double bpm = 120.0, int32_t stepsPerBeat = 4, int32_t beatsPerBar = 4);
        Project(const Project&) = delete;
        Project& operator=(const Project&) = delete;
        ~Project() override;

        // Rewinds every channel and starts the playback thread. No-op while playing.
        void start();
        // Like start(), but ticks are only emitted by process().
        void startAt(TimePoint origin);
        size_t process(TimePoint now) { return metronome_.process(now); }
        // Stops the playback thread, then releases every pending and live note.
        // No note-off is sent by loopy after this returns (until the next start or live input).
        void stop();
        bool playing() const { return metronome_.running(); }

        // Registers the instrument and sends its program change.
        // Throws DuplicateChannel, ChannelsExhausted or InvalidArgument; the registry is
        // unchanged on failure.
        InstrumentEntry registerInstrument(const std::string& id, std::optional<uint8_t> channel, uint8_t program);
        // Resolves the program through the preset table (InvalidArgument when unknown).
        InstrumentEntry registerInstrumentFromPreset(const std::string& id, const std::string& preset,
                                                     std::optional<uint8_t> channel = std::nullopt);
        // Throws InvalidArgument while a channel is still bound to the instrument.
        bool unregisterInstrument(const std::string& id);

        // Channel names are unique. Throws InvalidArgument for an empty or duplicate name
        // and for an unknown instrument.
        std::shared_ptr<StepSequencerChannel> addStepSequencerChannel(const std::string& name, const std::string& instrumentId, size_t length = 16);
        std::shared_ptr<FreeMidiChannel> addFreeMidiChannel(const std::string& name, const std::string& instrumentId);
        std::shared_ptr<FreeMetronomeChannel> addFreeMetronomeChannel(const std::string& name, const std::string& instrumentId,
                                                                      ClickSettings settings = {});
        // Adds a channel built elsewhere. Its instrument must be registered.
        void addChannel(std::shared_ptr<InstrumentChannel> channel);
        // Pending note-offs of the removed channel still fire; a FreeMidiChannel releases its held notes.
        bool removeChannel(const std::string& name);

        std::shared_ptr<InstrumentChannel> findChannel(const std::string& name) const;
        template <typename T>
        std::shared_ptr<T> findChannelAs(const std::string& name) const {
            return std::dynamic_pointer_cast<T>(findChannel(name));
        }
        ChannelList channels() const { return *loadChannels(); }

        void setTempo(double bpm) { metronome_.setTempo(bpm); }
        double tempo() const { return metronome_.tempo(); }
        void setStepsPerBeat(int32_t stepsPerBeat) { metronome_.setStepsPerBeat(stepsPerBeat); }
        int32_t stepsPerBeat() const { return metronome_.stepsPerBeat(); }
        void setBeatsPerBar(int32_t beatsPerBar) { metronome_.setBeatsPerBar(beatsPerBar); }
        int32_t beatsPerBar() const { return metronome_.beatsPerBar(); }

        InstrumentRegistry& registry() { return registry_; }
        NoteOffScheduler& scheduler() { return scheduler_; }
        Metronome& metronome() { return metronome_; }
        SoundEngine& soundEngine() { return *engine_; }

        // Channels that threw from onTick. Each failure is also logged.
        uint64_t tickFailures() const { return tick_failures_.load(); }
    };

}
