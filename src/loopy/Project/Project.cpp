#include "loopy/loopy.hpp"

#include <algorithm>
#include <format>

namespace loopy {

    namespace {
        SoundEngine& requireEngine(const std::shared_ptr<SoundEngine>& engine) {
            if (!engine)
                throw InvalidArgument("a Project needs a SoundEngine");
            return *engine;
        }
    }

    Project::Project(std::shared_ptr<SoundEngine> engine, double bpm, int32_t stepsPerBeat, int32_t beatsPerBar)
        : engine_(std::move(engine)),
          scheduler_(requireEngine(engine_)),
          metronome_(bpm, stepsPerBeat, beatsPerBar),
          channels_(std::make_shared<const ChannelList>()) {
        metronome_.listener(this);
    }

    Project::~Project() {
        stop();
    }

    void Project::onTick(const Tick& tick) {
        auto channels = loadChannels();
        for (auto& channel : *channels) {
            auto receiver = channel->tickReceiver();
            if (!receiver)
                continue;
            try {
                receiver->onTick(tick, scheduler_);
            } catch (const std::exception& e) {
                tick_failures_.fetch_add(1, std::memory_order_relaxed);
                Logger::global()->logError("%s: tick %llu failed: %s", channel->name().c_str(),
                                           static_cast<unsigned long long>(tick.index), e.what());
            }
        }
    }

    void Project::onTimers(TimePoint now) {
        scheduler_.fireDue(now);
    }

    std::optional<TimePoint> Project::nextTimerDeadline() {
        return scheduler_.nextDue();
    }

    void Project::rewindChannels() {
        for (auto& channel : *loadChannels())
            channel->rewind();
    }

    size_t Project::releaseLiveNotes() {
        size_t released = 0;
        for (auto& channel : *loadChannels())
            released += channel->releaseAll();
        return released;
    }

    void Project::start() {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        if (metronome_.running())
            return;
        rewindChannels();
        metronome_.start();
        Logger::global()->logInfo("Playing at %.2f BPM", metronome_.tempo());
    }

    void Project::startAt(TimePoint origin) {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        if (metronome_.running())
            return;
        rewindChannels();
        metronome_.startAt(origin);
    }

    void Project::stop() {
        std::lock_guard<std::mutex> lock(transport_mutex_);
        const bool wasPlaying = metronome_.running();
        // the playback thread is joined here, so nothing can schedule notes behind the panic.
        metronome_.stop();
        auto released = scheduler_.panic();
        released += releaseLiveNotes();
        if (wasPlaying)
            Logger::global()->logInfo("Stopped (%zu note(s) released)", released);
    }

    InstrumentEntry Project::registerInstrument(const std::string& id, std::optional<uint8_t> channel, uint8_t program) {
        auto entry = registry_.registerInstrument(id, channel, program);
        if (auto status = engine_->programChange(entry.channel, entry.program); status != SoundEngineStatus::OK)
            Logger::global()->logWarning("Program change for '%s' (channel %d, program %d) was not sent: %s",
                                         id.c_str(), entry.channel, entry.program, toString(status));
        return entry;
    }

    InstrumentEntry Project::registerInstrumentFromPreset(const std::string& id, const std::string& preset, std::optional<uint8_t> channel) {
        auto program = registry_.presetProgram(preset);
        if (!program)
            throw InvalidArgument(std::format("unknown preset '{}'", preset));
        return registerInstrument(id, channel, *program);
    }

    bool Project::unregisterInstrument(const std::string& id) {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        for (auto& channel : *loadChannels())
            if (channel->instrument().id == id)
                throw InvalidArgument(std::format("instrument '{}' is still used by channel '{}'", id, channel->name()));
        return registry_.unregisterInstrument(id);
    }

    void Project::addChannel(std::shared_ptr<InstrumentChannel> channel) {
        if (!channel)
            throw InvalidArgument("channel must not be null");
        // checked under the lock that unregisterInstrument() holds, so the instrument
        // cannot go away between the check and the publication.
        std::lock_guard<std::mutex> lock(channels_mutex_);
        if (registry_.find(channel->instrument().id) != channel->instrument())
            throw InvalidArgument(std::format("channel '{}' is bound to instrument '{}', which is not registered",
                                              channel->name(), channel->instrument().id));
        auto current = loadChannels();
        for (auto& existing : *current)
            if (existing->name() == channel->name())
                throw InvalidArgument(std::format("a channel named '{}' already exists", channel->name()));
        // a channel added while playing starts from its first step.
        channel->rewind();
        auto next = std::make_shared<ChannelList>(*current);
        next->push_back(std::move(channel));
        std::atomic_store_explicit(&channels_, std::shared_ptr<const ChannelList>(std::move(next)), std::memory_order_release);
    }

    std::shared_ptr<StepSequencerChannel> Project::addStepSequencerChannel(const std::string& name, const std::string& instrumentId, size_t length) {
        if (name.empty())
            throw InvalidArgument("channel name must not be empty");
        auto channel = std::make_shared<StepSequencerChannel>(name, registry_.get(instrumentId), length);
        addChannel(channel);
        return channel;
    }

    std::shared_ptr<FreeMidiChannel> Project::addFreeMidiChannel(const std::string& name, const std::string& instrumentId) {
        if (name.empty())
            throw InvalidArgument("channel name must not be empty");
        auto channel = std::make_shared<FreeMidiChannel>(name, registry_.get(instrumentId), *engine_);
        addChannel(channel);
        return channel;
    }

    std::shared_ptr<FreeMetronomeChannel> Project::addFreeMetronomeChannel(const std::string& name, const std::string& instrumentId, ClickSettings settings) {
        if (name.empty())
            throw InvalidArgument("channel name must not be empty");
        auto channel = std::make_shared<FreeMetronomeChannel>(name, registry_.get(instrumentId), settings);
        addChannel(channel);
        return channel;
    }

    bool Project::removeChannel(const std::string& name) {
        std::shared_ptr<InstrumentChannel> removed;
        {
            std::lock_guard<std::mutex> lock(channels_mutex_);
            auto current = loadChannels();
            auto it = std::find_if(current->begin(), current->end(), [&](const auto& c) { return c->name() == name; });
            if (it == current->end())
                return false;
            removed = *it;
            auto next = std::make_shared<ChannelList>();
            for (auto& channel : *current)
                if (channel != removed)
                    next->push_back(channel);
            std::atomic_store_explicit(&channels_, std::shared_ptr<const ChannelList>(std::move(next)), std::memory_order_release);
        }
        if (auto freeMidi = std::dynamic_pointer_cast<FreeMidiChannel>(removed))
            freeMidi->setArmed(false);
        else
            removed->releaseAll();
        return true;
    }

    std::shared_ptr<InstrumentChannel> Project::findChannel(const std::string& name) const {
        for (auto& channel : *loadChannels())
            if (channel->name() == name)
                return channel;
        return nullptr;
    }

}
