#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <random>
#include <thread>

#include <loopy/loopy.hpp>
#include "RecordingSoundEngine.hpp"

using namespace loopy;
using namespace std::chrono_literals;
using Kind = loopy::testing::RecordingSoundEngine::Kind;

namespace {

class BrokenChannel : public InstrumentChannel, public TickReceiver {
public:
    explicit BrokenChannel(InstrumentEntry instrument)
        : InstrumentChannel(Kind::StepSequencer, "Broken", std::move(instrument)) {
    }
    TickReceiver* tickReceiver() override { return this; }
    void onTick(const Tick&, NoteOffScheduler&) override {
        throw IndexError("step index 7 is out of range (length 4)");
    }
};

class ProjectTest : public ::testing::Test {
protected:
    std::shared_ptr<loopy::testing::RecordingSoundEngine> engine{std::make_shared<loopy::testing::RecordingSoundEngine>()};
    Project project{engine};
    TimePoint origin{TimePoint{} + 1h};
};

} // namespace

TEST_F(ProjectTest, PlaysAStepPatternInTime) {
    project.registerInstrument("Piano", std::nullopt, 0);
    auto channel = project.addStepSequencerChannel("Piano", "Piano", 4);
    channel->sequence().setStep(0, Step::make(60, 100));
    channel->sequence().setStep(2, Step::make(64, 100));

    project.startAt(origin);
    EXPECT_EQ(project.process(origin + 125ms * 7), 8);

    auto ons = engine->events(Kind::NoteOn);
    ASSERT_EQ(ons.size(), 4);
    EXPECT_EQ(ons[0].data1, 60);
    EXPECT_EQ(ons[1].data1, 64);
    EXPECT_EQ(ons[2].data1, 60);
    EXPECT_EQ(ons[3].data1, 64);
    // the note-off of the E4 on tick 6 is due at tick 7
    EXPECT_EQ(engine->count(Kind::NoteOff), 4);

    project.stop();
    EXPECT_TRUE(engine->unbalancedNotes().empty());
}

TEST_F(ProjectTest, RegisteringSendsTheProgramChange) {
    project.registerInstrument("Guitar", 3, 26);
    EXPECT_THROW(project.registerInstrument("Organ", 3, 19), DuplicateChannel);

    auto programs = engine->events(Kind::ProgramChange);
    ASSERT_EQ(programs.size(), 1);
    EXPECT_EQ(programs[0].channel, 3);
    EXPECT_EQ(programs[0].data1, 26);
    EXPECT_EQ(project.registry().size(), 1);
}

TEST_F(ProjectTest, PresetsAreResolvedThroughTheRegistry) {
    project.registry().presets({{"Jazz Guitar", 26}});
    EXPECT_EQ(project.registerInstrumentFromPreset("Guitar", "Jazz Guitar").program, 26);
    EXPECT_THROW(project.registerInstrumentFromPreset("Strings", "Strings"), InvalidArgument);
}

TEST_F(ProjectTest, ChannelsNeedARegisteredInstrumentAndAUniqueName) {
    EXPECT_THROW(project.addStepSequencerChannel("Piano", "Piano"), InvalidArgument);
    project.registerInstrument("Piano", std::nullopt, 0);
    project.addStepSequencerChannel("Piano", "Piano");
    EXPECT_THROW(project.addFreeMidiChannel("Piano", "Piano"), InvalidArgument);
    EXPECT_THROW(project.addFreeMetronomeChannel("", "Piano"), InvalidArgument);
    EXPECT_EQ(project.channels().size(), 1);

    EXPECT_THROW(project.unregisterInstrument("Piano"), InvalidArgument);
    EXPECT_TRUE(project.removeChannel("Piano"));
    EXPECT_FALSE(project.removeChannel("Piano"));
    EXPECT_TRUE(project.unregisterInstrument("Piano"));
}

TEST_F(ProjectTest, ChannelsAreKeptInInsertionOrder) {
    project.registerInstrument("Piano", std::nullopt, 0);
    project.registerInstrument("Click", 9, 115);
    project.addFreeMetronomeChannel("Metronome", "Click");
    project.addStepSequencerChannel("Piano", "Piano");
    project.addFreeMidiChannel("Keys", "Piano");

    auto channels = project.channels();
    ASSERT_EQ(channels.size(), 3);
    EXPECT_EQ(channels[0]->name(), "Metronome");
    EXPECT_EQ(channels[1]->name(), "Piano");
    EXPECT_EQ(channels[2]->name(), "Keys");
    EXPECT_NE(project.findChannelAs<FreeMidiChannel>("Keys"), nullptr);
    EXPECT_EQ(project.findChannelAs<FreeMidiChannel>("Piano"), nullptr);
    EXPECT_EQ(project.findChannel("Nothing"), nullptr);
}

TEST_F(ProjectTest, StartRewindsEveryChannel) {
    project.registerInstrument("Piano", std::nullopt, 0);
    auto channel = project.addStepSequencerChannel("Piano", "Piano", 4);
    channel->sequence().setStep(0, Step::make(60, 100));

    project.startAt(origin);
    project.process(origin + 125ms * 2);
    project.stop();
    EXPECT_EQ(channel->sequence().position(), 3);

    engine->reset();
    project.startAt(origin + 10s);
    project.process(origin + 10s);
    auto ons = engine->events(Kind::NoteOn);
    ASSERT_EQ(ons.size(), 1);
    EXPECT_EQ(ons[0].data1, 60);
    project.stop();
}

TEST_F(ProjectTest, StopReleasesPendingAndLiveNotes) {
    project.registerInstrument("Piano", std::nullopt, 0);
    auto steps = project.addStepSequencerChannel("Piano", "Piano", 4);
    steps->sequence().setStep(0, Step::make(60, 100, 10s));
    auto keys = project.addFreeMidiChannel("Keys", "Piano");

    project.startAt(origin);
    project.process(origin);
    keys->onLiveEvent(MidiMessage::noteOn(0, 72, 100));
    EXPECT_EQ(engine->count(Kind::NoteOff), 0);

    project.stop();
    EXPECT_FALSE(project.playing());
    EXPECT_EQ(engine->count(Kind::NoteOff), 2);
    EXPECT_TRUE(engine->unbalancedNotes().empty());

    project.stop();
    EXPECT_EQ(engine->count(Kind::NoteOff), 2);
}

TEST_F(ProjectTest, RemovedChannelStillReleasesItsNotes) {
    project.registerInstrument("Piano", std::nullopt, 0);
    auto channel = project.addStepSequencerChannel("Piano", "Piano", 4);
    channel->sequence().setStep(0, Step::make(60, 100, 300ms));

    project.startAt(origin);
    project.process(origin);
    EXPECT_TRUE(project.removeChannel("Piano"));
    project.process(origin + 300ms);
    EXPECT_EQ(engine->count(Kind::NoteOn), 1);
    EXPECT_EQ(engine->count(Kind::NoteOff), 1);
}

TEST_F(ProjectTest, RemovedLiveChannelReleasesHeldNotes) {
    project.registerInstrument("Piano", std::nullopt, 0);
    auto keys = project.addFreeMidiChannel("Keys", "Piano");
    keys->onLiveEvent(MidiMessage::noteOn(0, 60, 100));
    EXPECT_TRUE(project.removeChannel("Keys"));
    EXPECT_EQ(engine->count(Kind::NoteOff), 1);
    keys->onLiveEvent(MidiMessage::noteOn(0, 62, 100));
    EXPECT_EQ(engine->count(Kind::NoteOn), 1);
}

TEST_F(ProjectTest, FailingChannelDoesNotStopTheClock) {
    auto piano = project.registerInstrument("Piano", std::nullopt, 0);
    project.addChannel(std::make_shared<BrokenChannel>(piano));
    auto channel = project.addStepSequencerChannel("Piano", "Piano", 1);
    channel->sequence().setStep(0, Step::make(60, 100));

    project.startAt(origin);
    EXPECT_EQ(project.process(origin + 125ms * 3), 4);
    EXPECT_EQ(project.tickFailures(), 4);
    EXPECT_EQ(channel->triggeredCount(), 4);
    project.stop();

    EXPECT_THROW(project.addChannel(std::make_shared<BrokenChannel>(InstrumentEntry{"Ghost", 4, 0})), InvalidArgument);
}

TEST_F(ProjectTest, TempoIsForwardedToTheMetronome) {
    project.setTempo(90);
    project.setStepsPerBeat(3);
    project.setBeatsPerBar(7);
    EXPECT_DOUBLE_EQ(project.tempo(), 90.0);
    EXPECT_EQ(project.stepsPerBeat(), 3);
    EXPECT_EQ(project.beatsPerBar(), 7);
    EXPECT_THROW(project.setTempo(-1), InvalidArgument);
    EXPECT_DOUBLE_EQ(project.tempo(), 90.0);
}

TEST_F(ProjectTest, ChannelsNeverOutliveTheirInstrumentWhenAddedConcurrently) {
    size_t orphaned = 0;
    size_t added = 0;
    for (int round = 0; round < 200; round++) {
        auto entry = project.registerInstrument("Guitar", std::nullopt, 26);
        auto channel = std::make_shared<StepSequencerChannel>("Riff", entry, 4);

        std::atomic<int> ready{0};
        auto waitForBoth = [&] {
            ready.fetch_add(1);
            while (ready.load() < 2)
                std::this_thread::yield();
        };
        std::thread adder([&] {
            waitForBoth();
            try {
                project.addChannel(channel);
            } catch (const InvalidArgument&) {
                // the instrument went first; nothing was added.
            }
        });
        std::thread remover([&] {
            waitForBoth();
            try {
                project.unregisterInstrument("Guitar");
            } catch (const InvalidArgument&) {
                // the channel went first and keeps the instrument.
            }
        });
        adder.join();
        remover.join();

        if (project.findChannel("Riff")) {
            added++;
            if (project.registry().find("Guitar") != entry)
                orphaned++;
            project.removeChannel("Riff");
        }
        project.unregisterInstrument("Guitar");
    }
    EXPECT_EQ(orphaned, 0) << added << " of 200 rounds added the channel";
    EXPECT_EQ(project.registry().size(), 0);
}

TEST_F(ProjectTest, EveryNoteOnIsReleasedWhateverMomentStopComes) {
    project.setTempo(600);
    std::vector<std::shared_ptr<StepSequencerChannel>> channels;
    for (int i = 0; i < 3; i++) {
        auto id = "Instrument" + std::to_string(i);
        project.registerInstrument(id, std::nullopt, 0);
        channels.push_back(project.addStepSequencerChannel(id, id, 16));
    }

    std::mt19937 rng{1234};
    std::uniform_int_distribution<int> note(48, 72);
    std::uniform_int_distribution<int> durationMs(0, 500);
    for (auto& channel : channels)
        for (size_t i = 0; i < 16; i++)
            if (rng() % 2)
                channel->sequence().setStep(i, Step::make(static_cast<uint8_t>(note(rng)), 100, std::chrono::milliseconds(durationMs(rng))));

    std::atomic<bool> editing{true};
    std::thread editor([&] {
        std::mt19937 editRng{99};
        while (editing) {
            auto& channel = channels[editRng() % channels.size()];
            channel->sequence().toggle(editRng() % 16);
            std::this_thread::sleep_for(1ms);
        }
    });

    std::uniform_int_distribution<int> playMs(0, 80);
    for (int round = 0; round < 15; round++) {
        project.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(playMs(rng)));
        project.stop();

        EXPECT_TRUE(engine->unbalancedNotes().empty()) << "round " << round;
        auto after = engine->events().size();
        std::this_thread::sleep_for(20ms);
        EXPECT_EQ(engine->events().size(), after) << "round " << round;
    }
    editing = false;
    editor.join();

    EXPECT_EQ(project.scheduler().acceptedNoteOns(), engine->count(Kind::NoteOn));
    EXPECT_EQ(project.scheduler().failedNoteOffs(), 0);
}
