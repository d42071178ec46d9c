#include <gtest/gtest.h>

#include <random>
#include <thread>
#include <vector>

#include <loopy/loopy.hpp>
#include "RecordingSoundEngine.hpp"

using namespace loopy;
using Kind = loopy::testing::RecordingSoundEngine::Kind;

class FreeMidiChannelTest : public ::testing::Test {
protected:
    loopy::testing::RecordingSoundEngine engine{};
    FreeMidiChannel channel{"Keys", InstrumentEntry{"Piano", 5, 0}, engine};
};

TEST_F(FreeMidiChannelTest, ForwardsNotesToTheInstrumentChannel) {
    channel.onLiveEvent(MidiMessage::noteOn(0, 60, 100));
    channel.onLiveEvent(MidiMessage::noteOff(0, 60, 64));

    auto events = engine.events();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].kind, Kind::NoteOn);
    EXPECT_EQ(events[0].channel, 5);
    EXPECT_EQ(events[0].data1, 60);
    EXPECT_EQ(events[0].data2, 100);
    EXPECT_EQ(events[1].kind, Kind::NoteOff);
    EXPECT_EQ(events[1].channel, 5);
    EXPECT_EQ(events[1].data1, 60);
}

TEST_F(FreeMidiChannelTest, NoteOnWithZeroVelocityIsANoteOff) {
    channel.onLiveEvent(MidiMessage::noteOn(3, 62, 90));
    channel.onLiveEvent(MidiMessage::noteOn(3, 62, 0));
    EXPECT_EQ(engine.count(Kind::NoteOn), 1);
    EXPECT_EQ(engine.count(Kind::NoteOff), 1);
    EXPECT_TRUE(channel.heldNotes().empty());
}

TEST_F(FreeMidiChannelTest, EveryForwardedNoteOnGetsExactlyOneNoteOff) {
    channel.onLiveEvent(MidiMessage::noteOn(0, 60, 100));
    channel.onLiveEvent(MidiMessage::noteOn(0, 60, 110));
    channel.onLiveEvent(MidiMessage::noteOff(0, 64));
    channel.onLiveEvent(MidiMessage::noteOff(0, 60));
    channel.onLiveEvent(MidiMessage::noteOff(0, 60));

    EXPECT_EQ(engine.count(Kind::NoteOn), 1);
    EXPECT_EQ(engine.count(Kind::NoteOff), 1);
    EXPECT_TRUE(engine.unbalancedNotes().empty());
}

TEST_F(FreeMidiChannelTest, OtherChannelMessagesPassThroughUnmodified) {
    channel.onLiveEvent(MidiMessage::controlChange(1, 7, 100));
    channel.onLiveEvent(MidiMessage{0xE0, 0x00, 0x40});

    auto raw = engine.events(Kind::Raw);
    ASSERT_EQ(raw.size(), 2);
    EXPECT_EQ(raw[0].channel, 5);
    EXPECT_EQ(raw[0].data1, 7);
    EXPECT_EQ(raw[0].data2, 100);
    EXPECT_EQ(raw[1].channel, 5);
    EXPECT_EQ(raw[1].data2, 0x40);
}

TEST_F(FreeMidiChannelTest, DisarmingReleasesHeldNotesAndDropsInput) {
    channel.onLiveEvent(MidiMessage::noteOn(0, 60, 100));
    channel.onLiveEvent(MidiMessage::noteOn(0, 64, 100));
    EXPECT_EQ(channel.heldNotes().size(), 2);

    channel.setArmed(false);
    EXPECT_FALSE(channel.armed());
    EXPECT_EQ(engine.count(Kind::NoteOff), 2);
    EXPECT_TRUE(channel.heldNotes().empty());

    channel.onLiveEvent(MidiMessage::noteOn(0, 67, 100));
    EXPECT_EQ(engine.count(Kind::NoteOn), 2);

    channel.setArmed(true);
    channel.onLiveEvent(MidiMessage::noteOn(0, 67, 100));
    EXPECT_EQ(engine.count(Kind::NoteOn), 3);
}

TEST_F(FreeMidiChannelTest, ReleaseAllReportsHowManyNotesItReleased) {
    channel.onLiveEvent(MidiMessage::noteOn(0, 48, 100));
    channel.onLiveEvent(MidiMessage::noteOn(0, 52, 100));
    channel.onLiveEvent(MidiMessage::noteOn(0, 55, 100));
    EXPECT_EQ(channel.releaseAll(), 3);
    EXPECT_EQ(channel.releaseAll(), 0);
    EXPECT_TRUE(engine.unbalancedNotes().empty());
}

TEST_F(FreeMidiChannelTest, RejectedNoteOnIsNotHeld) {
    engine.is_available = false;
    channel.onLiveEvent(MidiMessage::noteOn(0, 60, 100));
    EXPECT_TRUE(channel.heldNotes().empty());
    engine.is_available = true;
    channel.onLiveEvent(MidiMessage::noteOff(0, 60));
    EXPECT_TRUE(engine.events().empty());
}

TEST_F(FreeMidiChannelTest, IgnoresTicks) {
    EXPECT_EQ(channel.tickReceiver(), nullptr);
    EXPECT_NE(channel.liveEventReceiver(), nullptr);
    EXPECT_EQ(channel.kind(), InstrumentChannel::Kind::FreeMidi);
}

TEST_F(FreeMidiChannelTest, ConcurrentInputStaysPaired) {
    std::vector<std::thread> players;
    for (int p = 0; p < 4; p++) {
        players.emplace_back([&, p] {
            std::mt19937 rng{static_cast<uint32_t>(p)};
            std::uniform_int_distribution<int> note(60, 72);
            std::bernoulli_distribution press(0.5);
            for (int i = 0; i < 2000; i++) {
                auto n = static_cast<uint8_t>(note(rng));
                if (press(rng))
                    channel.onLiveEvent(MidiMessage::noteOn(0, n, 100));
                else
                    channel.onLiveEvent(MidiMessage::noteOff(0, n));
                if (i == 1000 && p == 0)
                    channel.setArmed(false);
                if (i == 1500 && p == 0)
                    channel.setArmed(true);
            }
        });
    }
    for (auto& player : players)
        player.join();
    channel.releaseAll();
    EXPECT_TRUE(engine.unbalancedNotes().empty());
}
