#include <gtest/gtest.h>

#include <chrono>

#include <loopy/loopy.hpp>
#include "RecordingSoundEngine.hpp"

using namespace loopy;
using namespace std::chrono_literals;
using Kind = loopy::testing::RecordingSoundEngine::Kind;

class NoteOffSchedulerTest : public ::testing::Test {
protected:
    loopy::testing::RecordingSoundEngine engine{};
    NoteOffScheduler scheduler{engine};
    TimePoint t0{TimePoint{} + 1h};
};

TEST_F(NoteOffSchedulerTest, NoteOffFiresWhenDue) {
    EXPECT_EQ(scheduler.trigger(0, 60, 100, t0 + 100ms), SoundEngineStatus::OK);
    EXPECT_EQ(engine.count(Kind::NoteOn), 1);
    EXPECT_EQ(scheduler.soundingCount(), 1);
    ASSERT_TRUE(scheduler.nextDue().has_value());
    EXPECT_EQ(*scheduler.nextDue(), t0 + 100ms);

    EXPECT_EQ(scheduler.fireDue(t0 + 99ms), 0);
    EXPECT_EQ(engine.count(Kind::NoteOff), 0);
    EXPECT_EQ(scheduler.fireDue(t0 + 100ms), 1);

    auto offs = engine.events(Kind::NoteOff);
    ASSERT_EQ(offs.size(), 1);
    EXPECT_EQ(offs[0].channel, 0);
    EXPECT_EQ(offs[0].data1, 60);
    EXPECT_EQ(scheduler.soundingCount(), 0);
    EXPECT_FALSE(scheduler.nextDue().has_value());
}

TEST_F(NoteOffSchedulerTest, NoteOffsFireInTimeOrder) {
    scheduler.trigger(0, 64, 100, t0 + 300ms);
    scheduler.trigger(0, 60, 100, t0 + 100ms);
    scheduler.trigger(1, 67, 100, t0 + 200ms);

    EXPECT_EQ(scheduler.fireDue(t0 + 1s), 3);
    auto offs = engine.events(Kind::NoteOff);
    ASSERT_EQ(offs.size(), 3);
    EXPECT_EQ(offs[0].data1, 60);
    EXPECT_EQ(offs[1].data1, 67);
    EXPECT_EQ(offs[1].channel, 1);
    EXPECT_EQ(offs[2].data1, 64);
}

TEST_F(NoteOffSchedulerTest, RetriggerReleasesTheSoundingNoteFirst) {
    scheduler.trigger(2, 60, 100, t0 + 100ms);
    scheduler.trigger(2, 60, 90, t0 + 200ms);

    auto events = engine.events();
    ASSERT_EQ(events.size(), 3);
    EXPECT_EQ(events[0].kind, Kind::NoteOn);
    EXPECT_EQ(events[1].kind, Kind::NoteOff);
    EXPECT_EQ(events[2].kind, Kind::NoteOn);
    EXPECT_EQ(events[2].data2, 90);

    // the first timer was superseded by the retrigger
    ASSERT_TRUE(scheduler.nextDue().has_value());
    EXPECT_EQ(*scheduler.nextDue(), t0 + 200ms);
    EXPECT_EQ(scheduler.fireDue(t0 + 150ms), 0);
    EXPECT_EQ(scheduler.fireDue(t0 + 200ms), 1);
    EXPECT_TRUE(engine.unbalancedNotes().empty());
}

TEST_F(NoteOffSchedulerTest, SameNoteOnDifferentChannelsIsIndependent) {
    scheduler.trigger(0, 60, 100, t0 + 100ms);
    scheduler.trigger(1, 60, 100, t0 + 100ms);
    EXPECT_EQ(engine.count(Kind::NoteOff), 0);
    EXPECT_EQ(scheduler.soundingCount(), 2);
}

TEST_F(NoteOffSchedulerTest, PanicReleasesEveryPendingNoteExactlyOnce) {
    scheduler.trigger(0, 60, 100, t0 + 100ms);
    scheduler.trigger(0, 64, 100, t0 + 1s);
    scheduler.trigger(9, 76, 127, t0 + 50ms);

    EXPECT_EQ(scheduler.panic(), 3);
    EXPECT_EQ(engine.count(Kind::NoteOff), 3);
    EXPECT_EQ(scheduler.soundingCount(), 0);

    EXPECT_EQ(scheduler.fireDue(t0 + 1h), 0);
    EXPECT_EQ(scheduler.panic(), 0);
    EXPECT_EQ(engine.count(Kind::NoteOff), 3);
    EXPECT_TRUE(engine.unbalancedNotes().empty());
}

TEST_F(NoteOffSchedulerTest, RejectedNoteOffIsRetriedOnce) {
    scheduler.trigger(0, 60, 100, t0);
    engine.reject_note_offs = 1;
    EXPECT_EQ(scheduler.fireDue(t0), 1);
    EXPECT_EQ(engine.count(Kind::NoteOff), 1);
    EXPECT_EQ(scheduler.deliveredNoteOffs(), 1);
    EXPECT_EQ(scheduler.failedNoteOffs(), 0);
}

TEST_F(NoteOffSchedulerTest, NoteOffThatFailsTwiceIsReported) {
    scheduler.trigger(0, 60, 100, t0);
    engine.reject_note_offs = 2;
    EXPECT_EQ(scheduler.fireDue(t0), 1);
    EXPECT_EQ(engine.count(Kind::NoteOff), 0);
    EXPECT_EQ(scheduler.failedNoteOffs(), 1);
    // resolved all the same: it is not attempted again
    EXPECT_EQ(scheduler.soundingCount(), 0);
    EXPECT_EQ(scheduler.panic(), 0);
}

TEST_F(NoteOffSchedulerTest, UnavailableBackendSchedulesNothing) {
    engine.is_available = false;
    EXPECT_EQ(scheduler.trigger(0, 60, 100, t0 + 100ms), SoundEngineStatus::BACKEND_UNAVAILABLE);
    EXPECT_EQ(scheduler.trigger(0, 62, 100, t0 + 100ms), SoundEngineStatus::BACKEND_UNAVAILABLE);
    EXPECT_EQ(scheduler.soundingCount(), 0);
    EXPECT_FALSE(scheduler.nextDue().has_value());
    EXPECT_EQ(scheduler.acceptedNoteOns(), 0);

    engine.is_available = true;
    EXPECT_EQ(scheduler.trigger(0, 60, 100, t0 + 100ms), SoundEngineStatus::OK);
    EXPECT_EQ(scheduler.acceptedNoteOns(), 1);
    EXPECT_EQ(scheduler.fireDue(t0 + 100ms), 1);
    EXPECT_TRUE(engine.unbalancedNotes().empty());
}

TEST_F(NoteOffSchedulerTest, EveryVoiceCanBeReleasedInOnePass) {
    for (int pass = 0; pass < 2; pass++) {
        for (uint8_t channel = 0; channel < MIDI_CHANNEL_COUNT; channel++)
            for (int note = 0; note <= MIDI_DATA_MAX; note++)
                scheduler.trigger(channel, static_cast<uint8_t>(note), 100, t0 + 10ms);
        EXPECT_EQ(scheduler.soundingCount(), 16 * 128);
        EXPECT_EQ(scheduler.fireDue(t0 + 9ms), 0);
        EXPECT_EQ(scheduler.fireDue(t0 + 10ms), 16 * 128);
        EXPECT_EQ(scheduler.soundingCount(), 0);
        EXPECT_EQ(scheduler.fireDue(t0 + 10ms), 0);
    }
    EXPECT_EQ(engine.count(Kind::NoteOff), 2 * 16 * 128);
    EXPECT_TRUE(engine.unbalancedNotes().empty());
}
