#include <gtest/gtest.h>

#include <loopy/loopy.hpp>

using namespace loopy;

TEST(MidiMessageTest, EncodesMidi1ChannelVoiceUmp) {
    EXPECT_EQ(MidiMessage::noteOn(3, 60, 100).toUmp(), 0x20933C64u);
    EXPECT_EQ(MidiMessage::noteOff(0, 64).toUmp(), 0x20804000u);
    EXPECT_EQ(MidiMessage::programChange(9, 115).toUmp(1), 0x21C97300u);
    // data bytes are masked to 7 bits
    EXPECT_EQ(MidiMessage::controlChange(0, 7, 0xFF).toUmp(), 0x20B0077Fu);
}

TEST(MidiMessageTest, DecodesMidi1Ump) {
    loopy_ump_t ump = 0x20B50A40u;
    auto msg = MidiMessage::fromUmp(&ump, sizeof(ump));
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->type(), MidiMessage::Type::CONTROL_CHANGE);
    EXPECT_EQ(msg->channel(), 5);
    EXPECT_EQ(msg->data1, 10);
    EXPECT_EQ(msg->data2, 64);

    auto note = MidiMessage::noteOn(2, 67, 90);
    auto encoded = note.toUmp();
    EXPECT_EQ(MidiMessage::fromUmp(&encoded, sizeof(encoded)), note);
}

TEST(MidiMessageTest, DownscalesMidi2Messages) {
    loopy_ump_t noteOn[2] = {0x40913C00u, 0xFFFF0000u};
    auto msg = MidiMessage::fromUmp(noteOn, sizeof(noteOn));
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, MidiMessage::noteOn(1, 60, 127));

    // the smallest MIDI 2.0 velocity is still a note-on
    loopy_ump_t quiet[2] = {0x40913C00u, 0x00010000u};
    msg = MidiMessage::fromUmp(quiet, sizeof(quiet));
    ASSERT_TRUE(msg.has_value());
    EXPECT_TRUE(msg->isNoteOn());
    EXPECT_EQ(msg->data2, 1);

    loopy_ump_t cc[2] = {0x40B00700u, 0x80000000u};
    msg = MidiMessage::fromUmp(cc, sizeof(cc));
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(*msg, MidiMessage::controlChange(0, 7, 64));
}

TEST(MidiMessageTest, RejectsTruncatedAndNonChannelMessages) {
    loopy_ump_t noteOn[2] = {0x40913C00u, 0xFFFF0000u};
    EXPECT_FALSE(MidiMessage::fromUmp(noteOn, sizeof(loopy_ump_t)).has_value());
    EXPECT_FALSE(MidiMessage::fromUmp(nullptr, 8).has_value());

    loopy_ump_t utility = 0x00000000u;
    EXPECT_FALSE(MidiMessage::fromUmp(&utility, sizeof(utility)).has_value());
    loopy_ump_t system = 0x10F80000u;
    EXPECT_FALSE(MidiMessage::fromUmp(&system, sizeof(system)).has_value());
}

TEST(MidiMessageTest, ZeroVelocityNoteOnIsANoteOff) {
    auto msg = MidiMessage::noteOn(0, 60, 0);
    EXPECT_FALSE(msg.isNoteOn());
    EXPECT_TRUE(msg.isNoteOff());
    EXPECT_TRUE(MidiMessage::noteOff(0, 60, 64).isNoteOff());
    EXPECT_FALSE(MidiMessage::controlChange(0, 60, 0).isNoteOff());
}

TEST(MidiMessageTest, WithChannelKeepsTypeAndData) {
    auto msg = MidiMessage::controlChange(4, 1, 99).withChannel(11);
    EXPECT_EQ(msg.type(), MidiMessage::Type::CONTROL_CHANGE);
    EXPECT_EQ(msg.channel(), 11);
    EXPECT_EQ(msg.data1, 1);
    EXPECT_EQ(msg.data2, 99);
}
