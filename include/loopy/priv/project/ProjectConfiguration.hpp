#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "loopy/priv/Logger.hpp"
#include "loopy/priv/channels/FreeMetronomeChannel.hpp"
#include "loopy/priv/devices/MidiInputDevice.hpp"
#include "loopy/priv/engine/SoundEngine.hpp"
#include "loopy/priv/sequencer/Step.hpp"

namespace loopy {

    class Project;

    struct InstrumentConfiguration {
        std::string id{};
        // Either a preset name or a program; neither means program 0.
        std::optional<std::string> preset{};
        std::optional<uint8_t> program{};
        std::optional<uint8_t> channel{};
    };

    struct StepConfiguration {
        size_t index{0};
        Step step{};
    };

    struct ChannelConfiguration {
        InstrumentChannel::Kind kind{InstrumentChannel::Kind::StepSequencer};
        std::string name{};
        std::string instrument{};
        // percent; scales step and click velocities
        uint8_t volume{InstrumentChannel::kFullVolume};
        // step_sequencer
        size_t length{16};
        std::vector<StepConfiguration> steps{};
        // free_metronome
        ClickSettings click{};
        // free_midi: substring of an existing input port; empty creates a virtual port.
        std::string input_port{};
    };

    // A session description, read from JSON. Every key is optional.
    struct ProjectConfiguration {
        double tempo{120.0};
        int32_t steps_per_beat{4};
        int32_t beats_per_bar{4};
        Logger::LogLevel log_level{Logger::INFO};
        MidiOutputOptions midi_output{};
        std::map<std::string, uint8_t> presets{};
        std::vector<InstrumentConfiguration> instruments{};
        std::vector<ChannelConfiguration> channels{};

        // Throws ConfigurationError for malformed JSON or wrongly-typed values.
        static ProjectConfiguration parse(std::string_view json);
        static ProjectConfiguration load(const std::filesystem::path& file);

        // Sets the tempo and meter, installs the preset table, registers the instruments
        // and creates the channels. On failure everything this call added is removed again
        // and the exception (InvalidArgument, DuplicateChannel, ...) is rethrown.
        void applyTo(Project& project) const;
    };

    Logger::LogLevel parseLogLevel(std::string_view name);

}
