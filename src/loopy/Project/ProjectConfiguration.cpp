#include <choc/text/choc_JSON.h>
#include <cmath>
#include <format>
#include <fstream>
#include <sstream>
#include "loopy/loopy.hpp"

namespace loopy {

    namespace {

        std::string memberPath(const std::string& parent, const std::string& key) {
            return parent.empty() ? key : parent + "." + key;
        }

        bool isNumber(const choc::value::ValueView& v) {
            return v.isInt32() || v.isInt64() || v.isFloat32() || v.isFloat64();
        }

        double readNumber(const choc::value::ValueView& v, const std::string& path) {
            if (!isNumber(v))
                throw ConfigurationError(std::format("'{}' must be a number", path));
            return v.getWithDefault<double>(0);
        }

        int64_t readInteger(const choc::value::ValueView& v, const std::string& path, int64_t min, int64_t max) {
            auto value = readNumber(v, path);
            if (std::trunc(value) != value)
                throw ConfigurationError(std::format("'{}' must be an integer", path));
            if (value < static_cast<double>(min) || value > static_cast<double>(max))
                throw ConfigurationError(std::format("'{}' must be between {} and {}", path, min, max));
            return static_cast<int64_t>(value);
        }

        uint8_t readMidiByte(const choc::value::ValueView& v, const std::string& path, int64_t max = MIDI_DATA_MAX) {
            return static_cast<uint8_t>(readInteger(v, path, 0, max));
        }

        std::string readString(const choc::value::ValueView& v, const std::string& path) {
            if (!v.isString())
                throw ConfigurationError(std::format("'{}' must be a string", path));
            return std::string(v.getString());
        }

        bool readBool(const choc::value::ValueView& v, const std::string& path) {
            if (!v.isBool())
                throw ConfigurationError(std::format("'{}' must be true or false", path));
            return v.getBool();
        }

        Nanoseconds readMilliseconds(const choc::value::ValueView& v, const std::string& path) {
            auto ms = readNumber(v, path);
            if (ms < 0)
                throw ConfigurationError(std::format("'{}' must not be negative", path));
            if (ms > std::chrono::duration<double, std::milli>(Step::kMaxInputDuration).count())
                throw ConfigurationError(std::format("'{}' must not exceed one hour", path));
            return std::chrono::duration_cast<Nanoseconds>(std::chrono::duration<double, std::milli>(ms));
        }

        void requireObject(const choc::value::ValueView& v, const std::string& path) {
            if (!v.isObject())
                throw ConfigurationError(std::format("'{}' must be an object", path.empty() ? "(root)" : path));
        }

        void requireArray(const choc::value::ValueView& v, const std::string& path) {
            if (!v.isArray())
                throw ConfigurationError(std::format("'{}' must be an array", path));
        }

        InstrumentChannel::Kind parseKind(const std::string& name, const std::string& path) {
            if (name == "step_sequencer")
                return InstrumentChannel::Kind::StepSequencer;
            if (name == "free_midi")
                return InstrumentChannel::Kind::FreeMidi;
            if (name == "free_metronome")
                return InstrumentChannel::Kind::FreeMetronome;
            throw ConfigurationError(std::format("'{}' has unknown channel type '{}'", path, name));
        }

        InstrumentConfiguration parseInstrument(const choc::value::ValueView& obj, const std::string& path) {
            requireObject(obj, path);
            InstrumentConfiguration ret;
            if (!obj.hasObjectMember("id"))
                throw ConfigurationError(std::format("'{}' needs an 'id'", path));
            ret.id = readString(obj["id"], memberPath(path, "id"));
            if (obj.hasObjectMember("preset"))
                ret.preset = readString(obj["preset"], memberPath(path, "preset"));
            if (obj.hasObjectMember("program"))
                ret.program = readMidiByte(obj["program"], memberPath(path, "program"));
            if (obj.hasObjectMember("channel"))
                ret.channel = readMidiByte(obj["channel"], memberPath(path, "channel"), MIDI_CHANNEL_COUNT - 1);
            if (ret.preset && ret.program)
                throw ConfigurationError(std::format("'{}' has both 'preset' and 'program'", path));
            return ret;
        }

        StepConfiguration parseStep(const choc::value::ValueView& obj, const std::string& path) {
            requireObject(obj, path);
            StepConfiguration ret;
            if (!obj.hasObjectMember("index"))
                throw ConfigurationError(std::format("'{}' needs an 'index'", path));
            ret.index = static_cast<size_t>(readInteger(obj["index"], memberPath(path, "index"), 0, Sequence::kMaxLength - 1));
            ret.step.enabled = true;
            if (obj.hasObjectMember("note"))
                ret.step.note = readMidiByte(obj["note"], memberPath(path, "note"));
            if (obj.hasObjectMember("velocity"))
                ret.step.velocity = readMidiByte(obj["velocity"], memberPath(path, "velocity"));
            if (obj.hasObjectMember("duration_ms"))
                ret.step.duration = readMilliseconds(obj["duration_ms"], memberPath(path, "duration_ms"));
            if (obj.hasObjectMember("enabled"))
                ret.step.enabled = readBool(obj["enabled"], memberPath(path, "enabled"));
            return ret;
        }

        ChannelConfiguration parseChannel(const choc::value::ValueView& obj, const std::string& path) {
            requireObject(obj, path);
            ChannelConfiguration ret;
            if (obj.hasObjectMember("type"))
                ret.kind = parseKind(readString(obj["type"], memberPath(path, "type")), memberPath(path, "type"));
            if (!obj.hasObjectMember("instrument"))
                throw ConfigurationError(std::format("'{}' needs an 'instrument'", path));
            ret.instrument = readString(obj["instrument"], memberPath(path, "instrument"));
            ret.name = obj.hasObjectMember("name") ? readString(obj["name"], memberPath(path, "name")) : ret.instrument;
            if (obj.hasObjectMember("volume"))
                ret.volume = readMidiByte(obj["volume"], memberPath(path, "volume"), InstrumentChannel::kFullVolume);

            switch (ret.kind) {
                case InstrumentChannel::Kind::StepSequencer:
                    if (obj.hasObjectMember("length"))
                        ret.length = static_cast<size_t>(readInteger(obj["length"], memberPath(path, "length"), 0, Sequence::kMaxLength));
                    if (obj.hasObjectMember("steps")) {
                        auto steps = obj["steps"];
                        auto stepsPath = memberPath(path, "steps");
                        requireArray(steps, stepsPath);
                        for (uint32_t i = 0; i < steps.size(); i++)
                            ret.steps.push_back(parseStep(steps[i], std::format("{}[{}]", stepsPath, i)));
                    }
                    break;
                case InstrumentChannel::Kind::FreeMetronome:
                    if (obj.hasObjectMember("click")) {
                        auto mode = readString(obj["click"], memberPath(path, "click"));
                        if (mode == "beat")
                            ret.click.mode = ClickMode::EveryBeat;
                        else if (mode == "step")
                            ret.click.mode = ClickMode::EveryStep;
                        else
                            throw ConfigurationError(std::format("'{}' must be \"beat\" or \"step\"", memberPath(path, "click")));
                    }
                    if (obj.hasObjectMember("enabled"))
                        ret.click.enabled = readBool(obj["enabled"], memberPath(path, "enabled"));
                    if (obj.hasObjectMember("accent"))
                        ret.click.accent = readBool(obj["accent"], memberPath(path, "accent"));
                    if (obj.hasObjectMember("note"))
                        ret.click.note = readMidiByte(obj["note"], memberPath(path, "note"));
                    if (obj.hasObjectMember("velocity"))
                        ret.click.velocity = readMidiByte(obj["velocity"], memberPath(path, "velocity"));
                    if (obj.hasObjectMember("accent_velocity"))
                        ret.click.accentVelocity = readMidiByte(obj["accent_velocity"], memberPath(path, "accent_velocity"), 255);
                    if (obj.hasObjectMember("click_ms")) {
                        ret.click.clickLength = readMilliseconds(obj["click_ms"], memberPath(path, "click_ms"));
                        if (ret.click.clickLength.count() == 0)
                            throw ConfigurationError(std::format("'{}' must be positive", memberPath(path, "click_ms")));
                    }
                    break;
                case InstrumentChannel::Kind::FreeMidi:
                    if (obj.hasObjectMember("input_port"))
                        ret.input_port = readString(obj["input_port"], memberPath(path, "input_port"));
                    break;
            }
            return ret;
        }

    } // namespace

    Logger::LogLevel parseLogLevel(std::string_view name) {
        if (name == "diagnostic" || name == "debug")
            return Logger::DIAGNOSTIC;
        if (name == "info")
            return Logger::INFO;
        if (name == "warning")
            return Logger::WARNING;
        if (name == "error")
            return Logger::ERROR;
        throw ConfigurationError(std::format("unknown log level '{}'", name));
    }

    ProjectConfiguration ProjectConfiguration::parse(std::string_view json) {
        choc::value::Value root;
        try {
            root = choc::json::parse(json);
        } catch (const choc::json::ParseError& e) {
            throw ConfigurationError(std::format("malformed JSON at line {}, column {}: {}",
                                                 e.lineAndColumn.line, e.lineAndColumn.column, e.what()));
        }
        requireObject(root, "");

        ProjectConfiguration ret;
        if (root.hasObjectMember("tempo")) {
            ret.tempo = readNumber(root["tempo"], "tempo");
            if (!std::isfinite(ret.tempo) || ret.tempo <= 0)
                throw ConfigurationError("'tempo' must be positive");
        }
        if (root.hasObjectMember("steps_per_beat"))
            ret.steps_per_beat = static_cast<int32_t>(readInteger(root["steps_per_beat"], "steps_per_beat", 1, 64));
        if (root.hasObjectMember("beats_per_bar"))
            ret.beats_per_bar = static_cast<int32_t>(readInteger(root["beats_per_bar"], "beats_per_bar", 1, 64));
        if (root.hasObjectMember("log_level")) {
            auto level = readString(root["log_level"], "log_level");
            try {
                ret.log_level = parseLogLevel(level);
            } catch (const ConfigurationError&) {
                throw ConfigurationError(std::format("'log_level' has unknown value '{}'", level));
            }
        }

        if (root.hasObjectMember("midi_output")) {
            auto output = root["midi_output"];
            requireObject(output, "midi_output");
            if (output.hasObjectMember("api"))
                ret.midi_output.api_name = readString(output["api"], "midi_output.api");
            if (output.hasObjectMember("port_name"))
                ret.midi_output.port_name = readString(output["port_name"], "midi_output.port_name");
            if (output.hasObjectMember("connect_to"))
                ret.midi_output.connect_to = readString(output["connect_to"], "midi_output.connect_to");
            if (output.hasObjectMember("queue_capacity"))
                ret.midi_output.queue_capacity = static_cast<size_t>(readInteger(output["queue_capacity"], "midi_output.queue_capacity", 16, 1 << 20));
        }

        if (root.hasObjectMember("presets")) {
            auto presets = root["presets"];
            requireObject(presets, "presets");
            for (uint32_t i = 0; i < presets.size(); i++) {
                auto member = presets.getObjectMemberAt(i);
                std::string name{member.name};
                ret.presets[name] = readMidiByte(member.value, memberPath("presets", name));
            }
        }

        if (root.hasObjectMember("instruments")) {
            auto instruments = root["instruments"];
            requireArray(instruments, "instruments");
            for (uint32_t i = 0; i < instruments.size(); i++)
                ret.instruments.push_back(parseInstrument(instruments[i], std::format("instruments[{}]", i)));
        }

        if (root.hasObjectMember("channels")) {
            auto channels = root["channels"];
            requireArray(channels, "channels");
            for (uint32_t i = 0; i < channels.size(); i++)
                ret.channels.push_back(parseChannel(channels[i], std::format("channels[{}]", i)));
        }
        return ret;
    }

    ProjectConfiguration ProjectConfiguration::load(const std::filesystem::path& file) {
        std::ifstream ifs(file);
        if (!ifs)
            throw ConfigurationError(std::format("cannot read configuration file '{}'", file.string()));
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return parse(buffer.str());
    }

    void ProjectConfiguration::applyTo(Project& project) const {
        const auto previousTempo = project.tempo();
        const auto previousStepsPerBeat = project.stepsPerBeat();
        const auto previousBeatsPerBar = project.beatsPerBar();
        const auto previousPresets = project.registry().presets();
        std::vector<std::string> addedInstruments;
        std::vector<std::string> addedChannels;

        try {
            project.setTempo(tempo);
            project.setStepsPerBeat(steps_per_beat);
            project.setBeatsPerBar(beats_per_bar);
            if (!presets.empty()) {
                auto table = previousPresets;
                for (auto& [name, program] : presets)
                    table[name] = program;
                project.registry().presets(std::move(table));
            }

            for (auto& instrument : instruments) {
                const bool existed = project.registry().find(instrument.id).has_value();
                if (instrument.preset)
                    project.registerInstrumentFromPreset(instrument.id, *instrument.preset, instrument.channel);
                else
                    project.registerInstrument(instrument.id, instrument.channel, instrument.program.value_or(0));
                if (!existed)
                    addedInstruments.push_back(instrument.id);
            }

            for (auto& channel : channels) {
                std::shared_ptr<InstrumentChannel> created;
                switch (channel.kind) {
                    case InstrumentChannel::Kind::StepSequencer: {
                        auto steps = project.addStepSequencerChannel(channel.name, channel.instrument, channel.length);
                        created = steps;
                        addedChannels.push_back(channel.name);
                        for (auto& step : channel.steps)
                            steps->sequence().setStep(step.index, step.step);
                        break;
                    }
                    case InstrumentChannel::Kind::FreeMidi:
                        created = project.addFreeMidiChannel(channel.name, channel.instrument);
                        addedChannels.push_back(channel.name);
                        break;
                    case InstrumentChannel::Kind::FreeMetronome:
                        created = project.addFreeMetronomeChannel(channel.name, channel.instrument, channel.click);
                        addedChannels.push_back(channel.name);
                        break;
                }
                created->volume(channel.volume);
            }
        } catch (const std::exception& e) {
            Logger::global()->logError("Configuration could not be applied: %s", e.what());
            for (auto it = addedChannels.rbegin(); it != addedChannels.rend(); ++it)
                project.removeChannel(*it);
            for (auto it = addedInstruments.rbegin(); it != addedInstruments.rend(); ++it)
                project.unregisterInstrument(*it);
            project.registry().presets(previousPresets);
            project.setTempo(previousTempo);
            project.setStepsPerBeat(previousStepsPerBeat);
            project.setBeatsPerBar(previousBeatsPerBar);
            throw;
        }
    }

}
