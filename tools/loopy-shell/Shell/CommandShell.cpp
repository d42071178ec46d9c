#include "CommandShell.hpp"

#include <charconv>
#include <format>
#include <sstream>

namespace loopy {

    namespace {

        template <typename T>
        T parseArgument(const std::string& text, const char* what) {
            T value{};
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size())
                throw InvalidArgument(std::format("{} must be a number (got '{}')", what, text));
            return value;
        }

        uint8_t parseMidiByte(const std::string& text, const char* what) {
            auto value = parseArgument<int>(text, what);
            if (value < 0 || value > MIDI_DATA_MAX)
                throw InvalidArgument(std::format("{} {} is out of range (0-127)", what, value));
            return static_cast<uint8_t>(value);
        }

        void requireArguments(const std::vector<std::string>& args, size_t count, const char* usage) {
            if (args.size() < count + 1)
                throw InvalidArgument(std::format("usage: {}", usage));
        }

        const char* helpText =
            "  play | stop\n"
            "  tempo <bpm>\n"
            "  step <channel> <index> <note> <velocity> [duration_ms]\n"
            "  toggle <channel> <index>\n"
            "  clear <channel> [index]\n"
            "  resize <channel> <length>\n"
            "  mute <channel> on|off\n"
            "  volume <channel> <0-100>\n"
            "  click beat|step\n"
            "  status | ports | reconnect | help | quit\n";
    }

    CommandShell::CommandShell(ProjectConfiguration configuration, std::shared_ptr<SoundEngine> engine)
        : configuration(std::move(configuration)),
          engine(std::move(engine)) {
        project = std::make_unique<Project>(this->engine,
                                            this->configuration.tempo,
                                            this->configuration.steps_per_beat,
                                            this->configuration.beats_per_bar);
        this->configuration.applyTo(*project);
    }

    CommandShell::~CommandShell() {
        inputs.clear();
        if (project)
            project->stop();
    }

    std::unique_ptr<CommandShell> CommandShell::create(int32_t argc, const char** argv) {
        ProjectConfiguration configuration{};
        if (argc > 1) {
            configuration = ProjectConfiguration::load(argv[1]);
            Logger::global()->logInfo("Loaded %s", argv[1]);
        }
        Logger::minimumLevel(configuration.log_level);

        std::shared_ptr<SoundEngine> engine = createLibreMidiSoundEngine(configuration.midi_output);
        auto shell = std::make_unique<CommandShell>(std::move(configuration), std::move(engine));
        shell->openLiveInputs();
        return shell;
    }

    void CommandShell::openLiveInputs() {
        for (auto& channelConfig : configuration.channels) {
            if (channelConfig.kind != InstrumentChannel::Kind::FreeMidi)
                continue;
            auto channel = project->findChannelAs<FreeMidiChannel>(channelConfig.name);
            if (!channel)
                continue;
            MidiInputOptions options{};
            options.api_name = configuration.midi_output.api_name;
            options.port_name = std::format("{} {}", configuration.midi_output.port_name, channelConfig.name);
            options.connect_to = channelConfig.input_port;
            try {
                inputs.push_back(createLibreMidiInputDevice(options, channel));
            } catch (const BackendUnavailable& e) {
                Logger::global()->logWarning("%s: live input is not available: %s", channelConfig.name.c_str(), e.what());
            }
        }
    }

    std::shared_ptr<StepSequencerChannel> CommandShell::stepChannel(const std::string& name) const {
        auto channel = project->findChannelAs<StepSequencerChannel>(name);
        if (!channel)
            throw InvalidArgument(std::format("no step sequencer channel named '{}'", name));
        return channel;
    }

    void CommandShell::printStatus(std::ostream& out) const {
        out << std::format("{} at {:.2f} BPM, {} steps per beat, {} beats per bar\n",
                           project->playing() ? "playing" : "stopped",
                           project->tempo(), project->stepsPerBeat(), project->beatsPerBar());
        out << std::format("MIDI output: {}\n", engine->available() ? "available" : "unavailable");
        for (auto& channel : project->channels()) {
            const auto& instrument = channel->instrument();
            out << std::format("  {:<16} {:<15} {} (MIDI channel {}, program {}) vol={}",
                               channel->name(), toString(channel->kind()), instrument.id,
                               static_cast<int>(instrument.channel) + 1, static_cast<int>(instrument.program),
                               static_cast<int>(channel->volume()));
            if (auto steps = std::dynamic_pointer_cast<StepSequencerChannel>(channel)) {
                auto& sequence = steps->sequence();
                std::string pattern;
                for (auto& step : sequence.steps())
                    pattern += step.sounds() ? 'x' : '.';
                out << std::format(" [{}]{}", pattern, steps->muted() ? " muted" : "");
            } else if (auto click = std::dynamic_pointer_cast<FreeMetronomeChannel>(channel)) {
                auto settings = click->settings();
                out << std::format(" click={}{}", toString(settings.mode), settings.enabled ? "" : " off");
            } else if (auto live = std::dynamic_pointer_cast<FreeMidiChannel>(channel)) {
                out << std::format(" held={}", live->heldNotes().size());
            }
            out << "\n";
        }
    }

    void CommandShell::printPorts(std::ostream& out) const {
        const auto& api = configuration.midi_output.api_name;
        out << "outputs:\n";
        for (auto& name : listMidiOutputPorts(api))
            out << "  " << name << "\n";
        out << "inputs:\n";
        for (auto& name : listMidiInputPorts(api))
            out << "  " << name << "\n";
    }

    bool CommandShell::execute(const std::string& line, std::ostream& out) {
        std::istringstream tokens(line);
        std::vector<std::string> args;
        for (std::string token; tokens >> token;)
            args.push_back(token);
        if (args.empty())
            return true;

        const auto& command = args[0];
        try {
            if (command == "quit" || command == "exit") {
                return false;
            } else if (command == "help") {
                out << helpText;
            } else if (command == "play") {
                project->start();
            } else if (command == "stop") {
                project->stop();
            } else if (command == "tempo") {
                requireArguments(args, 1, "tempo <bpm>");
                project->setTempo(parseArgument<double>(args[1], "tempo"));
            } else if (command == "step") {
                requireArguments(args, 4, "step <channel> <index> <note> <velocity> [duration_ms]");
                Nanoseconds duration{0};
                if (args.size() > 5) {
                    std::chrono::duration<double, std::milli> ms{parseArgument<double>(args[5], "duration")};
                    if (!(ms.count() >= 0) || ms > Step::kMaxInputDuration)
                        throw InvalidArgument(std::format("duration must be between 0 and {} ms",
                                                          std::chrono::milliseconds(Step::kMaxInputDuration).count()));
                    duration = std::chrono::duration_cast<Nanoseconds>(ms);
                }
                stepChannel(args[1])->sequence().setStep(parseArgument<size_t>(args[2], "index"),
                                                         Step::make(parseMidiByte(args[3], "note"), parseMidiByte(args[4], "velocity"), duration));
            } else if (command == "toggle") {
                requireArguments(args, 2, "toggle <channel> <index>");
                auto enabled = stepChannel(args[1])->sequence().toggle(parseArgument<size_t>(args[2], "index"));
                out << (enabled ? "on" : "off") << "\n";
            } else if (command == "clear") {
                requireArguments(args, 1, "clear <channel> [index]");
                auto channel = stepChannel(args[1]);
                if (args.size() > 2)
                    channel->sequence().clearStep(parseArgument<size_t>(args[2], "index"));
                else
                    channel->sequence().clear();
            } else if (command == "resize") {
                requireArguments(args, 2, "resize <channel> <length>");
                stepChannel(args[1])->sequence().resize(parseArgument<size_t>(args[2], "length"));
            } else if (command == "mute") {
                requireArguments(args, 2, "mute <channel> on|off");
                if (args[2] != "on" && args[2] != "off")
                    throw InvalidArgument("usage: mute <channel> on|off");
                stepChannel(args[1])->muted(args[2] == "on");
            } else if (command == "volume") {
                requireArguments(args, 2, "volume <channel> <0-100>");
                auto channel = project->findChannel(args[1]);
                if (!channel)
                    throw InvalidArgument(std::format("no channel named '{}'", args[1]));
                auto percent = parseArgument<int>(args[2], "volume");
                if (percent < 0 || percent > InstrumentChannel::kFullVolume)
                    throw InvalidArgument(std::format("volume {} is out of range (0-100)", percent));
                channel->volume(static_cast<uint8_t>(percent));
            } else if (command == "click") {
                requireArguments(args, 1, "click beat|step");
                if (args[1] != "beat" && args[1] != "step")
                    throw InvalidArgument("usage: click beat|step");
                size_t changed = 0;
                for (auto& channel : project->channels())
                    if (auto click = std::dynamic_pointer_cast<FreeMetronomeChannel>(channel)) {
                        click->setMode(args[1] == "beat" ? ClickMode::EveryBeat : ClickMode::EveryStep);
                        changed++;
                    }
                if (changed == 0)
                    out << "there is no metronome channel\n";
            } else if (command == "status") {
                printStatus(out);
            } else if (command == "ports") {
                printPorts(out);
            } else if (command == "reconnect") {
                out << (engine->reconnect() ? "MIDI output is available\n" : "MIDI output is still unavailable\n");
            } else {
                out << "unknown command: " << command << " (try 'help')\n";
            }
        } catch (const std::exception& e) {
            out << "error: " << e.what() << "\n";
        }
        return true;
    }

    int CommandShell::run(std::istream& in, std::ostream& out) {
        out << "loopy shell. Type 'help' for commands." << std::endl;
        for (std::string line; std::getline(in, line);) {
            if (!execute(line, out))
                break;
            out.flush();
        }
        project->stop();
        return 0;
    }

}
