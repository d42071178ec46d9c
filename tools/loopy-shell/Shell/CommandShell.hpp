#pragma once

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <loopy/loopy.hpp>

namespace loopy {

    // Line-oriented control surface for a Project.
    class CommandShell {
        ProjectConfiguration configuration;
        std::shared_ptr<SoundEngine> engine;
        std::unique_ptr<Project> project;
        // declared after `project`: inputs feed its channels and must go first.
        std::vector<std::unique_ptr<MidiInputDevice>> inputs;

        std::shared_ptr<StepSequencerChannel> stepChannel(const std::string& name) const;
        void printStatus(std::ostream& out) const;
        void printPorts(std::ostream& out) const;

    public:
        CommandShell(ProjectConfiguration configuration, std::shared_ptr<SoundEngine> engine);
        ~CommandShell();

        // argv[1], if present, is the configuration file.
        static std::unique_ptr<CommandShell> create(int32_t argc, const char** argv);

        // Opens a MIDI input for each free_midi channel. Failures are logged, not fatal.
        void openLiveInputs();

        Project& currentProject() { return *project; }

        // Runs one command. Returns false when the shell should quit.
        // Errors are printed to `out`.
        bool execute(const std::string& line, std::ostream& out);
        int run(std::istream& in = std::cin, std::ostream& out = std::cout);
    };

}
