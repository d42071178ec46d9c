#pragma once

#include <stdexcept>
#include <string>

namespace loopy {

    // Rejected mutation: non-positive tempo, out-of-range note/velocity/channel/program,
    // unknown instrument or preset.
    class InvalidArgument : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // The requested MIDI channel is already taken by another active instrument.
    class DuplicateChannel : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // All 16 MIDI channels are in use.
    class ChannelsExhausted : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Out-of-range step access. Reaching this from the playback path is a bug.
    class IndexError : public std::out_of_range {
    public:
        using std::out_of_range::out_of_range;
    };

    class BackendUnavailable : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ConfigurationError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

}
