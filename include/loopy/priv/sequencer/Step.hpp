#pragma once

#include <chrono>
#include <cstdint>

#include "loopy/priv/CommonTypes.hpp"

namespace loopy {

    // One slot of a Sequence. A default-constructed Step is empty (disabled).
    struct Step {
        uint8_t note{60};
        uint8_t velocity{100};
        // Zero means "one step interval".
        Nanoseconds duration{0};
        bool enabled{false};

        // Longest duration accepted from user input (configuration files, the shell).
        static constexpr std::chrono::hours kMaxInputDuration{1};

        static Step make(uint8_t note, uint8_t velocity, Nanoseconds duration = Nanoseconds{0}) {
            return Step{note, velocity, duration, true};
        }

        bool sounds() const { return enabled && velocity > 0; }

        bool operator==(const Step& other) const = default;
    };

}
