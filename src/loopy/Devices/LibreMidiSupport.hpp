#pragma once

#include <optional>
#include <string>
#include <vector>

#include <libremidi/libremidi.hpp>

namespace loopy::detail {

    // Picks a UMP-capable libremidi API out of `available` for a user-facing name
    // ("ALSA", "PIPEWIRE", "JACK", "WINMIDI", "COREMIDI", case-insensitive). A known name
    // that is not available gives nullopt. Empty, "default" and unknown names take the
    // first available API in loopy's preference order; `sandboxed` (Flatpak, Snap) moves
    // PipeWire to the front.
    std::optional<libremidi::API> chooseUmpApi(const std::string& apiName,
                                               const std::vector<libremidi::API>& available,
                                               bool sandboxed);

    // chooseUmpApi() against what libremidi reports on this machine.
    std::optional<libremidi::API> resolveLibreMidiUmpApi(const std::string& apiName);

    std::string portDisplayName(const libremidi::port_information& port);

    // First port whose name contains `needle` (case-insensitive).
    std::optional<libremidi::input_port> findInputPort(libremidi::API api, const std::string& needle);
    std::optional<libremidi::output_port> findOutputPort(libremidi::API api, const std::string& needle);

}
