#include "LibreMidiSupport.hpp"
#include "loopy/loopy.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace loopy::detail {

    namespace {

        struct ApiAlias {
            const char* name;
            libremidi::API api;
        };

        constexpr std::array<ApiAlias, 6> apiAliases{{
            {"pipewire", libremidi::API::PIPEWIRE_UMP},
            {"alsa", libremidi::API::ALSA_SEQ_UMP},
            {"jack", libremidi::API::JACK_UMP},
            {"coremidi", libremidi::API::COREMIDI_UMP},
            {"windows", libremidi::API::WINDOWS_MIDI_SERVICES},
            {"winmidi", libremidi::API::WINDOWS_MIDI_SERVICES},
        }};

        // the ALSA sequencer comes first: it is what FluidSynth and most Linux synths listen on.
        constexpr std::array<libremidi::API, 5> defaultOrder{
            libremidi::API::ALSA_SEQ_UMP,
            libremidi::API::WINDOWS_MIDI_SERVICES,
            libremidi::API::JACK_UMP,
            libremidi::API::COREMIDI_UMP,
            libremidi::API::ALSA_RAW_UMP,
        };

        std::string lowered(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return text;
        }

        bool contains(const std::vector<libremidi::API>& apis, libremidi::API api) {
            return std::find(apis.begin(), apis.end(), api) != apis.end();
        }

        bool isSandboxed() {
#if defined(__linux__)
            for (auto variable : {"FLATPAK_ID", "SNAP_NAME"})
                if (auto value = std::getenv(variable); value && *value)
                    return true;
            std::error_code ec;
            return std::filesystem::exists("/.flatpak-info", ec);
#else
            return false;
#endif
        }

        template <typename Port>
        std::optional<Port> firstMatching(const std::vector<Port>& ports, const std::string& needle) {
            const auto key = lowered(needle);
            auto it = std::find_if(ports.begin(), ports.end(), [&](const Port& port) {
                return lowered(portDisplayName(port)).find(key) != std::string::npos;
            });
            if (it == ports.end())
                return std::nullopt;
            return *it;
        }
    }

    std::optional<libremidi::API> chooseUmpApi(const std::string& apiName,
                                               const std::vector<libremidi::API>& available,
                                               bool sandboxed) {
        if (available.empty())
            return std::nullopt;

        const auto name = lowered(apiName);
        auto alias = std::find_if(apiAliases.begin(), apiAliases.end(), [&](const ApiAlias& a) { return name == a.name; });
        if (alias != apiAliases.end()) {
            if (contains(available, alias->api))
                return alias->api;
            return std::nullopt;
        }
        if (!name.empty() && name != "default")
            Logger::global()->logWarning("Unknown MIDI API '%s'; using the platform default", apiName.c_str());

        if (sandboxed && contains(available, libremidi::API::PIPEWIRE_UMP))
            return libremidi::API::PIPEWIRE_UMP;
        for (auto api : defaultOrder)
            if (contains(available, api))
                return api;
        return available.front();
    }

    std::optional<libremidi::API> resolveLibreMidiUmpApi(const std::string& apiName) {
        return chooseUmpApi(apiName, libremidi::available_ump_apis(), isSandboxed());
    }

    std::string portDisplayName(const libremidi::port_information& port) {
        return port.display_name.empty() ? port.port_name : port.display_name;
    }

    std::optional<libremidi::input_port> findInputPort(libremidi::API api, const std::string& needle) {
        libremidi::observer observer{{}, libremidi::observer_configuration_for(api)};
        return firstMatching(observer.get_input_ports(), needle);
    }

    std::optional<libremidi::output_port> findOutputPort(libremidi::API api, const std::string& needle) {
        libremidi::observer observer{{}, libremidi::observer_configuration_for(api)};
        return firstMatching(observer.get_output_ports(), needle);
    }

}
