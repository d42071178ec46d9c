#include "LibreMidiInputDevice.hpp"
#include "../LibreMidiSupport.hpp"

#include <format>

namespace loopy {

    LibreMidiInputDevice::LibreMidiInputDevice(const MidiInputOptions& options, std::shared_ptr<LiveEventReceiver> receiver)
        : receiver_(std::move(receiver)) {
        auto api = detail::resolveLibreMidiUmpApi(options.api_name);
        if (!api)
            throw BackendUnavailable("No MIDI 2.0 (UMP) backend is available on this system");

        libremidi::ump_input_configuration inConfig{};
        inConfig.on_message = [this](libremidi::ump&& message) {
            inputCallback(std::move(message));
        };
        inConfig.on_error = [](std::string_view errorText, const libremidi::source_location&) {
            Logger::global()->logError("MIDI input failed: %.*s", static_cast<int>(errorText.size()), errorText.data());
        };

        try {
            midi_in_ = std::make_unique<libremidi::midi_in>(inConfig, *api);
            if (options.connect_to.empty()) {
                port_name_ = options.port_name;
                midi_in_->open_virtual_port(port_name_);
            } else {
                auto port = detail::findInputPort(*api, options.connect_to);
                if (!port)
                    throw BackendUnavailable(std::format("No MIDI input port matches '{}'", options.connect_to));
                port_name_ = detail::portDisplayName(*port);
                midi_in_->open_port(*port, options.port_name);
            }
        } catch (const BackendUnavailable&) {
            throw;
        } catch (const std::exception& e) {
            throw BackendUnavailable(std::string("Failed to create libremidi MIDI input: ") + e.what());
        }
        if (!midi_in_->is_port_open())
            throw BackendUnavailable(std::format("Failed to open MIDI input port '{}'", port_name_));
        Logger::global()->logInfo("MIDI input opened (%s)", port_name_.c_str());
    }

    LibreMidiInputDevice::~LibreMidiInputDevice() {
        // close first so that no callback runs against a half-destroyed device.
        midi_in_.reset();
    }

    void LibreMidiInputDevice::receiver(std::shared_ptr<LiveEventReceiver> receiver) {
        std::atomic_store_explicit(&receiver_, std::move(receiver), std::memory_order_release);
    }

    void LibreMidiInputDevice::inputCallback(libremidi::ump&& message) {
        auto decoded = MidiMessage::fromUmp(message.data, sizeof(message.data));
        if (!decoded)
            return;
        received_.fetch_add(1, std::memory_order_relaxed);
        if (auto target = std::atomic_load_explicit(&receiver_, std::memory_order_acquire))
            target->onLiveEvent(*decoded);
    }

    std::unique_ptr<MidiInputDevice> createLibreMidiInputDevice(const MidiInputOptions& options,
                                                                std::shared_ptr<LiveEventReceiver> receiver) {
        return std::make_unique<LibreMidiInputDevice>(options, std::move(receiver));
    }

    std::vector<std::string> listMidiInputPorts(const std::string& apiName) {
        auto api = detail::resolveLibreMidiUmpApi(apiName);
        if (!api)
            throw BackendUnavailable("No MIDI 2.0 (UMP) backend is available on this system");
        std::vector<std::string> ret;
        try {
            libremidi::observer observer{{}, libremidi::observer_configuration_for(*api)};
            for (const auto& port : observer.get_input_ports())
                ret.push_back(detail::portDisplayName(port));
        } catch (const std::exception& e) {
            throw BackendUnavailable(std::string("Failed to enumerate MIDI input ports: ") + e.what());
        }
        return ret;
    }

}
