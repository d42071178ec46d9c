#include "LibreMidiSoundEngine.hpp"
#include "../../Devices/LibreMidiSupport.hpp"

#include <chrono>
#include <format>

namespace loopy {

    LibreMidiSoundEngine::LibreMidiSoundEngine(MidiOutputOptions options)
        : options_(std::move(options)),
          queue_(options_.queue_capacity) {
        auto api = detail::resolveLibreMidiUmpApi(options_.api_name);
        if (!api)
            throw BackendUnavailable("No MIDI 2.0 (UMP) backend is available on this system");
        api_ = *api;

        midi_out_ = openPort();
        available_.store(true, std::memory_order_release);

        sender_ = std::thread([this] { runSender(); });
    }

    LibreMidiSoundEngine::~LibreMidiSoundEngine() {
        running_.store(false, std::memory_order_release);
        if (sender_.joinable())
            sender_.join();
        std::lock_guard<std::mutex> lock(port_mutex_);
        midi_out_.reset();
    }

    std::unique_ptr<libremidi::midi_out> LibreMidiSoundEngine::openPort() {
        libremidi::output_configuration outConfig{};
        outConfig.on_error = [this](std::string_view errorText, const libremidi::source_location&) {
            onBackendError(errorText);
        };

        std::unique_ptr<libremidi::midi_out> out;
        try {
            out = std::make_unique<libremidi::midi_out>(outConfig, api_);
            if (options_.connect_to.empty()) {
                out->open_virtual_port(options_.port_name);
            } else {
                auto port = detail::findOutputPort(api_, options_.connect_to);
                if (!port)
                    throw BackendUnavailable(std::format("No MIDI output port matches '{}'", options_.connect_to));
                out->open_port(*port, options_.port_name);
            }
        } catch (const BackendUnavailable&) {
            throw;
        } catch (const std::exception& e) {
            throw BackendUnavailable(std::string("Failed to create libremidi MIDI output: ") + e.what());
        }
        if (!out->is_port_open())
            throw BackendUnavailable(std::format("Failed to open MIDI output port '{}'",
                                                 options_.connect_to.empty() ? options_.port_name : options_.connect_to));

        Logger::global()->logInfo("MIDI output opened (%s)",
                                  options_.connect_to.empty() ? ("virtual port " + options_.port_name).c_str() : options_.connect_to.c_str());
        return out;
    }

    void LibreMidiSoundEngine::onBackendError(std::string_view text) {
        if (available_.exchange(false, std::memory_order_acq_rel))
            Logger::global()->logError("MIDI output failed: %.*s", static_cast<int>(text.size()), text.data());
    }

    SoundEngineStatus LibreMidiSoundEngine::enqueue(const MidiMessage& message) {
        if (!available())
            return SoundEngineStatus::BACKEND_UNAVAILABLE;
        if (pending_.fetch_add(1, std::memory_order_acq_rel) >= options_.queue_capacity) {
            pending_.fetch_sub(1, std::memory_order_acq_rel);
            return SoundEngineStatus::QUEUE_FULL;
        }
        if (!queue_.enqueue(message.toUmp())) {
            pending_.fetch_sub(1, std::memory_order_acq_rel);
            return SoundEngineStatus::QUEUE_FULL;
        }
        return SoundEngineStatus::OK;
    }

    SoundEngineStatus LibreMidiSoundEngine::noteOn(uint8_t channel, uint8_t note, uint8_t velocity) {
        if (channel >= MIDI_CHANNEL_COUNT || note > MIDI_DATA_MAX || velocity > MIDI_DATA_MAX)
            return SoundEngineStatus::INVALID_ARGUMENT;
        return enqueue(MidiMessage::noteOn(channel, note, velocity));
    }

    SoundEngineStatus LibreMidiSoundEngine::noteOff(uint8_t channel, uint8_t note) {
        if (channel >= MIDI_CHANNEL_COUNT || note > MIDI_DATA_MAX)
            return SoundEngineStatus::INVALID_ARGUMENT;
        return enqueue(MidiMessage::noteOff(channel, note));
    }

    SoundEngineStatus LibreMidiSoundEngine::programChange(uint8_t channel, uint8_t program) {
        if (channel >= MIDI_CHANNEL_COUNT || program > MIDI_DATA_MAX)
            return SoundEngineStatus::INVALID_ARGUMENT;
        return enqueue(MidiMessage::programChange(channel, program));
    }

    SoundEngineStatus LibreMidiSoundEngine::send(const MidiMessage& message) {
        // channel voice messages only; system messages have no place on an instrument channel.
        if (message.status < 0x80 || message.status >= 0xF0 || message.data1 > MIDI_DATA_MAX || message.data2 > MIDI_DATA_MAX)
            return SoundEngineStatus::INVALID_ARGUMENT;
        return enqueue(message);
    }

    bool LibreMidiSoundEngine::reconnect() {
        if (available())
            return true;
        std::lock_guard<std::mutex> lock(port_mutex_);
        try {
            midi_out_.reset();
            midi_out_ = openPort();
        } catch (const BackendUnavailable& e) {
            Logger::global()->logWarning("MIDI output is still unavailable: %s", e.what());
            return false;
        }
        // whatever was queued while the port was down was dropped by the sender.
        available_.store(true, std::memory_order_release);
        Logger::global()->logInfo("MIDI output reconnected");
        return true;
    }

    void LibreMidiSoundEngine::runSender() {
        setCurrentThreadNameIfPossible("loopy-midi-out");
        loopy_ump_t ump;
        while (true) {
            if (!queue_.wait_dequeue_timed(ump, std::chrono::milliseconds(100))) {
                if (!running_.load(std::memory_order_acquire))
                    break;
                continue;
            }
            pending_.fetch_sub(1, std::memory_order_acq_rel);

            std::lock_guard<std::mutex> lock(port_mutex_);
            if (!midi_out_ || !available()) {
                if (dropped_.fetch_add(1, std::memory_order_relaxed) == 0)
                    Logger::global()->logWarning("MIDI output is unavailable; dropping queued events");
                continue;
            }
            try {
                midi_out_->send_ump(&ump, 1);
            } catch (const std::exception& e) {
                onBackendError(e.what());
            }
        }
        if (auto dropped = dropped_.load(); dropped > 0)
            Logger::global()->logWarning("%llu queued MIDI event(s) were dropped", static_cast<unsigned long long>(dropped));
    }

    std::unique_ptr<SoundEngine> createLibreMidiSoundEngine(const MidiOutputOptions& options) {
        return std::make_unique<LibreMidiSoundEngine>(options);
    }

    std::vector<std::string> listMidiOutputPorts(const std::string& apiName) {
        auto api = detail::resolveLibreMidiUmpApi(apiName);
        if (!api)
            throw BackendUnavailable("No MIDI 2.0 (UMP) backend is available on this system");
        std::vector<std::string> ret;
        try {
            libremidi::observer observer{{}, libremidi::observer_configuration_for(*api)};
            for (const auto& port : observer.get_output_ports())
                ret.push_back(detail::portDisplayName(port));
        } catch (const std::exception& e) {
            throw BackendUnavailable(std::string("Failed to enumerate MIDI output ports: ") + e.what());
        }
        return ret;
    }

}
