#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace loopy {

    struct InstrumentEntry {
        std::string id{};
        uint8_t channel{0};
        uint8_t program{0};

        bool operator==(const InstrumentEntry& other) const = default;
    };

    // Maps instrument ids to (MIDI channel, program). No two active entries share a
    // MIDI channel. Pure data: sending the program change is up to the caller.
    //
    // The preset table (name -> program) comes from whatever loads the soundfont; the
    // registry only consumes it.
    class InstrumentRegistry {
        mutable std::mutex mutex_;
        std::map<std::string, InstrumentEntry> entries_;
        std::array<bool, 16> occupied_{};
        std::map<std::string, uint8_t> presets_;

    public:
        InstrumentRegistry() = default;
        InstrumentRegistry(const InstrumentRegistry&) = delete;
        InstrumentRegistry& operator=(const InstrumentRegistry&) = delete;

        // Registers `id` on `channel`, or on the lowest free channel when not specified.
        // Registering an existing id with the same channel request returns the existing
        // entry unchanged.
        // Throws DuplicateChannel, ChannelsExhausted, or InvalidArgument (channel > 15,
        // program > 127, empty id, or an existing id with a conflicting request).
        InstrumentEntry registerInstrument(const std::string& id, std::optional<uint8_t> channel, uint8_t program);
        // Resolves the program through the preset table. Throws InvalidArgument for unknown presets.
        InstrumentEntry registerPreset(const std::string& id, const std::string& presetName, std::optional<uint8_t> channel = std::nullopt);
        bool unregisterInstrument(const std::string& id);

        std::optional<InstrumentEntry> find(const std::string& id) const;
        // Throws InvalidArgument when `id` is not registered.
        InstrumentEntry get(const std::string& id) const;
        std::optional<InstrumentEntry> findByChannel(uint8_t channel) const;
        std::vector<InstrumentEntry> entries() const;
        size_t size() const;
        size_t freeChannelCount() const;

        void presets(std::map<std::string, uint8_t> table);
        std::optional<uint8_t> presetProgram(const std::string& name) const;
        std::map<std::string, uint8_t> presets() const;
    };

}
