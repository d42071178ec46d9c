#include "loopy/loopy.hpp"

#include <algorithm>
#include <format>

namespace loopy {

    InstrumentEntry InstrumentRegistry::registerInstrument(const std::string& id, std::optional<uint8_t> channel, uint8_t program) {
        if (id.empty())
            throw InvalidArgument("instrument id must not be empty");
        if (channel.has_value() && *channel >= MIDI_CHANNEL_COUNT)
            throw InvalidArgument(std::format("MIDI channel {} is out of range (0-15)", static_cast<int>(*channel)));
        if (program > MIDI_DATA_MAX)
            throw InvalidArgument(std::format("program {} is out of range (0-127)", static_cast<int>(program)));

        std::lock_guard<std::mutex> lock(mutex_);

        if (auto existing = entries_.find(id); existing != entries_.end()) {
            const auto& entry = existing->second;
            if ((channel.has_value() && *channel != entry.channel) || program != entry.program)
                throw InvalidArgument(std::format("instrument '{}' is already registered on channel {} with program {}",
                                                  id, static_cast<int>(entry.channel), static_cast<int>(entry.program)));
            Logger::global()->logDiagnostic("Instrument '%s' already registered", id.c_str());
            return entry;
        }

        uint8_t assigned;
        if (channel.has_value()) {
            if (occupied_[*channel]) {
                auto owner = std::find_if(entries_.begin(), entries_.end(), [&](const auto& e) { return e.second.channel == *channel; });
                throw DuplicateChannel(std::format("MIDI channel {} is already used by instrument '{}'",
                                                   static_cast<int>(*channel), owner != entries_.end() ? owner->first : ""));
            }
            assigned = *channel;
        } else {
            auto free = std::find(occupied_.begin(), occupied_.end(), false);
            if (free == occupied_.end())
                throw ChannelsExhausted(std::format("no MIDI channel is left for instrument '{}'", id));
            assigned = static_cast<uint8_t>(free - occupied_.begin());
        }

        InstrumentEntry entry{id, assigned, program};
        entries_.emplace(id, entry);
        occupied_[assigned] = true;
        Logger::global()->logDiagnostic("Registered instrument '%s' on channel %d (program %d)", id.c_str(), assigned, program);
        return entry;
    }

    InstrumentEntry InstrumentRegistry::registerPreset(const std::string& id, const std::string& presetName, std::optional<uint8_t> channel) {
        auto program = presetProgram(presetName);
        if (!program)
            throw InvalidArgument(std::format("unknown preset '{}'", presetName));
        return registerInstrument(id, channel, *program);
    }

    bool InstrumentRegistry::unregisterInstrument(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return false;
        occupied_[it->second.channel] = false;
        entries_.erase(it);
        return true;
    }

    std::optional<InstrumentEntry> InstrumentRegistry::find(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end())
            return std::nullopt;
        return it->second;
    }

    InstrumentEntry InstrumentRegistry::get(const std::string& id) const {
        auto entry = find(id);
        if (!entry)
            throw InvalidArgument(std::format("instrument '{}' is not registered", id));
        return *entry;
    }

    std::optional<InstrumentEntry> InstrumentRegistry::findByChannel(uint8_t channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : entries_)
            if (entry.channel == channel)
                return entry;
        return std::nullopt;
    }

    std::vector<InstrumentEntry> InstrumentRegistry::entries() const {
        std::vector<InstrumentEntry> ret;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& [id, entry] : entries_)
                ret.push_back(entry);
        }
        std::sort(ret.begin(), ret.end(), [](const auto& a, const auto& b) { return a.channel < b.channel; });
        return ret;
    }

    size_t InstrumentRegistry::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t InstrumentRegistry::freeChannelCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(occupied_.begin(), occupied_.end(), false));
    }

    void InstrumentRegistry::presets(std::map<std::string, uint8_t> table) {
        for (auto& [name, program] : table)
            if (program > MIDI_DATA_MAX)
                throw InvalidArgument(std::format("preset '{}' has out-of-range program {}", name, static_cast<int>(program)));
        std::lock_guard<std::mutex> lock(mutex_);
        presets_ = std::move(table);
    }

    std::optional<uint8_t> InstrumentRegistry::presetProgram(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = presets_.find(name);
        if (it == presets_.end())
            return std::nullopt;
        return it->second;
    }

    std::map<std::string, uint8_t> InstrumentRegistry::presets() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return presets_;
    }

}
