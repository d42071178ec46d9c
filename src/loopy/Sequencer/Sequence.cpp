#include "loopy/loopy.hpp"

#include <algorithm>
#include <format>

namespace loopy {

    namespace {
        void validateIndex(size_t index) {
            if (index >= Sequence::kMaxLength)
                throw InvalidArgument(std::format("step index {} exceeds the maximum sequence length {}", index, Sequence::kMaxLength));
        }

        void validateStep(const Step& step) {
            if (step.note > MIDI_DATA_MAX)
                throw InvalidArgument(std::format("note {} is out of range (0-127)", static_cast<int>(step.note)));
            if (step.velocity > MIDI_DATA_MAX)
                throw InvalidArgument(std::format("velocity {} is out of range (0-127)", static_cast<int>(step.velocity)));
            if (step.duration.count() < 0)
                throw InvalidArgument("step duration must not be negative");
        }

        Step& growTo(Sequence::Storage& steps, size_t index) {
            if (index >= steps.size())
                steps.resize(index + 1);
            return steps[index];
        }
    }

    Sequence::Sequence(size_t length) {
        if (length > kMaxLength)
            throw InvalidArgument(std::format("sequence length {} exceeds the maximum {}", length, kMaxLength));
        steps_ = std::make_shared<const Storage>(length);
    }

    template <typename Edit>
    void Sequence::modify(Edit&& edit) {
        std::lock_guard<std::mutex> lock(edit_mutex_);
        auto next = std::make_shared<Storage>(*load());
        edit(*next);
        std::atomic_store_explicit(&steps_, std::shared_ptr<const Storage>(std::move(next)), std::memory_order_release);
    }

    Step Sequence::stepAt(size_t index) const {
        auto steps = load();
        if (index >= steps->size())
            throw IndexError(std::format("step index {} is out of range (length {})", index, steps->size()));
        return (*steps)[index];
    }

    std::optional<Step> Sequence::advance() {
        auto steps = load();
        const auto length = steps->size();
        if (length == 0)
            return std::nullopt;
        auto current = position_.load(std::memory_order_relaxed);
        if (current >= length)
            current = 0;
        auto step = (*steps)[current];
        position_.store((current + 1) % length, std::memory_order_release);
        return step;
    }

    void Sequence::setStep(size_t index, const Step& step) {
        validateIndex(index);
        validateStep(step);
        modify([&](Storage& steps) { growTo(steps, index) = step; });
    }

    void Sequence::setNote(size_t index, uint8_t note, uint8_t velocity) {
        validateIndex(index);
        validateStep(Step{note, velocity});
        modify([&](Storage& steps) {
            auto& step = growTo(steps, index);
            step.note = note;
            step.velocity = velocity;
            step.enabled = true;
        });
    }

    void Sequence::setEnabled(size_t index, bool enabled) {
        validateIndex(index);
        modify([&](Storage& steps) { growTo(steps, index).enabled = enabled; });
    }

    bool Sequence::toggle(size_t index) {
        validateIndex(index);
        bool result{false};
        modify([&](Storage& steps) {
            auto& step = growTo(steps, index);
            step.enabled = !step.enabled;
            result = step.enabled;
        });
        return result;
    }

    void Sequence::clearStep(size_t index) {
        validateIndex(index);
        modify([&](Storage& steps) { growTo(steps, index) = Step{}; });
    }

    void Sequence::clear() {
        modify([](Storage& steps) { std::fill(steps.begin(), steps.end(), Step{}); });
    }

    void Sequence::resize(size_t length) {
        if (length > kMaxLength)
            throw InvalidArgument(std::format("sequence length {} exceeds the maximum {}", length, kMaxLength));
        modify([&](Storage& steps) { steps.resize(length); });
    }

}
