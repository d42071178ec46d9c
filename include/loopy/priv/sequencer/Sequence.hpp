#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "Step.hpp"

namespace loopy {

    // A repeating, fixed-length pattern of Steps.
    //
    // The step storage is an immutable vector published through an atomic shared_ptr.
    // Editing methods copy, modify and swap the storage, so `advance()` on the playback
    // thread always works on one consistent snapshot: it sees each Step either before or
    // after an edit, and never observes a length change halfway.
    //
    // The play position is written only by `advance()` and `rewind()`.
    class Sequence {
    public:
        typedef std::vector<Step> Storage;

    private:
        std::shared_ptr<const Storage> steps_;
        std::atomic<size_t> position_{0};
        std::mutex edit_mutex_;

        std::shared_ptr<const Storage> load() const {
            return std::atomic_load_explicit(&steps_, std::memory_order_acquire);
        }
        template <typename Edit>
        void modify(Edit&& edit);

    public:
        explicit Sequence(size_t length = 16);
        Sequence(const Sequence&) = delete;
        Sequence& operator=(const Sequence&) = delete;

        size_t length() const { return load()->size(); }
        // The index that the next `advance()` plays.
        size_t position() const { return position_.load(std::memory_order_acquire); }

        // Throws IndexError when index >= length().
        Step stepAt(size_t index) const;
        // Consistent copy of all steps, for display.
        Storage steps() const { return *load(); }

        // Returns the Step at the play head and moves the head forward (wrapping at the
        // end), or nullopt when the sequence is empty. If the sequence was shrunk below
        // the head since the last call, the head wraps to 0 first.
        // Playback thread only.
        std::optional<Step> advance();
        void rewind() { position_.store(0, std::memory_order_release); }

        // Edits beyond the current length grow the sequence with empty steps, up to kMaxLength.
        // note and velocity must be 0-127 (InvalidArgument).
        void setStep(size_t index, const Step& step);
        void setNote(size_t index, uint8_t note, uint8_t velocity);
        void setEnabled(size_t index, bool enabled);
        // Returns the new enabled state.
        bool toggle(size_t index);
        void clearStep(size_t index);
        void clear();
        void resize(size_t length);

        static constexpr size_t kMaxLength = 1024;
    };

}
