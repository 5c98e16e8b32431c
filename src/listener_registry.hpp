#pragma once
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace fanout {

// Opaque listener handle: slot index in the low 32 bits, slot generation in
// the high 32 bits. A slot gets a new generation each time it is freed, so a
// token never matches a later occupant of the same slot. A slot that runs out
// of generations is left empty for good.
using ListenerToken = uint64_t;

// Arena of listener slots with O(1) insert and remove.
// Not synchronized; the owning channel guards it with its mutex.
// Generation is the per-slot reuse counter, at most 32 bits wide.
template<typename Handler, typename Generation = uint32_t>
class ListenerRegistry {
    static_assert(std::numeric_limits<Generation>::is_integer &&
                  !std::numeric_limits<Generation>::is_signed &&
                  sizeof(Generation) <= sizeof(uint32_t),
                  "Generation must be an unsigned integer of at most 32 bits");

public:
    ListenerToken insert(std::shared_ptr<Handler> handler) {
        uint32_t index;
        if (!free_.empty()) {
            index = free_.back();
            free_.pop_back();
        } else {
            index = static_cast<uint32_t>(slots_.size());
            slots_.push_back(Slot{});
        }
        Slot& slot = slots_[index];
        slot.handler = std::move(handler);
        ++count_;
        return make_token(index, slot.generation);
    }

    // Returns false if the token is stale or was never issued.
    bool remove(ListenerToken token) {
        uint32_t index = token_index(token);
        if (index >= slots_.size()) return false;
        Slot& slot = slots_[index];
        if (!slot.handler || slot.generation != token_generation(token)) {
            return false;
        }
        slot.handler.reset();
        retire(index);
        --count_;
        return true;
    }

    bool contains(ListenerToken token) const {
        uint32_t index = token_index(token);
        return index < slots_.size() && slots_[index].handler &&
               slots_[index].generation == token_generation(token);
    }

    // Handlers are shared, so a snapshot stays valid (and keeps any state
    // the handler carries) after the listener is removed.
    std::vector<std::shared_ptr<Handler>> snapshot() const {
        std::vector<std::shared_ptr<Handler>> out;
        out.reserve(count_);
        for (const auto& slot : slots_) {
            if (slot.handler) out.push_back(slot.handler);
        }
        return out;
    }

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }

    void clear() {
        for (uint32_t i = 0; i < slots_.size(); ++i) {
            if (slots_[i].handler) {
                slots_[i].handler.reset();
                retire(i);
            }
        }
        count_ = 0;
    }

private:
    struct Slot {
        Generation generation = 0;
        std::shared_ptr<Handler> handler;
    };

    // Bump the generation of a freed slot. A slot whose generation is
    // exhausted is never handed out again, so its old tokens cannot alias.
    void retire(uint32_t index) {
        Slot& slot = slots_[index];
        if (slot.generation == std::numeric_limits<Generation>::max()) return;
        ++slot.generation;
        free_.push_back(index);
    }

    static ListenerToken make_token(uint32_t index, Generation generation) {
        return (static_cast<uint64_t>(generation) << 32) | index;
    }
    static uint32_t token_index(ListenerToken token) {
        return static_cast<uint32_t>(token & 0xFFFFFFFFu);
    }
    static uint64_t token_generation(ListenerToken token) {
        return token >> 32;
    }

    std::vector<Slot> slots_;
    std::vector<uint32_t> free_;
    size_t count_ = 0;
};

} // namespace fanout
