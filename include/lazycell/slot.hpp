#pragma once
#include <memory>
#include <thread>
#include <typeinfo>
#include <utility>

#include "log.hpp"
#include "utils.hpp"

namespace lazycell {

// Invariant (per-instance slot entry):
//  For the entry of slot id S inside one instance:
//    - Empty        -> Initializing   when a caller claims the attempt (owner = that thread)
//    - Initializing -> Ready          when the producer returns; value is set once
//    - Initializing -> Empty          when the producer throws; nothing is stored
//    - Ready is terminal until the instance is destroyed
//
// The boxed value is heap allocated and never replaced, so references into it
// stay valid for the rest of the instance's lifetime.

class ErasedValue {
public:
    virtual ~ErasedValue() = default;
    virtual const std::type_info& type() const noexcept = 0;
};

template <class T>
class Boxed final : public ErasedValue {
public:
    // Builds the value straight from the producer's result (no intermediate move).
    template <class F>
    explicit Boxed(std::in_place_t, F&& make) : value_(std::forward<F>(make)()) {}

    const std::type_info& type() const noexcept override { return typeid(T); }
    const T& value() const noexcept { return value_; }

private:
    T value_;
};

template <class T, class F>
std::unique_ptr<ErasedValue> box_with(F&& make) {
    return std::make_unique<Boxed<T>>(std::in_place, std::forward<F>(make));
}

// Identities are never shared between differently typed cells, so a mismatch here means
// the allocator handed out a duplicate id.
template <class T>
const T& recover(const ErasedValue& erased, SlotId id) {
    if (erased.type() != typeid(T)) {
        fatal("slot {} holds {} but was read as {}", id, erased.type().name(), typeid(T).name());
    }
    return static_cast<const Boxed<T>&>(erased).value();
}

enum class SlotState { Empty, Initializing, Ready };

struct SlotEntry {
    SlotState state = SlotState::Empty;
    std::thread::id owner{};               // valid while Initializing
    std::unique_ptr<ErasedValue> value;    // set once, on Ready
};

} // namespace lazycell
