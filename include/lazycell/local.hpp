#pragma once
#include <mutex>
#include <type_traits>
#include <utility>

#include "instance.hpp"
#include "slot.hpp"
#include "utils.hpp"

namespace lazycell {

// A static declaration of instance-local data:
//
//     static lazycell::Local<std::uint32_t> THREAD_ID;
//     const auto& tid = THREAD_ID.get_or_init_with(inst, [] { return current_worker_id(); });
//
// Construction is constexpr and allocates nothing; the slot id is drawn on first use.
// Returned references live as long as the Instance they were read from.
template <class T>
class Local {
    static_assert(std::is_object_v<T>, "Local<T> requires an object type");
    static_assert(!std::is_const_v<T> && !std::is_volatile_v<T>, "Local<T> requires an unqualified type");
    static_assert(!std::is_array_v<T>, "wrap arrays in std::array");

public:
    constexpr Local() noexcept = default;

    Local(const Local&) = delete;
    Local& operator=(const Local&) = delete;

    SlotId id() const {
        std::call_once(once_, [this] { id_ = next_slot_id(); });
        return id_;
    }

    // nullptr if this instance has no value yet (or is still computing it).
    const T* get(Instance& inst) const {
        const SlotId slot = id();
        const ErasedValue* erased = inst.store().lookup(slot);
        return erased ? &recover<T>(*erased, slot) : nullptr;
    }

    const T& get_or_init(Instance& inst, T value) const {
        const SlotId slot = id();
        const ErasedValue& erased = inst.store().get_or_init(
            slot, box_with<T>([&]() -> T { return std::move(value); }));
        return recover<T>(erased, slot);
    }

    // `f()` runs at most once per instance, and only if the slot is empty.
    template <class F>
    const T& get_or_init_with(Instance& inst, F&& f) const {
        const SlotId slot = id();
        const ErasedValue& erased = inst.store().get_or_init_with(
            slot, [&] { return box_with<T>(std::forward<F>(f)); });
        return recover<T>(erased, slot);
    }

    // `f(inst)` may fail by throwing: nothing is stored, the exception reaches the
    // caller unchanged and a later call may retry. Initializing this same Local on
    // the same instance from inside `f` aborts the process.
    template <class F>
    const T& get_or_try_init(Instance& inst, F&& f) const {
        const SlotId slot = id();
        const ErasedValue& erased = inst.store().get_or_try_init(
            slot, [&] { return box_with<T>([&]() -> decltype(auto) { return std::forward<F>(f)(inst); }); });
        return recover<T>(erased, slot);
    }

    const T& get_or_init_default(Instance& inst) const {
        static_assert(std::is_default_constructible_v<T>, "get_or_init_default requires a default-constructible T");
        return get_or_init_with(inst, [] { return T{}; });
    }

private:
    mutable std::once_flag once_;
    mutable SlotId id_ = 0;
};

} // namespace lazycell
