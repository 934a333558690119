#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>

#include "log.hpp"

namespace lazycell {

// Process-wide key of a declared Local<T>. Shared by every instance, never reused.
using SlotId = std::size_t;

// Memory order helpers for readability
constexpr auto RELAXED = std::memory_order_relaxed;
constexpr auto ACQ_REL = std::memory_order_acq_rel;

namespace detail {
inline std::atomic<SlotId> slot_counter{0};
inline std::atomic<std::uint64_t> instance_counter{1};
} // namespace detail

// Fresh identity on every call. No bound check: wraparound of a size_t counter is not a concern.
inline SlotId next_slot_id() {
    const SlotId id = detail::slot_counter.fetch_add(1, ACQ_REL);
    logger()->debug("allocated slot id {}", id);
    return id;
}

inline std::uint64_t next_instance_id() noexcept {
    return detail::instance_counter.fetch_add(1, RELAXED);
}

} // namespace lazycell
