#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "log.hpp"
#include "slot.hpp"
#include "utils.hpp"

namespace lazycell {

// Type-erased per-instance table, indexed by SlotId.
// One mutex guards the table; producers always run with it released.
class InstanceStore {
public:
    explicit InstanceStore(std::uint64_t instance_id) : instance_id_(instance_id) {}

    ~InstanceStore() {
        std::size_t populated = 0;
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (*it && (*it)->state == SlotState::Ready) {
                (*it)->value.reset();
                ++populated;
            }
        }
        logger()->trace("instance {} released {} populated slot(s)", instance_id_, populated);
    }

    InstanceStore(const InstanceStore&) = delete;
    InstanceStore& operator=(const InstanceStore&) = delete;

    // Present only once Ready; a slot under initialization reads as absent.
    const ErasedValue* lookup(SlotId id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (id >= entries_.size() || !entries_[id]) return nullptr;
        const SlotEntry& e = *entries_[id];
        return e.state == SlotState::Ready ? e.value.get() : nullptr;
    }

    // Stores `value` only if absent; returns whichever value is resident.
    const ErasedValue& get_or_init(SlotId id, std::unique_ptr<ErasedValue> value) {
        return get_or_try_init(id, [&] { return std::move(value); });
    }

    template <class F>
    const ErasedValue& get_or_init_with(SlotId id, F&& make) {
        return get_or_try_init(id, std::forward<F>(make));
    }

    // `make` returns std::unique_ptr<ErasedValue> and may throw. On throw the entry
    // returns to Empty, waiters are woken and the exception propagates.
    template <class F>
    const ErasedValue& get_or_try_init(SlotId id, F&& make) {
        std::unique_lock<std::mutex> lock(mutex_);
        SlotEntry& e = entry(id);
        const std::thread::id self = std::this_thread::get_id();

        for (;;) {
            if (e.state == SlotState::Ready) return *e.value;
            if (e.state == SlotState::Empty) break;
            if (e.owner == self) {
                fatal("slot {} re-entered its own initialization on instance {}", id, instance_id_);
            }
            ready_.wait(lock);
        }

        e.state = SlotState::Initializing;
        e.owner = self;
        Attempt attempt(*this, e, id);
        lock.unlock();

        std::unique_ptr<ErasedValue> value = std::forward<F>(make)();

        lock.lock();
        attempt.commit(std::move(value));
        return *e.value;
    }

private:
    // Rolls an unfinished attempt back to Empty. Destructor runs with mutex_ released.
    class Attempt {
    public:
        Attempt(InstanceStore& store, SlotEntry& e, SlotId id) : store_(store), e_(e), id_(id) {}
        Attempt(const Attempt&) = delete;
        Attempt& operator=(const Attempt&) = delete;

        // Caller holds mutex_.
        void commit(std::unique_ptr<ErasedValue> value) {
            e_.value = std::move(value);
            e_.state = SlotState::Ready;
            e_.owner = std::thread::id{};
            done_ = true;
            store_.ready_.notify_all();
        }

        ~Attempt() {
            if (done_) return;
            {
                std::lock_guard<std::mutex> lock(store_.mutex_);
                e_.state = SlotState::Empty;
                e_.owner = std::thread::id{};
            }
            store_.ready_.notify_all();
            logger()->debug("initializer for slot {} failed on instance {}; slot left empty",
                            id_, store_.instance_id_);
        }

    private:
        InstanceStore& store_;
        SlotEntry& e_;
        SlotId id_;
        bool done_ = false;
    };

    // Caller holds mutex_. Entries are heap nodes so growing the table never moves them.
    SlotEntry& entry(SlotId id) {
        if (id >= entries_.size()) entries_.resize(id + 1);
        auto& slot = entries_[id];
        if (!slot) slot = std::make_unique<SlotEntry>();
        return *slot;
    }

private:
    const std::uint64_t instance_id_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::vector<std::unique_ptr<SlotEntry>> entries_;
};

} // namespace lazycell
