#undef NDEBUG
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../include/lazycell/lazycell.hpp"

using lazycell::Instance;
using lazycell::Local;
using lazycell::SlotId;

constexpr int NUM_CELLS = 64;
constexpr int NUM_THREADS = 8;

static Local<int> CELLS[NUM_CELLS];
static Local<std::uint64_t> SHARED;
static Local<int> HANDOFF;
static Local<std::uint64_t> PER_INSTANCE;

// Every thread resolves every cell, in a different order, all released at once.
void concurrent_identity_resolution() {
    std::atomic<bool> go{false};
    std::vector<std::vector<SlotId>> seen(NUM_THREADS, std::vector<SlotId>(NUM_CELLS));

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load(std::memory_order_acquire)) {}
            for (int i = 0; i < NUM_CELLS; ++i) {
                const int c = (t % 2 == 0) ? i : NUM_CELLS - 1 - i;
                seen[t][c] = CELLS[c].id();
            }
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& th : threads) th.join();

    std::set<SlotId> distinct;
    for (int c = 0; c < NUM_CELLS; ++c) {
        for (int t = 1; t < NUM_THREADS; ++t) assert(seen[t][c] == seen[0][c]);
        distinct.insert(seen[0][c]);
    }
    assert(distinct.size() == static_cast<std::size_t>(NUM_CELLS));
    std::cout << "concurrent identity resolution ok (" << distinct.size() << " ids)\n";
}

// Many threads, one instance, one slot: a single producer call and one resident value.
void concurrent_first_access_same_instance() {
    Instance inst;
    std::atomic<bool> go{false};
    std::atomic<int> calls{0};
    std::vector<const std::uint64_t*> results(NUM_THREADS, nullptr);

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load(std::memory_order_acquire)) {}
            const std::uint64_t& v = SHARED.get_or_init_with(inst, [&] {
                calls.fetch_add(1);
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                return static_cast<std::uint64_t>(1000 + t);
            });
            results[t] = &v;
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& th : threads) th.join();

    assert(calls.load() == 1);
    for (int t = 1; t < NUM_THREADS; ++t) assert(results[t] == results[0]);
    assert(*results[0] >= 1000 && *results[0] < 1000 + NUM_THREADS);
    std::cout << "concurrent first access, same instance ok (value=" << *results[0] << ")\n";
}

// The first attempt fails while others wait; one waiter then takes over and wins.
void waiter_takes_over_after_failure() {
    Instance inst;
    std::atomic<bool> go{false};
    std::atomic<int> calls{0};
    std::atomic<int> failures{0};
    std::vector<int> results(NUM_THREADS, -1);

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load(std::memory_order_acquire)) {}
            try {
                results[t] = HANDOFF.get_or_try_init(inst, [&](Instance&) -> int {
                    if (calls.fetch_add(1) == 0) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(20));
                        throw std::runtime_error("first attempt fails");
                    }
                    return 7;
                });
            } catch (const std::runtime_error&) {
                failures.fetch_add(1);
            }
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& th : threads) th.join();

    assert(failures.load() == 1);
    assert(calls.load() == 2);
    const int ok = static_cast<int>(std::count(results.begin(), results.end(), 7));
    assert(ok == NUM_THREADS - 1);
    assert(HANDOFF.get(inst) != nullptr && *HANDOFF.get(inst) == 7);
    std::cout << "waiter takes over after failure ok\n";
}

// One instance per thread: every instance keeps its own value.
void instances_never_share() {
    std::atomic<bool> go{false};
    std::vector<std::unique_ptr<Instance>> instances;
    for (int t = 0; t < NUM_THREADS; ++t) instances.push_back(std::make_unique<Instance>());

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t] {
            while (!go.load(std::memory_order_acquire)) {}
            Instance& inst = *instances[t];
            for (int round = 0; round < 1000; ++round) {
                const std::uint64_t& v = PER_INSTANCE.get_or_init_with(inst, [&] { return inst.id(); });
                assert(v == inst.id());
            }
        });
    }
    go.store(true, std::memory_order_release);
    for (auto& th : threads) th.join();

    for (auto& inst : instances) {
        const std::uint64_t* v = PER_INSTANCE.get(*inst);
        assert(v != nullptr && *v == inst->id());
    }
    std::cout << "instances never share ok\n";
}

int main() {
    concurrent_identity_resolution();
    concurrent_first_access_same_instance();
    waiter_takes_over_after_failure();
    instances_never_share();
    std::cout << "PASS: exactly-once initialization under contention.\n";
    return 0;
}
