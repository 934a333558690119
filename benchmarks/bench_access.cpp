// benchmarks/bench_access.cpp - hot-path cost of instance-local reads

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <spdlog/cfg/env.h>

#include "lazycell/lazycell.hpp"

using SteadyClock = std::chrono::steady_clock;

constexpr int MAX_CELLS = 64;
static lazycell::Local<std::uint64_t> CELLS[MAX_CELLS];

static std::uint64_t parse_u64(const char* s, std::uint64_t def) {
    if (!s) return def;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    return (end && *end == '\0') ? static_cast<std::uint64_t>(v) : def;
}

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    // Args: [iterations_per_thread] [num_threads] [num_cells]
    const std::uint64_t ITERATIONS = parse_u64(argc > 1 ? argv[1] : nullptr, 1'000'000ULL);
    const int           NUM_THREADS = static_cast<int>(parse_u64(argc > 2 ? argv[2] : nullptr, 4));
    const int           NUM_CELLS   = static_cast<int>(
        std::clamp<std::uint64_t>(parse_u64(argc > 3 ? argv[3] : nullptr, 16), 1, MAX_CELLS));

    std::cout << "Benchmark config:\n"
              << "  iterations/thread = " << ITERATIONS << "\n"
              << "  threads           = " << NUM_THREADS << "\n"
              << "  cells             = " << NUM_CELLS << "\n";

    std::atomic<bool> go{false};
    std::atomic<std::uint64_t> checksum{0};
    std::atomic<std::uint64_t> init_ns{0};

    std::vector<std::thread> threads;
    threads.reserve(NUM_THREADS);
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&, t] {
            auto inst = std::make_unique<lazycell::Instance>();
            while (!go.load(std::memory_order_acquire)) {}

            // cold path: first touch of every cell on this instance
            auto c0 = SteadyClock::now();
            for (int c = 0; c < NUM_CELLS; ++c) {
                CELLS[c].get_or_init_with(*inst, [&] { return static_cast<std::uint64_t>(t * MAX_CELLS + c); });
            }
            auto c1 = SteadyClock::now();
            init_ns.fetch_add(static_cast<std::uint64_t>(
                std::chrono::duration_cast<std::chrono::nanoseconds>(c1 - c0).count()), std::memory_order_relaxed);

            // hot path: mix of plain reads and already-initialized get_or_init_with
            std::uint64_t local = 0;
            for (std::uint64_t i = 0; i < ITERATIONS; ++i) {
                const int c = static_cast<int>(i % static_cast<std::uint64_t>(NUM_CELLS));
                if (i & 1u) {
                    local += *CELLS[c].get(*inst);
                } else {
                    local += CELLS[c].get_or_init_with(*inst, [] { return std::uint64_t{0}; });
                }
            }
            checksum.fetch_add(local, std::memory_order_relaxed);
        });
    }

    auto t0 = SteadyClock::now();
    go.store(true, std::memory_order_release);
    for (auto& th : threads) th.join();
    auto t1 = SteadyClock::now();

    const double secs = std::chrono::duration<double>(t1 - t0).count();
    const double ops  = static_cast<double>(ITERATIONS) * static_cast<double>(NUM_THREADS);
    const double ops_per_s = (secs > 0.0) ? (ops / secs) : 0.0;
    const double init_per_cell = (NUM_THREADS > 0)
        ? static_cast<double>(init_ns.load()) / (NUM_THREADS * NUM_CELLS) : 0.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Results:\n"
              << "  elapsed (s):        " << secs << "\n"
              << "  total reads:        " << ops << "\n"
              << "  throughput:         " << (ops_per_s / 1e6) << " Mops/s\n"
              << "  first-touch (ns):   " << init_per_cell << " per cell\n"
              << "  checksum:           " << checksum.load() << "\n";
    return 0;
}
