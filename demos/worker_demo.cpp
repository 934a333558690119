#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/cfg/env.h>

#include "lazycell/lazycell.hpp"

// Per-instance worker id, computed once by whichever call touches it first.
static lazycell::Local<std::uint32_t> WORKER_ID;
// Per-instance scratch log; each worker sees only its own.
static lazycell::Local<std::vector<std::string>> JOURNAL;

static std::uint64_t parse_u64(const char* s, std::uint64_t def) {
    if (!s) return def;
    char* end = nullptr;
    unsigned long long v = std::strtoull(s, &end, 10);
    return (end && *end == '\0') ? static_cast<std::uint64_t>(v) : def;
}

static std::uint32_t worker_id(lazycell::Instance& inst) {
    static std::atomic<std::uint32_t> next{0};
    return WORKER_ID.get_or_try_init(inst, [](lazycell::Instance&) {
        return next.fetch_add(1);
    });
}

int main(int argc, char** argv) {
    spdlog::cfg::load_env_levels();

    const int WORKERS = static_cast<int>(parse_u64(argc > 1 ? argv[1] : nullptr, 4));
    const int CALLS   = static_cast<int>(parse_u64(argc > 2 ? argv[2] : nullptr, 3));
    if (CALLS == 0) std::cout << "no calls requested; workers will find their slots empty\n";

    std::mutex out_mu;
    std::vector<std::thread> workers;
    for (int w = 0; w < WORKERS; ++w) {
        workers.emplace_back([&] {
            lazycell::Instance inst;
            for (int c = 0; c < CALLS; ++c) {
                const std::uint32_t id = worker_id(inst);
                // Stored on the first call; later rounds read it back untouched.
                JOURNAL.get_or_init_with(inst, [&] {
                    std::ostringstream os;
                    os << "worker " << id << " on instance " << inst.id();
                    return std::vector<std::string>{os.str()};
                });
            }
            const auto* journal = JOURNAL.get(inst);
            const std::uint32_t* id = WORKER_ID.get(inst);
            std::lock_guard<std::mutex> lock(out_mu);
            if (!journal || !id) {
                std::cout << "instance " << inst.id() << " never initialized its slots\n";
                return;
            }
            std::cout << journal->front() << " (thread-stable id " << *id << ")\n";
        });
    }
    for (auto& th : workers) th.join();

    std::cout << "slots in use: WORKER_ID=" << WORKER_ID.id()
              << " JOURNAL=" << JOURNAL.id() << "\n";
    std::cout << "Worker demo done\n";
    return 0;
}
