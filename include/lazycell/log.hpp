#pragma once
#include <cstdlib>
#include <memory>
#include <mutex>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#ifndef LAZYCELL_LOGGER_NAME
  #define LAZYCELL_LOGGER_NAME "lazycell"
#endif

namespace lazycell {

// Library logger. Reuses an already registered "lazycell" logger so the host can install its own sinks.
inline std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LAZYCELL_LOGGER_NAME)) return existing;
        try {
            return spdlog::stderr_color_mt(LAZYCELL_LOGGER_NAME);
        } catch (const spdlog::spdlog_ex&) {
            // lost a registration race with another thread
            return spdlog::get(LAZYCELL_LOGGER_NAME);
        }
    }();
    return instance;
}

// Broken invariant: log, flush, abort. Never throws so a producer cannot catch it.
template <class... Args>
[[noreturn]] void fatal(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    auto log = logger();
    log->critical(fmt, std::forward<Args>(args)...);
    log->flush();
    std::abort();
}

} // namespace lazycell
