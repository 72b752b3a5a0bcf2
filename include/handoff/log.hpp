#pragma once

#include <atomic>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace handoff {

enum class log_level { debug, info, warn, error, off };

using log_sink = std::function<void(log_level, std::string_view)>;

constexpr auto to_string(log_level l) noexcept -> std::string_view
{
    switch (l) {
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warn:
        return "warn";
    case log_level::error:
        return "error";
    case log_level::off:
        break;
    }
    return "off";
}

namespace __detail::logging {

    inline auto threshold() -> std::atomic<log_level>&
    {
        static std::atomic<log_level> lvl{log_level::warn};
        return lvl;
    }

    /// guards `sink()` and serialises every write through it
    inline auto mutex() -> std::mutex&
    {
        static std::mutex m;
        return m;
    }

    inline void write_stderr(log_level l, std::string_view msg)
    {
        std::cerr << "[handoff " << to_string(l) << "] " << msg << std::endl;
    }

    inline auto sink() -> log_sink&
    {
        static log_sink s{write_stderr};
        return s;
    }

} // namespace __detail::logging

/// replace where log records go, an empty sink restores stderr
inline void set_log_sink(log_sink s)
{
    std::lock_guard l{__detail::logging::mutex()};
    if (s) {
        __detail::logging::sink() = std::move(s);
    }
    else {
        __detail::logging::sink() = __detail::logging::write_stderr;
    }
}

inline void set_log_level(log_level l)
{
    __detail::logging::threshold().store(l, std::memory_order_relaxed);
}

inline auto get_log_level() -> log_level
{
    return __detail::logging::threshold().load(std::memory_order_relaxed);
}

inline auto should_log(log_level l) -> bool
{
    return l != log_level::off && l >= get_log_level();
}

inline void log(log_level l, std::string_view msg)
{
    if (!should_log(l)) {
        return;
    }
    std::lock_guard lk{__detail::logging::mutex()};
    __detail::logging::sink()(l, msg);
}

} // namespace handoff
