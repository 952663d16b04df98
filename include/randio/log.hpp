/* Copyright 2017 https://github.com/mandreyel
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this
 * software and associated documentation files (the "Software"), to deal in the Software
 * without restriction, including without limitation the rights to use, copy, modify,
 * merge, publish, distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to the following
 * conditions:
 *
 * The above copyright notice and this permission notice shall be included in all copies
 * or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 * INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A
 * PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
 * HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF
 * CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
 * OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef RANDIO_LOG_HEADER
#define RANDIO_LOG_HEADER

// -----------------------------------------------------------------------------
// log.hpp - Diagnostic logging for randio
// -----------------------------------------------------------------------------
//
// A small, process-wide logger. Messages are assembled from any streamable
// arguments and handed to a sink under a global mutex, so lines from different
// threads never interleave.
//
// The default sink writes "[randio] [LEVEL] message" lines to std::cerr.
// Applications embedding randio can redirect output with set_sink() and pick
// the threshold with set_level(); RANDIO_DEFAULT_LOG_LEVEL (config.hpp) sets
// the initial threshold.
//
// Usage:
//   randio::log::set_level(randio::log::level::debug);
//   randio::log::debug("lease acquired, generation=", generation);
//
// -----------------------------------------------------------------------------

#include "randio/config.hpp"

#include <atomic>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace randio {
namespace log {

enum class level
{
    debug = 0,
    info,
    warn,
    error,
    off
};

/**
 * Receives every message that passes the threshold.
 *
 * Sinks are called with the logger's mutex held and must not log themselves.
 */
using sink_type = std::function<void(level, std::string_view)>;

namespace detail {

struct logger_state
{
    std::mutex mutex;
    std::atomic<int> threshold{RANDIO_DEFAULT_LOG_LEVEL};
    sink_type sink;
};

inline logger_state& logger()
{
    static logger_state state;
    return state;
}

inline const char* label(const level l) noexcept
{
    switch(l)
    {
    case level::debug: return "[DEBUG] ";
    case level::info:  return "[INFO]  ";
    case level::warn:  return "[WARN]  ";
    case level::error: return "[ERROR] ";
    case level::off:   break;
    }
    return "";
}

inline void write(const level l, const std::string& message)
{
    auto& state = logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    if(state.sink)
    {
        state.sink(l, message);
        return;
    }
    std::cerr << "[randio] " << label(l) << message << '\n';
}

template<typename... Args>
std::string format(Args&&... args)
{
    std::ostringstream stream;
    (stream << ... << std::forward<Args>(args));
    return stream.str();
}

} // namespace detail

inline void set_level(const level l) noexcept
{
    detail::logger().threshold.store(static_cast<int>(l), std::memory_order_relaxed);
}

[[nodiscard]] inline level get_level() noexcept
{
    return static_cast<level>(detail::logger().threshold.load(std::memory_order_relaxed));
}

[[nodiscard]] inline bool enabled(const level l) noexcept
{
    return l != level::off
        && static_cast<int>(l) >= detail::logger().threshold.load(std::memory_order_relaxed);
}

/** Replaces the sink. Passing an empty function restores the std::cerr sink. */
inline void set_sink(sink_type sink)
{
    auto& state = detail::logger();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.sink = std::move(sink);
}

template<typename... Args>
void write(const level l, Args&&... args)
{
    if(!enabled(l)) { return; }
    detail::write(l, detail::format(std::forward<Args>(args)...));
}

template<typename... Args>
void debug([[maybe_unused]] Args&&... args)
{
#ifndef RANDIO_DISABLE_DEBUG_LOG
    write(level::debug, std::forward<Args>(args)...);
#endif
}

template<typename... Args>
void info(Args&&... args)
{
    write(level::info, std::forward<Args>(args)...);
}

template<typename... Args>
void warn(Args&&... args)
{
    write(level::warn, std::forward<Args>(args)...);
}

template<typename... Args>
void error(Args&&... args)
{
    write(level::error, std::forward<Args>(args)...);
}

} // namespace log
} // namespace randio

#endif // RANDIO_LOG_HEADER
