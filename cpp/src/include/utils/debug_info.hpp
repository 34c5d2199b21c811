/**
 * @file debug_info.hpp
 * @brief Last-resort diagnostics: stack traces, RLH_PANIC and RLH_DEBUG.
 *
 * These write straight to stderr and never go through the Logger, so they also work
 * before the Logger module has started and after it has shut down.
 */
#pragma once

#include <cstdio>
#include <cstdlib>
#include <fmt/format.h>
#include <source_location>
#include <string>
#include "utils/format_tools.hpp"

namespace relayhub::debug
{

/// "file.cpp:42:function-signature"
inline std::string location_string(const std::source_location &loc)
{
    return fmt::format("{}:{}:{}", format_tools::filename_only(loc.file_name()), loc.line(),
                       loc.function_name());
}

/**
 * @brief Writes the calling thread's stack to stderr (backtrace + dladdr on POSIX).
 * @warning Allocates; not for use in signal handlers.
 */
RELAYHUB_UTILS_EXPORT void print_stack_trace() noexcept;

/// Prints "[PANIC] <where> -- <message>" and a stack trace, then aborts.
template <typename... Args>
[[noreturn]] void panic(const std::source_location &loc, fmt::format_string<Args...> fmt_str,
                        Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[PANIC] {} -- {}\n", location_string(loc),
                   fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[PANIC] (message lost: %s)\n", e.what());
    }
    std::fflush(stderr);
    print_stack_trace();
    std::abort();
}

template <typename... Args>
void debug_msg(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    try
    {
        fmt::print(stderr, "[DBG]  {}\n", fmt::format(fmt_str, std::forward<Args>(args)...));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "[DBG]  (message lost: %s)\n", e.what());
    }
}

} // namespace relayhub::debug

#define RLH_PANIC(fmt, ...)                                                                        \
    ::relayhub::debug::panic(std::source_location::current(),                                     \
                             FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

// Compiled out unless the build defines RELAYHUB_ENABLE_DEBUG_MESSAGES.
#if defined(RELAYHUB_ENABLE_DEBUG_MESSAGES)
#define RLH_DEBUG(fmt, ...) ::relayhub::debug::debug_msg(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#else
#define RLH_DEBUG(fmt, ...)                                                                        \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
