/*******************************************************************************
 * @file logger.hpp
 * @brief Process-wide asynchronous logger.
 *
 * Callers format on their own thread and hand the finished line to a queue; a single
 * worker thread owns the active sink and does every write, flush and sink switch.
 * The default sink is stderr. `set_logfile()` and `set_syslog()` replace it.
 *
 * When more than `max_queue_size` lines are waiting, new lines are dropped and the
 * worker writes one "Logger dropped N messages" warning after it catches up.
 *
 * The Logger is a lifecycle module: the `LOGGER_*` macros do nothing until the module
 * returned by `GetLifecycleModule()` has started, and configuring it earlier panics.
 *
 * @code
 * LOGGER_INFO("Channel {}: process {} joined as {}", channel_id, os_id, id);
 * relayhub::utils::Logger::instance().set_logfile("/var/log/relayhub.log");
 * @endcode
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "relayhub_utils_export.h"
#include "utils/module_def.hpp"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace relayhub::utils
{

class RELAYHUB_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    /// Lifecycle module named "relayhub::utils::Logger". No dependencies.
    static ModuleDef GetLifecycleModule();

    /// True once the Logger module has been started (it may since have shut down).
    static bool lifecycle_initialized() noexcept;

    /// Case-insensitive: trace, debug, info, warn or warning, error, system.
    static std::optional<Level> level_from_string(std::string_view name) noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;
    ~Logger();

    /// The switching calls below block until the worker has installed the new sink.
    bool set_console();

    /// Appends to @p utf8_path. With @p use_flock several processes may share the file.
    /// Returns false and keeps the current sink if the file cannot be opened.
    bool set_logfile(const std::string &utf8_path, bool use_flock = true);

    /// Returns false on platforms without syslog.
    bool set_syslog(const char *ident = nullptr, int option = 0, int facility = 0);

    /// Returns once everything queued before the call is written and the sink flushed.
    void flush();

    /// Writes what is queued, then joins the worker. Run by the module's shutdown hook.
    void shutdown();

    void set_level(Level lvl);
    Level level() const;

    void set_max_queue_size(size_t max_size);
    size_t get_max_queue_size() const;
    size_t get_total_dropped_since_sink_switch() const;

    /// Receives sink creation and write failures, on a thread other than the worker.
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    bool should_log(Level lvl) const noexcept;

  private:
    Logger();

    template <typename Format, typename... Args>
    void format_and_enqueue(Level lvl, Format &&fmt_str, Args &&...args) noexcept;
    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    friend void do_logger_startup(const char *);
};

// Levels below this are compiled out of log_fmt(). 0 keeps everything.
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0
#endif

// A format failure is logged in place of the message instead of escaping the call site.
template <typename Format, typename... Args>
void Logger::format_and_enqueue(Level lvl, Format &&fmt_str, Args &&...args) noexcept
{
    fmt::memory_buffer body;
    try
    {
        fmt::format_to(std::back_inserter(body), std::forward<Format>(fmt_str),
                       std::forward<Args>(args)...);
    }
    catch (const std::exception &ex)
    {
        body.clear();
        fmt::format_to(std::back_inserter(body), "[FORMAT ERROR] {}", ex.what());
    }
    enqueue_log(lvl, std::move(body));
}

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (should_log(lvl))
            format_and_enqueue(lvl, fmt_str, std::forward<Args>(args)...);
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (should_log(lvl))
        format_and_enqueue(lvl, fmt::runtime(fmt_str), std::forward<Args>(args)...);
}

} // namespace relayhub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define RLH_LOGGER_AT(lvl, fmt, ...)                                                               \
    ::relayhub::utils::Logger::instance().log_fmt<::relayhub::utils::Logger::Level::lvl>(         \
        FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define RLH_LOGGER_AT_RT(lvl, fmt, ...)                                                            \
    ::relayhub::utils::Logger::instance().log_fmt_runtime(::relayhub::utils::Logger::Level::lvl,  \
                                                          fmt __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_TRACE(fmt, ...) RLH_LOGGER_AT(L_TRACE, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...) RLH_LOGGER_AT(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...) RLH_LOGGER_AT(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...) RLH_LOGGER_AT(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...) RLH_LOGGER_AT(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...) RLH_LOGGER_AT(L_SYSTEM, fmt __VA_OPT__(, ) __VA_ARGS__)

// Runtime format strings: not checked at compile time.
#define LOGGER_DEBUG_RT(fmt, ...) RLH_LOGGER_AT_RT(L_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO_RT(fmt, ...) RLH_LOGGER_AT_RT(L_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN_RT(fmt, ...) RLH_LOGGER_AT_RT(L_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR_RT(fmt, ...) RLH_LOGGER_AT_RT(L_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
