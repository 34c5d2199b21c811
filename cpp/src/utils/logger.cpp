/*******************************************************************************
 * @file logger.cpp
 * @brief Logger worker, command queue and lifecycle hooks.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "rlh_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"
#include "utils/logger_sinks/syslog_sink.hpp"

namespace relayhub::utils
{

namespace
{

enum class Phase
{
    NotStarted,
    Running,
    Stopping,
    Stopped
};

std::atomic<Phase> g_phase{Phase::NotStarted};

bool is_running() noexcept
{
    return g_phase.load(std::memory_order_acquire) == Phase::Running;
}

// Configuring the logger before its module started is a programming error.
bool require_started(const char *caller)
{
    const Phase phase = g_phase.load(std::memory_order_acquire);
    if (phase == Phase::NotStarted)
    {
        RLH_PANIC("{} called before the Logger lifecycle module was started", caller);
    }
    return phase == Phase::Running;
}

LogMessage stamp(Logger::Level lvl, fmt::memory_buffer &&body)
{
    LogMessage msg;
    msg.timestamp = std::chrono::system_clock::now();
    msg.process_id = platform::get_pid();
    msg.thread_id = platform::get_native_thread_id();
    msg.level = static_cast<int>(lvl);
    msg.body = std::move(body);
    return msg;
}

/// Delivers error reports to the user callback on a thread of its own.
class ErrorReporter
{
  public:
    ErrorReporter() : m_thread([this] { loop(); }) {}
    ~ErrorReporter() { stop(); }

    ErrorReporter(const ErrorReporter &) = delete;
    ErrorReporter &operator=(const ErrorReporter &) = delete;

    void post(std::function<void()> job)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping)
                return;
            m_jobs.push_back(std::move(job));
        }
        m_cv.notify_one();
    }

    void stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_cv.notify_one();
        if (m_thread.joinable())
            m_thread.join();
    }

  private:
    void loop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        for (;;)
        {
            m_cv.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
            if (m_jobs.empty())
                return;
            auto job = std::move(m_jobs.front());
            m_jobs.pop_front();
            lock.unlock();
            try
            {
                job();
            }
            catch (const std::exception &e)
            {
                fmt::print(stderr, "[LOGGER] error callback threw: {}\n", e.what());
            }
            lock.lock();
        }
    }

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::function<void()>> m_jobs;
    bool m_stopping = false;
    std::thread m_thread; // last: started once the members above exist
};

// A null sink carries the reason it could not be created.
struct SwapSink
{
    std::unique_ptr<Sink> sink;
    std::string failure;
    std::promise<bool> done;
};

struct Barrier
{
    std::promise<bool> done;
};

struct InstallCallback
{
    std::function<void(const std::string &)> callback;
    std::promise<bool> done;
};

using Command = std::variant<LogMessage, SwapSink, Barrier, InstallCallback>;

// Answers false to whoever waits on a command that was refused or failed half-way.
void refuse(Command &cmd)
{
    std::visit(
        [](auto &c)
        {
            if constexpr (!std::is_same_v<std::decay_t<decltype(c)>, LogMessage>)
            {
                try
                {
                    c.done.set_value(false);
                }
                catch (const std::future_error &)
                {
                    // already answered
                }
            }
        },
        cmd);
}

} // namespace

struct Logger::Impl
{
    void start();
    void stop();
    bool submit(Command &&cmd);
    bool submit_and_wait(Command &&cmd, std::future<bool> result);
    bool replace_sink(const std::function<std::unique_ptr<Sink>()> &factory, const char *kind);

    void run();
    void execute(Command &cmd);
    void emit(Logger::Level lvl, fmt::memory_buffer &&body);
    void report(std::string what);

    // Worker-owned.
    std::unique_ptr<Sink> m_sink = std::make_unique<ConsoleSink>();
    std::function<void(const std::string &)> m_on_error;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<Command> m_pending;
    size_t m_max_queue = 10000;
    bool m_stop_requested = false;
    size_t m_dropped = 0;
    std::chrono::steady_clock::time_point m_first_drop;

    std::atomic<Logger::Level> m_level{Logger::Level::L_INFO};
    std::atomic<size_t> m_dropped_since_switch{0};
    std::atomic<bool> m_stopped{false};

    ErrorReporter m_reporter;
    std::thread m_worker;

    ~Impl()
    {
        // Only when the shutdown hook never ran, e.g. a worker calling exit().
        if (m_worker.joinable())
            m_worker.detach();
    }
};

void Logger::Impl::start()
{
    if (!m_worker.joinable())
        m_worker = std::thread([this] { run(); });
}

bool Logger::Impl::submit(Command &&cmd)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const bool is_log = std::holds_alternative<LogMessage>(cmd);
        // Log lines are capped at max_queue; control commands get twice the room.
        const size_t limit = is_log ? m_max_queue : 2 * m_max_queue;
        if (m_stop_requested || m_pending.size() >= limit)
        {
            if (!m_stop_requested)
            {
                if (m_dropped++ == 0)
                    m_first_drop = std::chrono::steady_clock::now();
                m_dropped_since_switch.fetch_add(1, std::memory_order_relaxed);
            }
            refuse(cmd);
            return false;
        }
        m_pending.push_back(std::move(cmd));
    }
    m_cv.notify_one();
    return true;
}

bool Logger::Impl::submit_and_wait(Command &&cmd, std::future<bool> result)
{
    submit(std::move(cmd));
    return result.get();
}

bool Logger::Impl::replace_sink(const std::function<std::unique_ptr<Sink>()> &factory,
                                const char *kind)
{
    SwapSink swap;
    try
    {
        swap.sink = factory();
    }
    catch (const std::exception &e)
    {
        swap.failure = fmt::format("Failed to create {}: {}", kind, e.what());
    }
    auto result = swap.done.get_future();
    return submit_and_wait(std::move(swap), std::move(result));
}

void Logger::Impl::emit(Logger::Level lvl, fmt::memory_buffer &&body)
{
    if (m_sink)
        m_sink->write(stamp(lvl, std::move(body)));
}

void Logger::Impl::report(std::string what)
{
    if (!m_on_error)
    {
        RLH_DEBUG("Logger error (no callback installed): {}", what);
        return;
    }
    m_reporter.post([cb = m_on_error, what = std::move(what)] { cb(what); });
}

void Logger::Impl::execute(Command &cmd)
{
    if (auto *msg = std::get_if<LogMessage>(&cmd))
    {
        if (m_sink && msg->level >= static_cast<int>(m_level.load(std::memory_order_relaxed)))
            m_sink->write(*msg);
    }
    else if (auto *swap = std::get_if<SwapSink>(&cmd))
    {
        if (!swap->sink)
        {
            report(std::move(swap->failure));
            swap->done.set_value(false);
            return;
        }
        const std::string from = m_sink ? m_sink->description() : "none";
        if (m_sink)
        {
            emit(Logger::Level::L_SYSTEM,
                 format_tools::make_buffer("Switching log sink to: {}", swap->sink->description()));
            m_sink->flush();
        }
        m_sink = std::move(swap->sink);
        m_dropped_since_switch.store(0, std::memory_order_relaxed);
        emit(Logger::Level::L_SYSTEM, format_tools::make_buffer("Log sink switched from: {}", from));
        swap->done.set_value(true);
    }
    else if (auto *barrier = std::get_if<Barrier>(&cmd))
    {
        if (m_sink)
            m_sink->flush();
        barrier->done.set_value(true);
    }
    else if (auto *install = std::get_if<InstallCallback>(&cmd))
    {
        m_on_error = std::move(install->callback);
        install->done.set_value(true);
    }
}

void Logger::Impl::run()
{
    std::vector<Command> batch;
    for (;;)
    {
        size_t dropped = 0;
        double drop_window_s = 0.0;
        bool last_batch = false;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stop_requested || !m_pending.empty(); });
            batch.swap(m_pending);
            last_batch = m_stop_requested;
            if (m_dropped > 0)
            {
                dropped = std::exchange(m_dropped, 0);
                drop_window_s =
                    std::chrono::duration<double>(std::chrono::steady_clock::now() - m_first_drop)
                        .count();
            }
        }

        for (auto &cmd : batch)
        {
            try
            {
                execute(cmd);
            }
            catch (const std::exception &e)
            {
                report(fmt::format("Logger worker error: {}", e.what()));
                refuse(cmd);
            }
        }
        batch.clear();

        try
        {
            if (dropped > 0)
            {
                emit(Logger::Level::L_WARNING,
                     format_tools::make_buffer("Logger dropped {} messages over {:.2f}s due to a "
                                               "full queue.",
                                               dropped, drop_window_s));
            }
            if (last_batch)
            {
                emit(Logger::Level::L_SYSTEM, format_tools::make_buffer("Logger is shutting down."));
                if (m_sink)
                    m_sink->flush();
            }
        }
        catch (const std::exception &e)
        {
            report(fmt::format("Logger worker error: {}", e.what()));
        }

        // The stop flag rejects new commands, so the batch taken with it set is the last.
        if (last_batch)
            return;
    }
}

void Logger::Impl::stop()
{
    if (m_stopped.exchange(true))
        return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = true;
    }
    m_cv.notify_one();
    if (m_worker.joinable())
        m_worker.join();
    m_reporter.stop();
}

// ----------------------------------------------------------------------------
// Logger
// ----------------------------------------------------------------------------

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_phase.load(std::memory_order_acquire) != Phase::NotStarted;
}

std::optional<Logger::Level> Logger::level_from_string(std::string_view name) noexcept
{
    struct Entry
    {
        std::string_view name;
        Level level;
    };
    static constexpr Entry kNames[] = {
        {"trace", Level::L_TRACE}, {"debug", Level::L_DEBUG},   {"info", Level::L_INFO},
        {"warn", Level::L_WARNING}, {"warning", Level::L_WARNING}, {"error", Level::L_ERROR},
        {"system", Level::L_SYSTEM},
    };
    const auto same = [name](std::string_view candidate)
    {
        return std::equal(name.begin(), name.end(), candidate.begin(), candidate.end(),
                          [](char a, char b)
                          {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     static_cast<unsigned char>(b);
                          });
    };
    for (const auto &entry : kNames)
    {
        if (same(entry.name))
            return entry.level;
    }
    return std::nullopt;
}

bool Logger::set_console()
{
    if (!require_started("Logger::set_console"))
        return false;
    return pImpl->replace_sink([] { return std::make_unique<ConsoleSink>(); }, "ConsoleSink");
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!require_started("Logger::set_logfile"))
        return false;
    return pImpl->replace_sink([&] { return std::make_unique<FileSink>(utf8_path, use_flock); },
                               "FileSink");
}

bool Logger::set_syslog(const char *ident, int option, int facility)
{
    if (!require_started("Logger::set_syslog"))
        return false;
#if defined(RELAYHUB_IS_POSIX)
    return pImpl->replace_sink(
        [&] { return std::make_unique<SyslogSink>(ident, option, facility); }, "SyslogSink");
#else
    (void)ident;
    (void)option;
    (void)facility;
    return false;
#endif
}

void Logger::flush()
{
    if (!require_started("Logger::flush"))
        return;
    Barrier barrier;
    auto result = barrier.done.get_future();
    (void)pImpl->submit_and_wait(std::move(barrier), std::move(result));
}

void Logger::shutdown()
{
    if (lifecycle_initialized())
        pImpl->stop();
}

void Logger::set_level(Level lvl)
{
    if (require_started("Logger::set_level"))
        pImpl->m_level.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    require_started("Logger::level");
    return pImpl->m_level.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    if (!require_started("Logger::set_max_queue_size"))
        return;
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    pImpl->m_max_queue = std::max<size_t>(max_size, 1);
}

size_t Logger::get_max_queue_size() const
{
    require_started("Logger::get_max_queue_size");
    std::lock_guard<std::mutex> lock(pImpl->m_mutex);
    return pImpl->m_max_queue;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    require_started("Logger::get_total_dropped_since_sink_switch");
    return pImpl->m_dropped_since_switch.load(std::memory_order_relaxed);
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (!require_started("Logger::set_write_error_callback"))
        return;
    InstallCallback install{std::move(cb), {}};
    auto result = install.done.get_future();
    (void)pImpl->submit_and_wait(std::move(install), std::move(result));
}

bool Logger::should_log(Level lvl) const noexcept
{
    return is_running() &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->m_level.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (!is_running())
        return false;
    try
    {
        return pImpl->submit(stamp(lvl, std::move(body)));
    }
    catch (const std::exception &)
    {
        return false;
    }
}

// ----------------------------------------------------------------------------
// Lifecycle hooks
// ----------------------------------------------------------------------------

void do_logger_startup(const char * /*arg*/)
{
    Logger::instance().pImpl->start();
    g_phase.store(Phase::Running, std::memory_order_release);
}

namespace
{
void do_logger_shutdown(const char * /*arg*/)
{
    Phase expected = Phase::Running;
    if (g_phase.compare_exchange_strong(expected, Phase::Stopping, std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();
        g_phase.store(Phase::Stopped, std::memory_order_release);
    }
}
} // namespace

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("relayhub::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace relayhub::utils
