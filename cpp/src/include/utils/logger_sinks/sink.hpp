#pragma once

#include "rlh_base.hpp"

namespace relayhub::utils
{

/// One formatted log event, as handed from the logger worker to the active sink.
struct LogMessage
{
    std::chrono::system_clock::time_point timestamp;
    uint64_t process_id;
    uint64_t thread_id;
    int level; // mirrors Logger::Level; sinks do not include logger.hpp
    fmt::memory_buffer body;
};

/// Destination for log lines. Only the logger worker thread calls into a sink.
class Sink
{
  public:
    virtual ~Sink() = default;

    /// @throws std::system_error when the line could not be written completely.
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

/// Short upper-case tag for a level value ("INFO", "WARN", ...).
const char *level_tag(int level) noexcept;

/// "[LOGGER] [LEVEL ] [time] [PID:n TID:n] body\n"
std::string format_log_line(const LogMessage &msg);

/// Writes to stderr. The default sink.
class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override { return "Console"; }
};

} // namespace relayhub::utils
