#include "rlh_base.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <array>
#include <cstdio>

namespace relayhub::utils
{

const char *level_tag(int level) noexcept
{
    static constexpr std::array<const char *, 6> kTags{"TRACE", "DEBUG", "INFO",
                                                       "WARN",  "ERROR", "SYSTEM"};
    if (level < 0 || static_cast<size_t>(level) >= kTags.size())
        return "UNK";
    return kTags[static_cast<size_t>(level)];
}

std::string format_log_line(const LogMessage &msg)
{
    return fmt::format("[LOGGER] [{:<6}] [{}] [PID:{:5} TID:{:5}] {}\n", level_tag(msg.level),
                       format_tools::formatted_time(msg.timestamp), msg.process_id,
                       msg.thread_id, fmt::string_view(msg.body.data(), msg.body.size()));
}

void ConsoleSink::write(const LogMessage &msg)
{
    const std::string line = format_log_line(msg);
    std::fwrite(line.data(), 1, line.size(), stderr);
}

void ConsoleSink::flush()
{
    std::fflush(stderr);
}

} // namespace relayhub::utils
