#include "rlh_base.hpp"
#include "utils/logger_sinks/syslog_sink.hpp"

#if defined(RELAYHUB_IS_POSIX)
#include <array>
#include <syslog.h>

namespace relayhub::utils
{

namespace
{
int syslog_priority(int level) noexcept
{
    static constexpr std::array<int, 6> kPriority{LOG_DEBUG,   LOG_DEBUG, LOG_INFO,
                                                  LOG_WARNING, LOG_ERR,   LOG_CRIT};
    if (level < 0 || static_cast<size_t>(level) >= kPriority.size())
        return LOG_INFO;
    return kPriority[static_cast<size_t>(level)];
}
} // namespace

SyslogSink::SyslogSink(const char *ident, int option, int facility)
    : m_ident(ident != nullptr ? ident : "")
{
    ::openlog(m_ident.empty() ? nullptr : m_ident.c_str(), option, facility);
}

SyslogSink::~SyslogSink()
{
    ::closelog();
}

void SyslogSink::write(const LogMessage &msg)
{
    ::syslog(syslog_priority(msg.level), "%.*s", static_cast<int>(msg.body.size()),
             msg.body.data());
}

} // namespace relayhub::utils
#endif
