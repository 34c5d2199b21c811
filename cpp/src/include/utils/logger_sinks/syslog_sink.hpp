#pragma once

#include "utils/logger_sinks/sink.hpp"

#if defined(RELAYHUB_IS_POSIX)
namespace relayhub::utils
{

/// Forwards the message body to syslog(3). Timestamp and pid come from syslog itself.
class SyslogSink : public Sink
{
  public:
    SyslogSink(const char *ident, int option, int facility);
    ~SyslogSink() override;

    void write(const LogMessage &msg) override;
    void flush() override {}
    std::string description() const override { return "Syslog"; }

  private:
    std::string m_ident; // openlog() keeps this pointer
};

} // namespace relayhub::utils
#endif
