#include "pll_platform.hpp"

#if defined(PLUSHLINK_IS_POSIX)
#include <syslog.h>

#include "utils/logger_sinks/syslog_sink.hpp"

namespace plushlink::utils
{

SyslogSink::SyslogSink(const char *ident, int option, int facility) : m_ident(ident ? ident : "")
{
    openlog(m_ident.empty() ? nullptr : m_ident.c_str(), option, facility);
}

SyslogSink::~SyslogSink()
{
    closelog();
}

void SyslogSink::write(const LogMessage &msg)
{
    syslog(level_to_syslog_priority(msg.level), "%.*s", static_cast<int>(msg.body.size()),
           msg.body.data());
}

void SyslogSink::flush()
{
    // No-op for syslog
}

std::string SyslogSink::description() const
{
    return "Syslog";
}

int SyslogSink::level_to_syslog_priority(int level)
{
    switch (level)
    {
    case 0: // TRACE
    case 1: // DEBUG
        return LOG_DEBUG;
    case 2: // INFO
        return LOG_INFO;
    case 3: // WARNING
        return LOG_WARNING;
    case 4: // ERROR
        return LOG_ERR;
    case 5: // SYSTEM
        return LOG_CRIT;
    default:
        return LOG_INFO;
    }
}

} // namespace plushlink::utils
#endif
