#pragma once

#include "utils/logger_sinks/sink.hpp"

namespace plushlink::utils
{

class SyslogSink : public Sink
{
  public:
    SyslogSink(const char *ident, int option, int facility);
    ~SyslogSink() override;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    static int level_to_syslog_priority(int level);
    std::string m_ident; // openlog keeps the pointer
};

} // namespace plushlink::utils
