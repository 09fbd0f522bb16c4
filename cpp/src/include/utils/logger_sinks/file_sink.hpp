#pragma once

#include <filesystem>
#include <string>

#include "pll_platform.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace plushlink::utils
{

/**
 * @class FileSink
 * @brief Appends formatted messages to a file. Opening failures throw std::system_error
 *        from the constructor, so a bad path is reported before the sink is swapped in.
 */
class FileSink : public Sink
{
  public:
    FileSink(const std::string &path, bool use_flock);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    bool m_use_flock = false;
#if defined(PLUSHLINK_PLATFORM_WIN64)
    void *m_file_handle = nullptr;
#else
    int m_fd = -1;
#endif
};

} // namespace plushlink::utils
