#include <cerrno>
#include <stdexcept>
#include <system_error>

#include "pll_platform.hpp"

#if defined(PLUSHLINK_IS_POSIX)
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

#include "utils/logger_sinks/file_sink.hpp"

namespace plushlink::utils
{

FileSink::FileSink(const std::string &path, bool use_flock) : m_path(path), m_use_flock(use_flock)
{
    if (m_path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec)
        {
            throw std::system_error(ec, "cannot create log directory");
        }
    }
#if defined(PLUSHLINK_PLATFORM_WIN64)
    (void)m_use_flock;
    m_file_handle = CreateFileW(m_path.wstring().c_str(), FILE_APPEND_DATA,
                                FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                                OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (m_file_handle == INVALID_HANDLE_VALUE)
    {
        m_file_handle = nullptr;
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "CreateFileW failed for log file");
    }
#else
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (m_fd == -1)
    {
        throw std::system_error(errno, std::generic_category(), "open failed for log file");
    }
#endif
}

FileSink::~FileSink()
{
#if defined(PLUSHLINK_PLATFORM_WIN64)
    if (m_file_handle != nullptr)
    {
        CloseHandle(m_file_handle);
    }
#else
    if (m_fd != -1)
    {
        ::close(m_fd);
    }
#endif
}

void FileSink::write(const LogMessage &msg)
{
    const std::string content = format_logmsg(msg);
#if defined(PLUSHLINK_PLATFORM_WIN64)
    DWORD bytes_written = 0;
    if (!WriteFile(m_file_handle, content.data(), static_cast<DWORD>(content.size()),
                   &bytes_written, nullptr) ||
        bytes_written != content.size())
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "Failed to write complete log message to file");
    }
#else
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_EX);
    }
    const ssize_t bytes_written = ::write(m_fd, content.data(), content.size());
    const int saved_errno = errno;
    if (m_use_flock)
    {
        ::flock(m_fd, LOCK_UN);
    }
    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != content.size())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
#endif
}

void FileSink::flush()
{
#if defined(PLUSHLINK_PLATFORM_WIN64)
    FlushFileBuffers(m_file_handle);
#else
    ::fsync(m_fd);
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace plushlink::utils
