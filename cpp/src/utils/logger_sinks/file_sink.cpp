#include "rlh_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#ifndef RELAYHUB_PLATFORM_WIN64
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace relayhub::utils
{

namespace
{
#ifndef RELAYHUB_PLATFORM_WIN64
// Holds flock(LOCK_EX) for one write when the file is shared between processes.
class ScopedFlock
{
  public:
    ScopedFlock(int fd, bool enabled) : m_fd(enabled ? fd : -1)
    {
        if (m_fd != -1)
            ::flock(m_fd, LOCK_EX);
    }
    ~ScopedFlock()
    {
        if (m_fd != -1)
            ::flock(m_fd, LOCK_UN);
    }
    ScopedFlock(const ScopedFlock &) = delete;
    ScopedFlock &operator=(const ScopedFlock &) = delete;

  private:
    int m_fd;
};
#endif
} // namespace

FileSink::FileSink(const std::string &path, bool shared) : m_path(path), m_shared(shared)
{
#ifdef RELAYHUB_PLATFORM_WIN64
    m_handle = CreateFileA(m_path.string().c_str(), FILE_APPEND_DATA,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (m_handle == INVALID_HANDLE_VALUE)
    {
        m_handle = nullptr;
        throw std::runtime_error(fmt::format("cannot open log file '{}' (error {})", path,
                                             static_cast<unsigned long>(GetLastError())));
    }
#else
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        throw std::runtime_error(
            fmt::format("cannot open log file '{}': {}", path,
                        std::error_code(errno, std::generic_category()).message()));
    }
#endif
}

FileSink::~FileSink()
{
#ifdef RELAYHUB_PLATFORM_WIN64
    if (m_handle != nullptr)
        CloseHandle(m_handle);
#else
    if (m_fd != -1)
        ::close(m_fd);
#endif
}

void FileSink::write(const LogMessage &msg)
{
    const std::string line = format_log_line(msg);
#ifdef RELAYHUB_PLATFORM_WIN64
    DWORD written = 0;
    const BOOL ok = WriteFile(m_handle, line.data(), static_cast<DWORD>(line.size()), &written,
                              nullptr);
    if (!ok || written != line.size())
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "short write to log file");
    }
#else
    ssize_t written = 0;
    int err = 0;
    {
        ScopedFlock lock(m_fd, m_shared);
        written = ::write(m_fd, line.data(), line.size());
        err = errno;
    }
    if (written < 0 || static_cast<size_t>(written) != line.size())
        throw std::system_error(err, std::generic_category(), "short write to log file");
#endif
}

void FileSink::flush()
{
#ifdef RELAYHUB_PLATFORM_WIN64
    FlushFileBuffers(m_handle);
#else
    ::fsync(m_fd);
#endif
}

} // namespace relayhub::utils
