#pragma once

#include "utils/logger_sinks/sink.hpp"
#include <filesystem>
#include <string>

namespace relayhub::utils
{

/**
 * @brief Append-only log file.
 *
 * When @p shared is set every line is written under an exclusive flock(2), so several
 * relayhub processes may log to the same file without tearing lines.
 */
class FileSink : public Sink
{
  public:
    /// @throws std::runtime_error if the file cannot be opened or created.
    FileSink(const std::string &path, bool shared);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override { return "File: " + m_path.string(); }

  private:
    std::filesystem::path m_path;
    bool m_shared = false;
#ifdef RELAYHUB_PLATFORM_WIN64
    void *m_handle = nullptr;
#else
    int m_fd = -1;
#endif
};

} // namespace relayhub::utils
