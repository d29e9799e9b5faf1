#pragma once

#include "utils/logger_sinks/sink.hpp"

#include <filesystem>
#include <string>

namespace artbus::utils
{

/**
 * @class FileSink
 * @brief Appends formatted log lines to a file opened with O_APPEND.
 *
 * With `use_flock` every write is bracketed by an advisory `flock(LOCK_EX)`, so
 * several daemons sharing one log file do not interleave partial lines.
 */
class ARTBUS_EXPORT FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened for appending.
     */
    FileSink(const std::string &path, bool use_flock);

    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    /** @throws std::system_error if the line could not be written completely. */
    void write(const LogMessage &msg) override;

    void flush() override;

    std::string description() const override;

  private:
    std::filesystem::path m_path;
    int m_fd{-1};
    bool m_use_flock{false};
};

} // namespace artbus::utils
