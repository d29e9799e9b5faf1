/**
 * @file json_io.cpp
 * @brief atomic_write_file and the JSON read/write helpers built on it.
 */
#include "abus_service.hpp"
#include "utils/json_io.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace artbus::utils
{

namespace
{
constexpr int kRenameAttempts = 5;
constexpr mode_t kPublishedMode = 0644;

/// Records `errnum` in the caller's error_code, logs it, and returns false.
bool fail_errno(std::error_code *err_code, int errnum, std::string_view step,
                const std::string &what)
{
    if (err_code != nullptr)
    {
        *err_code = std::error_code(errnum, std::generic_category());
    }
    LOGGER_ERROR("{} failed for '{}': {}", step, what, std::strerror(errnum));
    return false;
}

fs::path directory_of(const fs::path &target)
{
    return target.has_parent_path() ? target.parent_path() : fs::path(".");
}

bool is_symlink(const fs::path &target)
{
    struct stat st{};
    return ::lstat(target.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
}

/// A `.<name>.tmp.XXXXXX` file next to the target. Unlinked on destruction
/// unless it was renamed into place.
class TempFile
{
  public:
    explicit TempFile(const fs::path &target)
    {
        const std::string pattern =
            (directory_of(target) / ("." + target.filename().string())).string() +
            std::string(kTempFileInfix) + "XXXXXX";
        std::vector<char> name(pattern.begin(), pattern.end());
        name.push_back('\0');
        m_fd = ::mkstemp(name.data());
        m_created = m_fd != -1;
        m_path = m_created ? std::string(name.data()) : pattern;
    }

    ~TempFile()
    {
        if (m_fd != -1)
        {
            ::close(m_fd);
        }
        if (m_created && !m_published)
        {
            ::unlink(m_path.c_str());
        }
    }

    TempFile(const TempFile &) = delete;
    TempFile &operator=(const TempFile &) = delete;

    [[nodiscard]] bool opened() const noexcept { return m_fd != -1; }
    [[nodiscard]] const std::string &path() const noexcept { return m_path; }

    /// Writes everything, flushes it to disk and closes. Returns 0 or an errno.
    int write_and_close(std::string_view content)
    {
        while (!content.empty())
        {
            const ssize_t n = ::write(m_fd, content.data(), content.size());
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return errno;
            }
            content.remove_prefix(static_cast<size_t>(n));
        }
        // mkstemp creates 0600; published files are ordinary readable files.
        if (::fsync(m_fd) != 0 || ::fchmod(m_fd, kPublishedMode) != 0)
        {
            return errno;
        }
        const int fd = std::exchange(m_fd, -1);
        return ::close(fd) == 0 ? 0 : errno;
    }

    /// Renames over `target`, retrying briefly on transient errors. Returns 0 or an errno.
    int publish(const fs::path &target)
    {
        int err = 0;
        for (int attempt = 0; attempt < kRenameAttempts; ++attempt)
        {
            if (std::rename(m_path.c_str(), target.c_str()) == 0)
            {
                m_published = true;
                return 0;
            }
            err = errno;
            if (err != EBUSY && err != ETXTBSY && err != EINTR)
            {
                break;
            }
            LOGGER_WARN("rename onto '{}' hit {}, retrying", target.string(), std::strerror(err));
            ExponentialBackoff{}(attempt + ExponentialBackoff::kYieldAttempts);
        }
        return err;
    }

  private:
    std::string m_path;
    int m_fd{-1};
    bool m_created{false};
    bool m_published{false};
};
} // namespace

bool is_temp_file_name(std::string_view name) noexcept
{
    return name.size() > 1 && name.front() == '.' && name.find(kTempFileInfix) != name.npos;
}

bool fsync_directory(const fs::path &dir, std::error_code *err_code) noexcept
{
    const int dfd = ::open(dir.c_str(), O_DIRECTORY | O_RDONLY | O_CLOEXEC);
    if (dfd < 0)
    {
        return fail_errno(err_code, errno, "open directory", dir.string());
    }
    const int rc = ::fsync(dfd);
    const int err = errno;
    ::close(dfd);
    if (rc != 0)
    {
        return fail_errno(err_code, err, "fsync directory", dir.string());
    }
    return true;
}

bool atomic_write_file(const fs::path &target, std::string_view content,
                       std::error_code *err_code) noexcept
{
    try
    {
        const fs::path dir = directory_of(target);
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec)
        {
            if (err_code != nullptr)
            {
                *err_code = ec;
            }
            LOGGER_ERROR("cannot create '{}': {}", dir.string(), ec.message());
            return false;
        }
        if (utils::is_symlink(target))
        {
            if (err_code != nullptr)
            {
                *err_code = std::make_error_code(std::errc::operation_not_permitted);
            }
            LOGGER_ERROR("refusing to write through symbolic link '{}'", target.string());
            return false;
        }

        TempFile tmp(target);
        if (!tmp.opened())
        {
            return fail_errno(err_code, errno, "mkstemp", tmp.path());
        }
        if (const int err = tmp.write_and_close(content); err != 0)
        {
            return fail_errno(err_code, err, "write", tmp.path());
        }
        if (const int err = tmp.publish(target); err != 0)
        {
            return fail_errno(err_code, err, "rename", target.string());
        }
        if (!fsync_directory(dir, err_code))
        {
            return false;
        }
        if (err_code != nullptr)
        {
            err_code->clear();
        }
        return true;
    }
    catch (const std::exception &ex)
    {
        if (err_code != nullptr)
        {
            *err_code = std::make_error_code(std::errc::io_error);
        }
        LOGGER_ERROR("atomic write of '{}' failed: {}", target.string(), ex.what());
        return false;
    }
}

bool atomic_write_json(const fs::path &target, const nlohmann::json &j,
                       std::error_code *err_code) noexcept
{
    std::string text;
    try
    {
        text = j.dump(4) + "\n";
    }
    catch (const std::exception &ex)
    {
        if (err_code != nullptr)
        {
            *err_code = std::make_error_code(std::errc::invalid_argument);
        }
        LOGGER_ERROR("cannot serialize JSON for '{}': {}", target.string(), ex.what());
        return false;
    }
    return atomic_write_file(target, text, err_code);
}

std::optional<nlohmann::json> read_json_file(const fs::path &path,
                                             std::error_code *err_code) noexcept
{
    try
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            if (err_code != nullptr)
            {
                *err_code = std::error_code(errno != 0 ? errno : ENOENT, std::generic_category());
            }
            return std::nullopt;
        }
        const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_discarded())
        {
            if (err_code != nullptr)
            {
                *err_code = std::make_error_code(std::errc::illegal_byte_sequence);
            }
            return std::nullopt;
        }
        if (err_code != nullptr)
        {
            err_code->clear();
        }
        return parsed;
    }
    catch (const std::exception &ex)
    {
        if (err_code != nullptr)
        {
            *err_code = std::make_error_code(std::errc::io_error);
        }
        LOGGER_ERROR("cannot read JSON from '{}': {}", path.string(), ex.what());
        return std::nullopt;
    }
}

} // namespace artbus::utils
