// POSIX StorageBackend: directory listings, streaming atomic copy and
// link-based no-replace renames.
#include "abus_service.hpp"
#include "bus/storage_backend.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace artbus::bus
{

namespace
{
constexpr size_t kCopyChunkBytes = 1 << 20;

BusStatus io_failure(int errnum, std::string_view what, const fs::path &path)
{
    return BusStatus::error(BusError::IoError, errnum,
                            fmt::format("{} '{}': {}", what, path.string(), std::strerror(errnum)));
}

template <typename T> BusResult<T> io_failure_as(int errnum, std::string_view what, const fs::path &path)
{
    return BusResult<T>::error_from(io_failure(errnum, what, path));
}

bool is_hidden(const fs::path &p)
{
    const std::string name = p.filename().string();
    return !name.empty() && name.front() == '.';
}

fs::path parent_or_dot(const fs::path &p)
{
    return p.parent_path().empty() ? fs::path(".") : p.parent_path();
}

// Streams `src` into a fresh hidden temp file beside `dst`; returns its path.
BusResult<fs::path> copy_to_temp(const fs::path &src, const fs::path &dst)
{
    const int in_fd = ::open(src.c_str(), O_RDONLY | O_CLOEXEC);
    if (in_fd < 0)
    {
        return io_failure_as<fs::path>(errno, "cannot open", src);
    }
    auto close_in = basics::make_scope_guard([in_fd] { ::close(in_fd); });

    std::string tmpl = (parent_or_dot(dst) / ("." + dst.filename().string())).string() +
                       std::string(utils::kTempFileInfix) + "XXXXXX";
    std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
    tmpl_buf.push_back('\0');
    const int out_fd = ::mkstemp(tmpl_buf.data());
    if (out_fd < 0)
    {
        return io_failure_as<fs::path>(errno, "cannot create temp file for", dst);
    }
    const fs::path tmp_path(tmpl_buf.data());
    auto unlink_tmp = basics::make_scope_guard([&tmp_path] { ::unlink(tmp_path.c_str()); });
    auto close_out = basics::make_scope_guard([out_fd] { ::close(out_fd); });

    std::vector<char> buffer(kCopyChunkBytes);
    for (;;)
    {
        const ssize_t n = ::read(in_fd, buffer.data(), buffer.size());
        if (n == 0)
        {
            break;
        }
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return io_failure_as<fs::path>(errno, "read failed for", src);
        }
        size_t written = 0;
        while (written < static_cast<size_t>(n))
        {
            const ssize_t w = ::write(out_fd, buffer.data() + written, static_cast<size_t>(n) - written);
            if (w < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return io_failure_as<fs::path>(errno, "write failed for", tmp_path);
            }
            written += static_cast<size_t>(w);
        }
    }
    if (::fsync(out_fd) != 0 || ::fchmod(out_fd, 0644) != 0)
    {
        return io_failure_as<fs::path>(errno, "fsync failed for", tmp_path);
    }
    close_out.dismiss();
    if (::close(out_fd) != 0)
    {
        return io_failure_as<fs::path>(errno, "close failed for", tmp_path);
    }
    unlink_tmp.dismiss();
    return BusResult<fs::path>::ok(tmp_path);
}

BusStatus ensure_dir(const fs::path &dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        return io_failure(ec.value(), "cannot create directory", dir);
    }
    return ok_status();
}

void sync_dir_quietly(const fs::path &dir)
{
    std::error_code ec;
    if (!utils::fsync_directory(dir, &ec))
    {
        LOGGER_WARN("FilesystemBackend: fsync of directory '{}' failed: {}", dir.string(),
                    ec.message());
    }
}

} // namespace

BusResult<std::vector<DirEntry>> FilesystemBackend::list(const fs::path &dir) const
{
    std::vector<DirEntry> entries;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        if (ec == std::errc::no_such_file_or_directory)
        {
            return BusResult<std::vector<DirEntry>>::ok(std::move(entries));
        }
        return io_failure_as<std::vector<DirEntry>>(ec.value(), "cannot list", dir);
    }
    for (const auto &entry : it)
    {
        if (is_hidden(entry.path()))
        {
            continue;
        }
        DirEntry de;
        de.name = entry.path().filename().string();
        de.is_directory = entry.is_directory(ec);
        if (!de.is_directory)
        {
            const auto size = entry.file_size(ec);
            de.size = ec ? 0 : static_cast<uint64_t>(size);
        }
        entries.push_back(std::move(de));
    }
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry &a, const DirEntry &b) { return a.name < b.name; });
    return BusResult<std::vector<DirEntry>>::ok(std::move(entries));
}

BusResult<std::vector<fs::path>> FilesystemBackend::list_files_recursive(const fs::path &dir) const
{
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::exists(dir, ec))
    {
        return BusResult<std::vector<fs::path>>::ok(std::move(files));
    }
    fs::recursive_directory_iterator it(dir, ec);
    if (ec)
    {
        return io_failure_as<std::vector<fs::path>>(ec.value(), "cannot walk", dir);
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec))
    {
        if (ec)
        {
            return io_failure_as<std::vector<fs::path>>(ec.value(), "cannot walk", dir);
        }
        if (is_hidden(it->path()))
        {
            if (it->is_directory(ec))
            {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file(ec))
        {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return BusResult<std::vector<fs::path>>::ok(std::move(files));
}

bool FilesystemBackend::exists(const fs::path &path) const
{
    std::error_code ec;
    return fs::exists(path, ec);
}

BusResult<std::string> FilesystemBackend::read_file(const fs::path &path) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return io_failure_as<std::string>(errno != 0 ? errno : ENOENT, "cannot read", path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return BusResult<std::string>::ok(buf.str());
}

BusResult<uint64_t> FilesystemBackend::file_size(const fs::path &path) const
{
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec)
    {
        return io_failure_as<uint64_t>(ec.value(), "cannot stat", path);
    }
    return BusResult<uint64_t>::ok(static_cast<uint64_t>(size));
}

BusResult<std::string> FilesystemBackend::hash_file(const fs::path &path) const
{
    std::error_code ec;
    const auto digest = crypto::hash_file(path, ec);
    if (ec)
    {
        return io_failure_as<std::string>(ec.value(), "cannot hash", path);
    }
    return BusResult<std::string>::ok(crypto::format_content_hash(digest));
}

BusStatus FilesystemBackend::write_file_atomic(const fs::path &path, std::string_view content)
{
    std::error_code ec;
    if (!utils::atomic_write_file(path, content, &ec))
    {
        return io_failure(ec.value() != 0 ? ec.value() : EIO, "atomic write failed for", path);
    }
    return ok_status();
}

BusStatus FilesystemBackend::copy_file_atomic(const fs::path &src, const fs::path &dst)
{
    if (auto status = ensure_dir(parent_or_dot(dst)); status.is_error())
    {
        return status;
    }
    auto tmp = copy_to_temp(src, dst);
    if (tmp.is_error())
    {
        return BusStatus::error_from(tmp);
    }
    if (std::rename(tmp.content().c_str(), dst.c_str()) != 0)
    {
        const int errnum = errno;
        ::unlink(tmp.content().c_str());
        return io_failure(errnum, "cannot rename into", dst);
    }
    sync_dir_quietly(parent_or_dot(dst));
    return ok_status();
}

BusStatus FilesystemBackend::rename_no_replace(const fs::path &src, const fs::path &dst)
{
    if (auto status = ensure_dir(parent_or_dot(dst)); status.is_error())
    {
        return status;
    }
    // link(2) fails with EEXIST instead of replacing, which rename(2) would do.
    if (::link(src.c_str(), dst.c_str()) != 0)
    {
        const int errnum = errno;
        if (errnum == EEXIST || errnum == ENOENT)
        {
            return io_failure(errnum, "cannot move to", dst);
        }
        if (errnum != EXDEV && errnum != EPERM && errnum != ENOTSUP)
        {
            return io_failure(errnum, "cannot link", dst);
        }
        // Cross-device or no hard links: stage a copy beside dst, then link it.
        LOGGER_DEBUG("FilesystemBackend: link '{}' -> '{}' unsupported ({}), copying",
                     src.string(), dst.string(), std::strerror(errnum));
        auto tmp = copy_to_temp(src, dst);
        if (tmp.is_error())
        {
            return BusStatus::error_from(tmp);
        }
        auto unlink_tmp = basics::make_scope_guard([&tmp] { ::unlink(tmp.content().c_str()); });
        if (::link(tmp.content().c_str(), dst.c_str()) != 0)
        {
            return io_failure(errno, "cannot move to", dst);
        }
    }
    if (::unlink(src.c_str()) != 0 && errno != ENOENT)
    {
        const int errnum = errno;
        ::unlink(dst.c_str());
        return io_failure(errnum, "cannot unlink source", src);
    }
    sync_dir_quietly(parent_or_dot(dst));
    if (parent_or_dot(src) != parent_or_dot(dst))
    {
        sync_dir_quietly(parent_or_dot(src));
    }
    return ok_status();
}

BusStatus FilesystemBackend::remove(const fs::path &path)
{
    std::error_code ec;
    fs::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
    {
        return io_failure(ec.value(), "cannot remove", path);
    }
    return ok_status();
}

BusStatus FilesystemBackend::create_directories(const fs::path &dir)
{
    return ensure_dir(dir);
}

} // namespace artbus::bus
