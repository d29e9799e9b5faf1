// In-memory StorageBackend for unit tests.
#include "abus_service.hpp"
#include "bus/storage_backend.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace fs = std::filesystem;

namespace artbus::bus
{

namespace
{

std::string key_of(const fs::path &path)
{
    std::string key = path.lexically_normal().generic_string();
    while (key.size() > 1 && key.back() == '/')
    {
        key.pop_back();
    }
    return key;
}

// Prefix under which children of `dir_key` are stored.
std::string child_prefix(const std::string &dir_key)
{
    return dir_key == "/" ? dir_key : dir_key + "/";
}

BusStatus io_failure(int errnum, std::string_view what, const std::string &key)
{
    return BusStatus::error(BusError::IoError, errnum,
                            fmt::format("{} '{}': {}", what, key, std::strerror(errnum)));
}

template <typename T> BusResult<T> io_failure_as(int errnum, std::string_view what, const std::string &key)
{
    return BusResult<T>::error_from(io_failure(errnum, what, key));
}

bool is_hidden_component(std::string_view rel)
{
    size_t pos = 0;
    while (pos <= rel.size())
    {
        const size_t next = rel.find('/', pos);
        const std::string_view part =
            rel.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        if (!part.empty() && part.front() == '.')
        {
            return true;
        }
        if (next == std::string_view::npos)
        {
            break;
        }
        pos = next + 1;
    }
    return false;
}

} // namespace

void MemoryBackend::put(const fs::path &path, std::string content)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_files[key_of(path)] = std::move(content);
}

void MemoryBackend::fail_next(FaultOp op, int count, int skip)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_faults[op] = Fault{skip, count};
}

size_t MemoryBackend::file_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_files.size();
}

bool MemoryBackend::consume_fault(FaultOp op)
{
    auto it = m_faults.find(op);
    if (it == m_faults.end() || it->second.count <= 0)
    {
        return false;
    }
    if (it->second.skip > 0)
    {
        --it->second.skip;
        return false;
    }
    --it->second.count;
    return true;
}

bool MemoryBackend::has_dir_locked(const std::string &key) const
{
    if (m_dirs.count(key) != 0)
    {
        return true;
    }
    const std::string prefix = child_prefix(key);
    const auto it = m_files.lower_bound(prefix);
    return it != m_files.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

BusResult<std::vector<DirEntry>> MemoryBackend::list(const fs::path &dir) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string prefix = child_prefix(key_of(dir));
    std::map<std::string, DirEntry> children;

    auto add_child = [&](const std::string &key, const std::string *content)
    {
        if (key.compare(0, prefix.size(), prefix) != 0 || key.size() == prefix.size())
        {
            return;
        }
        const std::string rest = key.substr(prefix.size());
        const size_t slash = rest.find('/');
        const std::string name = rest.substr(0, slash);
        if (name.empty() || name.front() == '.')
        {
            return;
        }
        DirEntry &entry = children[name];
        entry.name = name;
        if (slash != std::string::npos || content == nullptr)
        {
            entry.is_directory = true;
            entry.size = 0;
        }
        else
        {
            entry.size = content->size();
        }
    };

    for (auto it = m_files.lower_bound(prefix); it != m_files.end(); ++it)
    {
        if (it->first.compare(0, prefix.size(), prefix) != 0)
        {
            break;
        }
        add_child(it->first, &it->second);
    }
    for (const auto &dir_key : m_dirs)
    {
        add_child(dir_key, nullptr);
    }

    std::vector<DirEntry> entries;
    entries.reserve(children.size());
    for (auto &[name, entry] : children)
    {
        entries.push_back(std::move(entry));
    }
    return BusResult<std::vector<DirEntry>>::ok(std::move(entries));
}

BusResult<std::vector<fs::path>> MemoryBackend::list_files_recursive(const fs::path &dir) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string prefix = child_prefix(key_of(dir));
    std::vector<fs::path> files;
    for (auto it = m_files.lower_bound(prefix); it != m_files.end(); ++it)
    {
        if (it->first.compare(0, prefix.size(), prefix) != 0)
        {
            break;
        }
        if (!is_hidden_component(std::string_view(it->first).substr(prefix.size())))
        {
            files.emplace_back(it->first);
        }
    }
    return BusResult<std::vector<fs::path>>::ok(std::move(files));
}

bool MemoryBackend::exists(const fs::path &path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string key = key_of(path);
    return m_files.count(key) != 0 || has_dir_locked(key);
}

BusResult<std::string> MemoryBackend::read_file(const fs::path &path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string key = key_of(path);
    const auto it = m_files.find(key);
    if (it == m_files.end())
    {
        return io_failure_as<std::string>(ENOENT, "cannot read", key);
    }
    return BusResult<std::string>::ok(it->second);
}

BusResult<uint64_t> MemoryBackend::file_size(const fs::path &path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string key = key_of(path);
    const auto it = m_files.find(key);
    if (it == m_files.end())
    {
        return io_failure_as<uint64_t>(ENOENT, "cannot stat", key);
    }
    return BusResult<uint64_t>::ok(it->second.size());
}

BusResult<std::string> MemoryBackend::hash_file(const fs::path &path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string key = key_of(path);
    const auto it = m_files.find(key);
    if (it == m_files.end())
    {
        return io_failure_as<std::string>(ENOENT, "cannot hash", key);
    }
    const auto digest = crypto::digest_of(it->second.data(), it->second.size());
    return BusResult<std::string>::ok(crypto::format_content_hash(digest));
}

BusStatus MemoryBackend::write_file_atomic(const fs::path &path, std::string_view content)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string key = key_of(path);
    if (consume_fault(FaultOp::Write))
    {
        return io_failure(EIO, "injected write failure for", key);
    }
    m_files[key] = std::string(content);
    return ok_status();
}

BusStatus MemoryBackend::copy_file_atomic(const fs::path &src, const fs::path &dst)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string src_key = key_of(src);
    const std::string dst_key = key_of(dst);
    if (consume_fault(FaultOp::Copy))
    {
        return io_failure(EIO, "injected copy failure for", dst_key);
    }
    const auto it = m_files.find(src_key);
    if (it == m_files.end())
    {
        return io_failure(ENOENT, "cannot open", src_key);
    }
    m_files[dst_key] = it->second;
    return ok_status();
}

BusStatus MemoryBackend::rename_no_replace(const fs::path &src, const fs::path &dst)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string src_key = key_of(src);
    const std::string dst_key = key_of(dst);
    if (consume_fault(FaultOp::Rename))
    {
        return io_failure(EIO, "injected rename failure for", dst_key);
    }
    const auto it = m_files.find(src_key);
    if (it == m_files.end())
    {
        return io_failure(ENOENT, "cannot move to", dst_key);
    }
    if (m_files.count(dst_key) != 0)
    {
        return io_failure(EEXIST, "cannot move to", dst_key);
    }
    m_files[dst_key] = std::move(it->second);
    m_files.erase(src_key);
    return ok_status();
}

BusStatus MemoryBackend::remove(const fs::path &path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string key = key_of(path);
    if (consume_fault(FaultOp::Remove))
    {
        return io_failure(EIO, "injected remove failure for", key);
    }
    m_files.erase(key);
    m_dirs.erase(key);
    return ok_status();
}

BusStatus MemoryBackend::create_directories(const fs::path &dir)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_dirs.insert(key_of(dir));
    return ok_status();
}

} // namespace artbus::bus
