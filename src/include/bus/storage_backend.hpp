#pragma once
/**
 * @file storage_backend.hpp
 * @brief Filesystem abstraction used by the producer, the daemon and the exporter.
 *
 * The bus treats directories as queues, so every inbox, store and export operation
 * goes through a `StorageBackend`. `FilesystemBackend` is the POSIX implementation;
 * `MemoryBackend` keeps everything in a map so the daemon state machine can be unit
 * tested without touching disk, and can inject I/O faults.
 *
 * Conventions shared by both implementations:
 * - Atomic writes go through a hidden temp file in the target directory, and
 *   listings skip every name starting with '.', so a partially written file is
 *   never visible to a scan.
 * - `rename_no_replace` never overwrites: an existing destination fails with
 *   IoError and `error_code() == EEXIST`.
 * - Missing files are IoError with `error_code() == ENOENT`. `remove()` of a
 *   missing file succeeds.
 */
#include "bus/bus_types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace artbus::bus
{

struct DirEntry
{
    std::string name;
    bool is_directory{false};
    uint64_t size{0};
};

class ARTBUS_EXPORT StorageBackend
{
  public:
    virtual ~StorageBackend() = default;

    /// Direct children of `dir`, sorted by name, hidden names excluded. A missing
    /// directory yields an empty list.
    virtual BusResult<std::vector<DirEntry>> list(const std::filesystem::path &dir) const = 0;

    /// All regular files below `dir`, sorted, hidden files and directories excluded.
    virtual BusResult<std::vector<std::filesystem::path>>
    list_files_recursive(const std::filesystem::path &dir) const = 0;

    virtual bool exists(const std::filesystem::path &path) const = 0;
    virtual BusResult<std::string> read_file(const std::filesystem::path &path) const = 0;
    virtual BusResult<uint64_t> file_size(const std::filesystem::path &path) const = 0;

    /// Content hash in its textual `blake2b-256:<hex>` form.
    virtual BusResult<std::string> hash_file(const std::filesystem::path &path) const = 0;

    virtual BusStatus write_file_atomic(const std::filesystem::path &path,
                                        std::string_view content) = 0;

    /// Copies `src` to `dst` through a hidden temp file; `dst` is replaced.
    virtual BusStatus copy_file_atomic(const std::filesystem::path &src,
                                       const std::filesystem::path &dst) = 0;

    /// Moves `src` to `dst`, failing with EEXIST if `dst` exists. Parent
    /// directories of `dst` are created.
    virtual BusStatus rename_no_replace(const std::filesystem::path &src,
                                        const std::filesystem::path &dst) = 0;

    virtual BusStatus remove(const std::filesystem::path &path) = 0;
    virtual BusStatus create_directories(const std::filesystem::path &dir) = 0;

    virtual std::string description() const = 0;
};

// ============================================================================
// POSIX implementation
// ============================================================================

class ARTBUS_EXPORT FilesystemBackend final : public StorageBackend
{
  public:
    FilesystemBackend() = default;

    BusResult<std::vector<DirEntry>> list(const std::filesystem::path &dir) const override;
    BusResult<std::vector<std::filesystem::path>>
    list_files_recursive(const std::filesystem::path &dir) const override;
    bool exists(const std::filesystem::path &path) const override;
    BusResult<std::string> read_file(const std::filesystem::path &path) const override;
    BusResult<uint64_t> file_size(const std::filesystem::path &path) const override;
    BusResult<std::string> hash_file(const std::filesystem::path &path) const override;
    BusStatus write_file_atomic(const std::filesystem::path &path,
                                std::string_view content) override;
    BusStatus copy_file_atomic(const std::filesystem::path &src,
                               const std::filesystem::path &dst) override;
    BusStatus rename_no_replace(const std::filesystem::path &src,
                                const std::filesystem::path &dst) override;
    BusStatus remove(const std::filesystem::path &path) override;
    BusStatus create_directories(const std::filesystem::path &dir) override;
    std::string description() const override { return "FilesystemBackend"; }
};

// ============================================================================
// In-memory implementation
// ============================================================================

/**
 * @brief Thread-safe in-memory backend for unit tests.
 *
 * Directories exist implicitly as prefixes of stored files, or explicitly after
 * `create_directories`. `fail_next()` makes N calls of one operation fail with
 * IoError/EIO, after letting `skip` calls through.
 */
class ARTBUS_EXPORT MemoryBackend final : public StorageBackend
{
  public:
    enum class FaultOp
    {
        Write,
        Copy,
        Rename,
        Remove
    };

    MemoryBackend() = default;

    /// Test helper: stores `content` at `path` directly (no fault injection).
    void put(const std::filesystem::path &path, std::string content);

    void fail_next(FaultOp op, int count = 1, int skip = 0);

    /// Number of stored files.
    size_t file_count() const;

    BusResult<std::vector<DirEntry>> list(const std::filesystem::path &dir) const override;
    BusResult<std::vector<std::filesystem::path>>
    list_files_recursive(const std::filesystem::path &dir) const override;
    bool exists(const std::filesystem::path &path) const override;
    BusResult<std::string> read_file(const std::filesystem::path &path) const override;
    BusResult<uint64_t> file_size(const std::filesystem::path &path) const override;
    BusResult<std::string> hash_file(const std::filesystem::path &path) const override;
    BusStatus write_file_atomic(const std::filesystem::path &path,
                                std::string_view content) override;
    BusStatus copy_file_atomic(const std::filesystem::path &src,
                               const std::filesystem::path &dst) override;
    BusStatus rename_no_replace(const std::filesystem::path &src,
                                const std::filesystem::path &dst) override;
    BusStatus remove(const std::filesystem::path &path) override;
    BusStatus create_directories(const std::filesystem::path &dir) override;
    std::string description() const override { return "MemoryBackend"; }

  private:
    bool consume_fault(FaultOp op);
    bool has_dir_locked(const std::string &key) const;

    struct Fault
    {
        int skip{0};
        int count{0};
    };

    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_files;
    std::set<std::string> m_dirs;
    std::map<FaultOp, Fault> m_faults;
};

} // namespace artbus::bus
