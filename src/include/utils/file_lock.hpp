#pragma once
/**
 * @file file_lock.hpp
 * @brief Advisory cross-process lock held on a companion `.lock` file.
 *
 * The lock file is derived from the guarded path:
 *  - file `/a/b/catalog.lease`  -> `/a/b/catalog.lease.lock`
 *  - directory `/a/b/root`      -> `/a/b/root.dir.lock`
 *
 * An exclusive `flock()` on that file excludes other processes. `flock` does not
 * separate threads that open the same file, so acquirers inside one process
 * first pass through a per-path gate. Destroying the `FileLock` releases both.
 *
 * Construction never throws; check `valid()` and `error_code()`. A deadline that
 * passes yields `std::errc::timed_out`, a busy non-blocking attempt
 * `std::errc::resource_unavailable_try_again`.
 */
#include "abus_base.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

namespace artbus::utils
{

enum class ResourceType
{
    File,
    Directory
};

enum class LockMode
{
    Blocking,
    NonBlocking
};

struct FileLockImpl;

class ARTBUS_EXPORT FileLock
{
  public:
    /// Lifecycle module "FileLock".
    static ModuleDef GetLifecycleModule();

    static bool lifecycle_initialized() noexcept;

    /// Aborts if the FileLock module has not been started.
    FileLock(const std::filesystem::path &path, ResourceType type, LockMode mode) noexcept;

    /// Blocks for at most `timeout`.
    FileLock(const std::filesystem::path &path, ResourceType type,
             std::chrono::milliseconds timeout) noexcept;

    /// Returns nullopt instead of an invalid lock, and also when the module is
    /// not running.
    static std::optional<FileLock> try_lock(const std::filesystem::path &path, ResourceType type,
                                            LockMode mode) noexcept;
    static std::optional<FileLock> try_lock(const std::filesystem::path &path, ResourceType type,
                                            std::chrono::milliseconds timeout) noexcept;

    ~FileLock();
    FileLock(FileLock &&) noexcept;
    FileLock &operator=(FileLock &&) noexcept;
    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;

    [[nodiscard]] bool valid() const noexcept;
    [[nodiscard]] std::error_code error_code() const noexcept;

    /// The lock file held, or nullopt when the lock is not valid.
    [[nodiscard]] std::optional<std::filesystem::path> get_canonical_lock_file_path() const noexcept;

    /// The lock file used for `path`; empty if `path` cannot name one.
    static std::filesystem::path get_expected_lock_fullname_for(const std::filesystem::path &path,
                                                                ResourceType type) noexcept;

  private:
    explicit FileLock(std::unique_ptr<FileLockImpl> impl) noexcept;

    std::unique_ptr<FileLockImpl> pImpl;
};

} // namespace artbus::utils
