#pragma once
/**
 * @file catalog_lock.hpp
 * @brief Exclusive, timeout-bounded lease guarding catalog mutation.
 *
 * The lease is a small JSON holder record at `lock_path`:
 *
 * @code{.json}
 * {"pid": 4242, "token": "<32 hex>", "acquired_at": "2026-10-17T12:00:00.000Z", "host": "lab-01"}
 * @endcode
 *
 * Records are created, inspected and removed only while holding a short-lived
 * `FileLock` on the same path, so two acquirers never both see the lease as free.
 * The flock is dropped as soon as the record has been written; the record, not
 * the flock, is what excludes other writers while the catalog is being mutated.
 *
 * A record whose holder pid is no longer alive on this host, or a record that
 * cannot be parsed, is stale and is reclaimed by the next acquirer. So is a
 * record left by a lease of this `CatalogLock` whose release could not take the
 * guard in time.
 *
 * ### Usage
 * @code
 * CatalogLock lock(cfg.lock_path);
 * auto lease = lock.acquire(std::chrono::seconds(10));
 * if (lease.is_error()) { ... LockTimeout: defer and retry later ... }
 * catalog.upsert(lease.content(), entry);
 * // lease released when it goes out of scope
 * @endcode
 */
#include "bus/bus_types.hpp"
#include "utils/backoff_strategy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace artbus::bus
{

struct LockHolder
{
    uint64_t pid{0};
    std::string token;
    std::string acquired_at;
    std::string host;

    [[nodiscard]] ARTBUS_EXPORT nlohmann::json to_json() const;
    ARTBUS_EXPORT static std::optional<LockHolder> from_json(const nlohmann::json &j);
};

class CatalogLock;

/**
 * @brief Proof that the catalog lock is held. Move-only; releases on destruction.
 */
class ARTBUS_EXPORT CatalogLease
{
  public:
    CatalogLease(CatalogLease &&other) noexcept;
    CatalogLease &operator=(CatalogLease &&other) noexcept;
    CatalogLease(const CatalogLease &) = delete;
    CatalogLease &operator=(const CatalogLease &) = delete;
    ~CatalogLease();

    /// Releases early. Idempotent.
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return m_lock != nullptr; }
    [[nodiscard]] const std::string &token() const noexcept { return m_token; }

    /// True if this lease was issued by `lock`.
    [[nodiscard]] bool issued_by(const CatalogLock &lock) const noexcept { return m_lock == &lock; }

  private:
    friend class CatalogLock;
    CatalogLease(CatalogLock *lock, std::string token) noexcept;

    CatalogLock *m_lock{nullptr};
    std::string m_token;
};

class ARTBUS_EXPORT CatalogLock
{
  public:
    explicit CatalogLock(std::filesystem::path lock_path);
    ~CatalogLock();

    CatalogLock(const CatalogLock &) = delete;
    CatalogLock &operator=(const CatalogLock &) = delete;

    /**
     * @brief Waits up to `timeout` for the lease.
     *
     * Retries with the configured backoff (5 ms doubling to 250 ms by default),
     * each sleep clamped to the remaining time. `timeout` is clamped to [0, 24 h].
     * Fails with LockTimeout naming the current holder, or IoError when the
     * record cannot be written.
     */
    BusResult<CatalogLease> acquire(std::chrono::milliseconds timeout);

    /// Current holder record, if any.
    [[nodiscard]] std::optional<LockHolder> holder() const;

    [[nodiscard]] const std::filesystem::path &path() const noexcept;

    void set_backoff(utils::CappedExponentialBackoff backoff) noexcept;

  private:
    friend class CatalogLease;
    void release(const std::string &token) noexcept;

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace artbus::bus
