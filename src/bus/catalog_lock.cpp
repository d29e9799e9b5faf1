/**
 * @file catalog_lock.cpp
 * @brief Holder-record lease with flock-guarded inspection and stale reclaim.
 */
#include "abus_service.hpp"
#include "bus/catalog_lock.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace fs = std::filesystem;
using nlohmann::json;

namespace artbus::bus
{

namespace
{
// Upper bound on one wait for the flock guard; the guard is only ever held for a
// read plus a small write.
constexpr std::chrono::milliseconds kGuardWait{500};
// Longest wait `acquire` honours; keeps the steady_clock deadline representable.
constexpr std::chrono::milliseconds kMaxAcquireWait{std::chrono::hours(24)};

std::string new_token()
{
    return fmt::format("{:016x}{:016x}", crypto::generate_random_u64(),
                       crypto::generate_random_u64());
}

enum class RecordState
{
    Absent,
    Live,
    Stale
};

} // namespace

// ============================================================================
// LockHolder
// ============================================================================

json LockHolder::to_json() const
{
    return json{{"pid", pid}, {"token", token}, {"acquired_at", acquired_at}, {"host", host}};
}

std::optional<LockHolder> LockHolder::from_json(const json &j)
{
    if (!j.is_object() || !j.contains("pid") || !j["pid"].is_number_unsigned() ||
        !j.contains("token") || !j["token"].is_string())
    {
        return std::nullopt;
    }
    try
    {
        LockHolder h;
        h.pid = j["pid"].get<uint64_t>();
        h.token = j["token"].get<std::string>();
        h.acquired_at = j.value("acquired_at", std::string{});
        h.host = j.value("host", std::string{});
        return h;
    }
    catch (const json::exception &)
    {
        return std::nullopt;
    }
}

// ============================================================================
// CatalogLease
// ============================================================================

CatalogLease::CatalogLease(CatalogLock *lock, std::string token) noexcept
    : m_lock(lock), m_token(std::move(token))
{
}

CatalogLease::CatalogLease(CatalogLease &&other) noexcept
    : m_lock(std::exchange(other.m_lock, nullptr)), m_token(std::move(other.m_token))
{
}

CatalogLease &CatalogLease::operator=(CatalogLease &&other) noexcept
{
    if (this != &other)
    {
        release();
        m_lock = std::exchange(other.m_lock, nullptr);
        m_token = std::move(other.m_token);
    }
    return *this;
}

CatalogLease::~CatalogLease()
{
    release();
}

void CatalogLease::release() noexcept
{
    if (m_lock != nullptr)
    {
        m_lock->release(m_token);
        m_lock = nullptr;
    }
}

// ============================================================================
// CatalogLock
// ============================================================================

struct CatalogLock::Impl
{
    fs::path lock_path;
    utils::CappedExponentialBackoff backoff;
    std::string host = platform::get_hostname();

    // Tokens whose release did not get as far as removing the record.
    mutable std::mutex released_mutex;
    std::set<std::string> released_tokens;

    bool was_released(const std::string &token) const
    {
        std::lock_guard<std::mutex> lock(released_mutex);
        return released_tokens.count(token) != 0;
    }

    void mark_released(const std::string &token)
    {
        std::lock_guard<std::mutex> lock(released_mutex);
        released_tokens.insert(token);
    }

    void forget_released(const std::string &token)
    {
        std::lock_guard<std::mutex> lock(released_mutex);
        released_tokens.erase(token);
    }

    // Reads the record; only meaningful while the guard is held.
    std::pair<RecordState, std::optional<LockHolder>> inspect() const
    {
        std::error_code ec;
        if (!fs::exists(lock_path, ec))
        {
            return {RecordState::Absent, std::nullopt};
        }
        auto parsed = utils::read_json_file(lock_path, &ec);
        if (!parsed)
        {
            if (ec == std::errc::no_such_file_or_directory)
            {
                return {RecordState::Absent, std::nullopt};
            }
            LOGGER_WARN("CatalogLock: unreadable holder record '{}' ({}), treating as stale",
                        lock_path.string(), ec.message());
            return {RecordState::Stale, std::nullopt};
        }
        auto rec = LockHolder::from_json(*parsed);
        if (!rec)
        {
            LOGGER_WARN("CatalogLock: malformed holder record '{}', treating as stale",
                        lock_path.string());
            return {RecordState::Stale, std::nullopt};
        }
        const bool same_host = rec->host.empty() || rec->host == host;
        if (same_host && !platform::is_process_alive(rec->pid))
        {
            return {RecordState::Stale, std::move(rec)};
        }
        if (same_host && rec->pid == platform::get_pid() && was_released(rec->token))
        {
            LOGGER_WARN("CatalogLock: record on '{}' belongs to a lease this process already "
                        "released",
                        lock_path.string());
            return {RecordState::Stale, std::move(rec)};
        }
        return {RecordState::Live, std::move(rec)};
    }
};

CatalogLock::CatalogLock(fs::path lock_path) : pImpl(std::make_unique<Impl>())
{
    pImpl->lock_path = std::move(lock_path);
}

CatalogLock::~CatalogLock() = default;

const fs::path &CatalogLock::path() const noexcept
{
    return pImpl->lock_path;
}

void CatalogLock::set_backoff(utils::CappedExponentialBackoff backoff) noexcept
{
    pImpl->backoff = backoff;
}

BusResult<CatalogLease> CatalogLock::acquire(std::chrono::milliseconds timeout)
{
    using clock = std::chrono::steady_clock;
    timeout = std::clamp(timeout, std::chrono::milliseconds(0), kMaxAcquireWait);
    const auto deadline = clock::now() + timeout;
    const std::string token = new_token();
    std::optional<LockHolder> last_seen;

    for (int attempt = 0;; ++attempt)
    {
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        const auto guard_wait =
            std::clamp(remaining, std::chrono::milliseconds(1), kGuardWait);

        utils::FileLock guard(pImpl->lock_path, utils::ResourceType::File, guard_wait);
        if (guard.valid())
        {
            auto [state, rec] = pImpl->inspect();
            if (state == RecordState::Stale)
            {
                if (rec)
                {
                    LOGGER_WARN("CatalogLock: reclaiming stale lease of pid {} on '{}' "
                                "(acquired {})",
                                rec->pid, rec->host, rec->acquired_at);
                }
                state = RecordState::Absent;
            }
            if (state == RecordState::Absent)
            {
                LockHolder mine;
                mine.pid = platform::get_pid();
                mine.token = token;
                mine.acquired_at = format_tools::iso8601_utc_now();
                mine.host = pImpl->host;
                std::error_code ec;
                if (!utils::atomic_write_json(pImpl->lock_path, mine.to_json(), &ec))
                {
                    return BusResult<CatalogLease>::error(
                        BusError::IoError, ec.value(),
                        fmt::format("cannot write lease record '{}': {}",
                                    pImpl->lock_path.string(), ec.message()));
                }
                if (rec)
                {
                    pImpl->forget_released(rec->token);
                }
                LOGGER_DEBUG("CatalogLock: acquired '{}' after {} attempt(s)",
                             pImpl->lock_path.string(), attempt + 1);
                return BusResult<CatalogLease>::ok(CatalogLease(this, token));
            }
            last_seen = std::move(rec);
        }
        else if (guard.error_code() != std::errc::timed_out &&
                 guard.error_code() != std::errc::resource_unavailable_try_again)
        {
            return BusResult<CatalogLease>::error(
                BusError::IoError, guard.error_code().value(),
                fmt::format("cannot lock '{}': {}", pImpl->lock_path.string(),
                            guard.error_code().message()));
        }

        const auto now = clock::now();
        if (now >= deadline)
        {
            const std::string holder_desc =
                last_seen ? fmt::format("pid {} on '{}' since {}", last_seen->pid, last_seen->host,
                                        last_seen->acquired_at)
                          : std::string("unknown holder");
            return BusResult<CatalogLease>::error(
                BusError::LockTimeout, 0,
                fmt::format("catalog lock '{}' not acquired within {} ms (held by {})",
                            pImpl->lock_path.string(), timeout.count(), holder_desc));
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(pImpl->backoff.delay_for(attempt), left));
    }
}

std::optional<LockHolder> CatalogLock::holder() const
{
    std::error_code ec;
    auto parsed = utils::read_json_file(pImpl->lock_path, &ec);
    if (!parsed)
    {
        return std::nullopt;
    }
    return LockHolder::from_json(*parsed);
}

void CatalogLock::release(const std::string &token) noexcept
{
    // Until the record is gone, the next acquire here treats it as stale.
    pImpl->mark_released(token);

    utils::FileLock guard(pImpl->lock_path, utils::ResourceType::File, kGuardWait);
    if (!guard.valid())
    {
        LOGGER_ERROR("CatalogLock: cannot take guard to release '{}': {}; record left for "
                     "the next acquire",
                     pImpl->lock_path.string(), guard.error_code().message());
        return;
    }
    auto [state, rec] = pImpl->inspect();
    if (!rec || rec->token != token)
    {
        pImpl->forget_released(token);
        LOGGER_WARN("CatalogLock: lease on '{}' was no longer ours at release",
                    pImpl->lock_path.string());
        return;
    }
    std::error_code ec;
    fs::remove(pImpl->lock_path, ec);
    if (ec)
    {
        LOGGER_ERROR("CatalogLock: cannot remove lease record '{}': {}", pImpl->lock_path.string(),
                     ec.message());
        return;
    }
    pImpl->forget_released(token);
    LOGGER_DEBUG("CatalogLock: released '{}'", pImpl->lock_path.string());
}

} // namespace artbus::bus
