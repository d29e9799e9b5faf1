/**
 * @file bus_daemon.cpp
 * @brief Inbox scan, validation, commit and the rejected/ area.
 *
 * Crash recovery and the store audit live in recovery.cpp.
 */
#include "abus_service.hpp"
#include "bus/bus_daemon.hpp"

#include <algorithm>
#include <cerrno>
#include <future>
#include <thread>
#include <utility>

namespace fs = std::filesystem;
using nlohmann::json;

namespace artbus::bus
{

namespace
{
constexpr int kMaxRejectedSuffix = 100000;
constexpr std::chrono::milliseconds kStopSlice{50};

CatalogEntry entry_for(const Manifest &m, const std::string &canonical_path)
{
    CatalogEntry e;
    e.identity = m.identity;
    e.canonical_path = canonical_path;
    if (!m.is_untyped())
    {
        e.schema_hint = m.schema_hint;
    }
    e.rows = m.rows;
    e.bytes = m.bytes;
    e.content_hash = m.content_hash;
    e.meta = m.meta;
    return e;
}

JobOutcome make_outcome(const std::string &job_id, JobState state,
                        std::optional<BusError> error = std::nullopt, std::string reason = {})
{
    return JobOutcome{job_id, state, error, std::move(reason)};
}
} // namespace

const JobOutcome *ScanReport::find(const std::string &job_id) const
{
    const auto it = std::find_if(jobs.begin(), jobs.end(),
                                 [&job_id](const JobOutcome &o) { return o.job_id == job_id; });
    return it == jobs.end() ? nullptr : &*it;
}

/// One complete inbox pair on its way through validation.
struct BusDaemon::Candidate
{
    std::string job_id;
    fs::path manifest_path;
    fs::path data_path;
    Manifest manifest;

    JobState state{JobState::Incoming};
    std::optional<BusError> error;
    std::string reason;

    void fail(BusError err, std::string why)
    {
        state = (err == BusError::ValidationError) ? JobState::Rejected : JobState::Deferred;
        error = err;
        reason = std::move(why);
    }
};

BusDaemon::BusDaemon(DaemonConfig config, StorageBackend &backend, CatalogStore &catalog,
                     CatalogLock &lock, ExportEngine &exporter)
    : m_config(std::move(config)), m_backend(backend), m_catalog(catalog), m_lock(lock),
      m_exporter(exporter), m_store(backend, m_config.paths.store_dir)
{
}

// ============================================================================
// Startup
// ============================================================================

BusStatus BusDaemon::prepare()
{
    const BusPaths &p = m_config.paths;
    if (!m_inbox_claim)
    {
        utils::FileLock claim(p.inbox_dir, utils::ResourceType::Directory,
                              utils::LockMode::NonBlocking);
        if (!claim.valid())
        {
            const std::error_code ec = claim.error_code();
            const std::string lock_file =
                utils::FileLock::get_expected_lock_fullname_for(p.inbox_dir,
                                                                utils::ResourceType::Directory)
                    .string();
            if (ec == std::errc::resource_unavailable_try_again)
            {
                LOGGER_ERROR("BusDaemon: another daemon already serves '{}' (lock '{}')",
                             p.inbox_dir.string(), lock_file);
                return BusStatus::error(BusError::IoError, EAGAIN,
                                        fmt::format("another daemon already serves '{}' "
                                                    "(lock '{}' is held)",
                                                    p.inbox_dir.string(), lock_file));
            }
            LOGGER_ERROR("BusDaemon: cannot lock '{}': {}", lock_file, ec.message());
            return BusStatus::error(BusError::IoError, ec.value(),
                                    fmt::format("cannot lock '{}': {}", lock_file, ec.message()));
        }
        m_inbox_claim.emplace(std::move(claim));
    }

    for (const fs::path &dir : {p.inbox_dir, p.rejected_dir, p.store_dir, p.pending_dir(),
                                p.export_dir})
    {
        if (auto st = m_backend.create_directories(dir); st.is_error())
        {
            LOGGER_ERROR("BusDaemon: cannot create '{}': {}", dir.string(), st.error_message());
            return st;
        }
    }

    if (auto st = m_catalog.migrate(); st.is_error())
    {
        LOGGER_ERROR("BusDaemon: catalog migration failed: {}", st.error_message());
        return st;
    }

    if (!m_config.known_schema_hints.empty())
    {
        auto lease = m_lock.acquire(m_config.lock_timeout);
        if (lease.is_error())
        {
            LOGGER_ERROR("BusDaemon: cannot register schema hints: {}", lease.error_message());
            return BusStatus::error_from(lease);
        }
        for (const auto &hint : m_config.known_schema_hints)
        {
            if (auto st = m_catalog.register_schema_hint(lease.content(), hint); st.is_error())
            {
                LOGGER_ERROR("BusDaemon: cannot register schema hint '{}': {}", hint,
                             st.error_message());
                return st;
            }
        }
    }

    LOGGER_INFO("BusDaemon: bus ready at '{}' ({} schema hints, untyped {})",
                p.root.string(), m_config.known_schema_hints.size(),
                m_config.allow_untyped ? "allowed" : "refused");
    return ok_status();
}

// ============================================================================
// Scan
// ============================================================================

ScanReport BusDaemon::scan_once()
{
    ScanReport report;

    RecoveryReport markers;
    resolve_markers(markers);
    report.replayed = markers.replayed;

    std::vector<Candidate> candidates;
    collect_candidates(report, candidates);
    validate_all(candidates);

    for (const auto &c : candidates)
    {
        report.jobs.push_back(commit_one(c, report));
    }

    for (const auto &job : report.jobs)
    {
        switch (job.state)
        {
        case JobState::Committed:
            ++report.committed;
            break;
        case JobState::Rejected:
            ++report.rejected;
            break;
        case JobState::Deferred:
            ++report.deferred;
            break;
        default:
            break;
        }
    }

    if (report.jobs.empty() && report.replayed == 0)
    {
        LOGGER_TRACE("BusDaemon: scan found nothing ({} incomplete)", report.skipped_incomplete);
    }
    else
    {
        LOGGER_INFO("BusDaemon: scan committed {} ({} already present), rejected {}, deferred {}, "
                    "incomplete {}, replayed {}",
                    report.committed, report.already_present, report.rejected, report.deferred,
                    report.skipped_incomplete, report.replayed);
    }
    return report;
}

void BusDaemon::collect_candidates(ScanReport &report, std::vector<Candidate> &out)
{
    const fs::path &inbox = m_config.paths.inbox_dir;
    auto entries = m_backend.list(inbox);
    if (entries.is_error())
    {
        LOGGER_ERROR("BusDaemon: cannot list inbox '{}': {}", inbox.string(),
                     entries.error_message());
        return;
    }

    for (const auto &entry : entries.content())
    {
        if (entry.is_directory || !entry.name.ends_with(kManifestSuffix))
        {
            continue;
        }
        const std::string job_id = entry.name.substr(0, entry.name.size() - kManifestSuffix.size());
        if (m_store.has_marker(job_id))
        {
            // Commit in flight from an earlier scan; resolve_markers owns it.
            continue;
        }

        const fs::path manifest_path = inbox / entry.name;
        const fs::path default_data = inbox / data_file_name(job_id);

        auto text = m_backend.read_file(manifest_path);
        if (text.is_error())
        {
            LOGGER_WARN("BusDaemon: job {} deferred: cannot read manifest: {}", job_id,
                        text.error_message());
            report.jobs.push_back(
                make_outcome(job_id, JobState::Deferred, BusError::IoError, text.error_message()));
            continue;
        }

        auto parsed = Manifest::parse(text.content());
        if (parsed.is_error())
        {
            report.jobs.push_back(reject(job_id, manifest_path,
                                         m_backend.exists(default_data) ? default_data : fs::path{},
                                         BusError::ValidationError, parsed.error_message()));
            continue;
        }
        Manifest manifest = std::move(parsed).content();

        const fs::path data_path = inbox / manifest.data_file;
        if (manifest.job_id != job_id)
        {
            report.jobs.push_back(
                reject(job_id, manifest_path, m_backend.exists(data_path) ? data_path : fs::path{},
                       BusError::ValidationError,
                       fmt::format("manifest job_id '{}' does not match file name",
                                   manifest.job_id)));
            continue;
        }
        if (!m_backend.exists(data_path))
        {
            LOGGER_DEBUG("BusDaemon: job {} incomplete: '{}' not present yet", job_id,
                         manifest.data_file);
            ++report.skipped_incomplete;
            continue;
        }

        Candidate c;
        c.job_id = job_id;
        c.manifest_path = manifest_path;
        c.data_path = data_path;
        c.manifest = std::move(manifest);
        out.push_back(std::move(c));
    }
}

// ============================================================================
// Validation
// ============================================================================

void BusDaemon::validate_all(std::vector<Candidate> &candidates) const
{
    const size_t n = candidates.size();
    const size_t workers =
        std::min(n, static_cast<size_t>(std::max(1, m_config.validate_workers)));
    if (workers <= 1)
    {
        for (auto &c : candidates)
        {
            validate_one(c);
        }
        return;
    }

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w)
    {
        futures.push_back(std::async(std::launch::async,
                                     [this, &candidates, w, workers, n]
                                     {
                                         for (size_t i = w; i < n; i += workers)
                                         {
                                             validate_one(candidates[i]);
                                         }
                                     }));
    }
    for (auto &f : futures)
    {
        f.get();
    }
}

void BusDaemon::validate_one(Candidate &c) const
{
    const Manifest &m = c.manifest;

    if (m.is_untyped())
    {
        if (!m_config.allow_untyped)
        {
            c.fail(BusError::ValidationError, "schema_hint required: untyped artifacts are refused");
            return;
        }
    }
    else
    {
        auto known = m_catalog.is_known_schema_hint(*m.schema_hint);
        if (known.is_error())
        {
            c.fail(known.error(), "schema hint lookup failed: " + known.error_message());
            return;
        }
        if (!known.content())
        {
            c.fail(BusError::ValidationError, fmt::format("unknown schema_hint '{}'", *m.schema_hint));
            return;
        }
    }

    auto size = m_backend.file_size(c.data_path);
    if (size.is_error())
    {
        c.fail(BusError::IoError, "cannot stat data file: " + size.error_message());
        return;
    }
    if (size.content() != m.bytes)
    {
        c.fail(BusError::ValidationError,
               fmt::format("size mismatch: manifest declares {} bytes, data file has {}", m.bytes,
                           size.content()));
        return;
    }

    auto hash = m_backend.hash_file(c.data_path);
    if (hash.is_error())
    {
        c.fail(BusError::IoError, "cannot hash data file: " + hash.error_message());
        return;
    }
    if (hash.content() != m.content_hash)
    {
        c.fail(BusError::ValidationError,
               fmt::format("content hash mismatch: manifest declares {}, data file is {}",
                           m.content_hash, hash.content()));
        return;
    }

    auto existing = m_catalog.find_artifact(m.identity);
    if (existing.is_error())
    {
        c.fail(existing.error(), "catalog lookup failed: " + existing.error_message());
        return;
    }
    if (existing.content() && existing.content()->content_hash != m.content_hash)
    {
        c.fail(BusError::ValidationError,
               fmt::format("write-once violation: {} already committed with {}",
                           m.identity.to_string(), existing.content()->content_hash));
        return;
    }

    c.state = JobState::Validated;
}

// ============================================================================
// Commit
// ============================================================================

JobOutcome BusDaemon::commit_one(const Candidate &c, ScanReport &report)
{
    if (c.state == JobState::Rejected)
    {
        return reject(c.job_id, c.manifest_path, c.data_path, *c.error, c.reason);
    }
    if (c.state == JobState::Deferred)
    {
        LOGGER_WARN("BusDaemon: job {} deferred: {}", c.job_id, c.reason);
        return make_outcome(c.job_id, JobState::Deferred, c.error, c.reason);
    }

    const Manifest &m = c.manifest;
    CommitMarker marker;
    marker.manifest = m;
    marker.canonical_path = m_store.canonical_path(m.identity).string();
    marker.inbox_data = c.data_path.string();
    marker.inbox_manifest = c.manifest_path.string();
    marker.started_at = format_tools::iso8601_utc_now();

    if (auto st = m_store.write_marker(marker); st.is_error())
    {
        LOGGER_WARN("BusDaemon: job {} deferred: {}", c.job_id, st.error_message());
        return make_outcome(c.job_id, JobState::Deferred, st.error(), st.error_message());
    }

    auto moved = m_store.commit(c.data_path, m.identity, m.content_hash);
    if (moved.is_error())
    {
        if (auto cleared = m_store.clear_marker(c.job_id); cleared.is_error())
        {
            LOGGER_ERROR("BusDaemon: cannot clear marker of job {}: {}", c.job_id,
                         cleared.error_message());
        }
        if (moved.error() == BusError::ValidationError)
        {
            return reject(c.job_id, c.manifest_path, c.data_path, moved.error(),
                          moved.error_message());
        }
        LOGGER_WARN("BusDaemon: job {} deferred: {}", c.job_id, moved.error_message());
        return make_outcome(c.job_id, JobState::Deferred, moved.error(), moved.error_message());
    }

    auto upserted = finish_commit(marker);
    if (upserted.is_error())
    {
        if (upserted.error() == BusError::ValidationError)
        {
            // The catalog disagrees with the store about this identity. Only quarantine
            // the canonical file if this job put it there.
            const fs::path data = moved.content() == CommitOutcome::Moved
                                      ? fs::path(marker.canonical_path)
                                      : fs::path{};
            auto outcome =
                reject(c.job_id, c.manifest_path, data, upserted.error(), upserted.error_message());
            if (outcome.state == JobState::Rejected)
            {
                if (auto cleared = m_store.clear_marker(c.job_id); cleared.is_error())
                {
                    LOGGER_ERROR("BusDaemon: cannot clear marker of job {}: {}", c.job_id,
                                 cleared.error_message());
                }
            }
            return outcome;
        }
        // The data is safely in the store; the marker makes a later scan replay the upsert.
        LOGGER_WARN("BusDaemon: job {} deferred after store commit: {}: {}", c.job_id,
                    to_string(upserted.error()), upserted.error_message());
        return make_outcome(c.job_id, JobState::Deferred, upserted.error(),
                            upserted.error_message());
    }

    if (moved.content() == CommitOutcome::AlreadyPresent ||
        upserted.content() == UpsertOutcome::AlreadyPresent)
    {
        ++report.already_present;
    }
    LOGGER_INFO("BusDaemon: committed job {} as {} ({}, catalog {})", c.job_id,
                m.identity.to_string(),
                moved.content() == CommitOutcome::Moved ? "moved" : "already stored",
                to_string(upserted.content()));
    return make_outcome(c.job_id, JobState::Committed);
}

BusResult<UpsertOutcome> BusDaemon::upsert_locked(const CatalogEntry &entry)
{
    using R = BusResult<UpsertOutcome>;
    auto lease = m_lock.acquire(m_config.lock_timeout);
    if (lease.is_error())
    {
        return R::error_from(lease);
    }

    auto result = m_catalog.upsert(lease.content(), entry);
    if (result.is_error() && result.error() == BusError::CatalogSchemaMissing)
    {
        LOGGER_WARN("BusDaemon: catalog schema missing; running migrations");
        if (auto st = m_catalog.migrate(); st.is_error())
        {
            return R::error_from(st);
        }
        result = m_catalog.upsert(lease.content(), entry);
    }
    return result;
}

BusResult<UpsertOutcome> BusDaemon::finish_commit(const CommitMarker &marker)
{
    using R = BusResult<UpsertOutcome>;
    const Manifest &m = marker.manifest;

    auto upserted = upsert_locked(entry_for(m, marker.canonical_path));
    if (upserted.is_error())
    {
        return upserted;
    }

    // A move interrupted between link and unlink leaves the inbox copy behind.
    const fs::path inbox_data(marker.inbox_data);
    if (!inbox_data.empty() &&
        inbox_data.lexically_normal() != fs::path(marker.canonical_path).lexically_normal() &&
        m_backend.exists(inbox_data))
    {
        if (auto removed = m_backend.remove(inbox_data); removed.is_error())
        {
            return R::error(BusError::CommitIOError, removed.error_code(),
                            "cannot remove inbox data: " + removed.error_message());
        }
        LOGGER_INFO("BusDaemon: removed leftover inbox data '{}' of job {}", inbox_data.string(),
                    m.job_id);
    }

    // The marker goes last: while the inbox manifest exists the marker must too.
    if (auto removed = m_backend.remove(marker.inbox_manifest); removed.is_error())
    {
        return R::error(BusError::CommitIOError, removed.error_code(),
                        "cannot remove inbox manifest: " + removed.error_message());
    }
    if (auto cleared = m_store.clear_marker(m.job_id); cleared.is_error())
    {
        LOGGER_WARN("BusDaemon: marker of job {} not cleared: {}", m.job_id,
                    cleared.error_message());
    }

    m_exporter.request_refresh(m.identity.producer, m.identity.kind);
    return upserted;
}

// ============================================================================
// rejected/
// ============================================================================

fs::path BusDaemon::free_rejected_name(const std::string &file_name) const
{
    const fs::path &dir = m_config.paths.rejected_dir;
    fs::path candidate = dir / file_name;
    if (!m_backend.exists(candidate))
    {
        return candidate;
    }

    std::string stem;
    std::string ext;
    for (std::string_view suffix : {kManifestSuffix, kReasonSuffix})
    {
        if (file_name.ends_with(suffix))
        {
            stem = file_name.substr(0, file_name.size() - suffix.size());
            ext = std::string(suffix);
            break;
        }
    }
    if (ext.empty())
    {
        stem = fs::path(file_name).stem().string();
        ext = fs::path(file_name).extension().string();
    }

    for (int n = 1; n < kMaxRejectedSuffix; ++n)
    {
        candidate = dir / fmt::format("{}-{}{}", stem, n, ext);
        if (!m_backend.exists(candidate))
        {
            return candidate;
        }
    }
    return dir / fmt::format("{}-{}{}", stem, format_tools::epoch_millis(
                                                  std::chrono::system_clock::now()),
                             ext);
}

bool BusDaemon::move_to_rejected(const std::string &job_id, const fs::path &manifest,
                                 const fs::path &data, BusError error, const std::string &reason)
{
    if (auto st = m_backend.create_directories(m_config.paths.rejected_dir); st.is_error())
    {
        LOGGER_ERROR("BusDaemon: cannot create rejected dir: {}", st.error_message());
        return false;
    }

    json sidecar{{"job_id", job_id},
                 {"error", to_string(error)},
                 {"reason", reason},
                 {"rejected_at", format_tools::iso8601_utc_now()},
                 {"manifest_file", nullptr},
                 {"data_file", nullptr}};

    // Data first, then the manifest. If the manifest cannot follow, the data goes
    // back so the job stays a complete pair in the inbox.
    fs::path moved_data;
    if (!data.empty() && m_backend.exists(data))
    {
        const fs::path dst = free_rejected_name(data.filename().string());
        if (auto st = m_backend.rename_no_replace(data, dst); st.is_error())
        {
            LOGGER_ERROR("BusDaemon: cannot move '{}' to rejected: {}", data.string(),
                         st.error_message());
            return false;
        }
        moved_data = dst;
        sidecar["data_file"] = dst.filename().string();
    }
    if (!manifest.empty() && m_backend.exists(manifest))
    {
        const fs::path dst = free_rejected_name(manifest.filename().string());
        if (auto st = m_backend.rename_no_replace(manifest, dst); st.is_error())
        {
            LOGGER_ERROR("BusDaemon: cannot move '{}' to rejected: {}", manifest.string(),
                         st.error_message());
            if (!moved_data.empty())
            {
                if (auto back = m_backend.rename_no_replace(moved_data, data); back.is_error())
                {
                    LOGGER_ERROR("BusDaemon: data of job {} stranded at '{}': {}", job_id,
                                 moved_data.string(), back.error_message());
                }
            }
            return false;
        }
        sidecar["manifest_file"] = dst.filename().string();
    }

    const fs::path reason_path = free_rejected_name(job_id + std::string(kReasonSuffix));
    if (auto st = m_backend.write_file_atomic(reason_path, sidecar.dump(4)); st.is_error())
    {
        // The files are already in rejected/; only the sidecar is missing.
        LOGGER_ERROR("BusDaemon: cannot write '{}': {}", reason_path.string(), st.error_message());
    }
    return true;
}

JobOutcome BusDaemon::reject(const std::string &job_id, const fs::path &manifest,
                             const fs::path &data, BusError error, const std::string &reason)
{
    if (!move_to_rejected(job_id, manifest, data, error, reason))
    {
        LOGGER_WARN("BusDaemon: job {} deferred: could not be moved to rejected ({})", job_id,
                    reason);
        return make_outcome(job_id, JobState::Deferred, BusError::IoError,
                            "move to rejected failed: " + reason);
    }
    LOGGER_INFO("BusDaemon: rejected job {}: {}: {}", job_id, to_string(error), reason);
    return make_outcome(job_id, JobState::Rejected, error, reason);
}

// ============================================================================
// Run loop
// ============================================================================

void BusDaemon::run()
{
    LOGGER_INFO("BusDaemon: watching '{}' every {} ms", m_config.paths.inbox_dir.string(),
                m_config.poll_interval.count());
    while (!m_stop.load())
    {
        scan_once();
        if (!m_exporter.running())
        {
            m_exporter.drain();
        }
        const auto wake = std::chrono::steady_clock::now() + m_config.poll_interval;
        for (auto now = std::chrono::steady_clock::now(); now < wake && !m_stop.load();
             now = std::chrono::steady_clock::now())
        {
            std::this_thread::sleep_for(
                std::min<std::chrono::steady_clock::duration>(kStopSlice, wake - now));
        }
    }
    LOGGER_INFO("BusDaemon: stopped");
}

void BusDaemon::stop() noexcept
{
    m_stop.store(true);
}

} // namespace artbus::bus
