#pragma once
/**
 * @file bus_daemon.hpp
 * @brief The single writer of the bus: inbox scan, validation, commit, recovery.
 *
 * Every job found in the inbox moves through
 *
 *     Incoming -> Validated -> Committed
 *     Incoming -> Rejected
 *
 * and is left `Deferred` (still in the inbox, or with its commit marker still in
 * `store/.pending/`) when a transient failure interrupts it. A deferred job is
 * picked up again by the next scan.
 *
 * The daemon owns no resources: backend, catalog, lock and export engine are
 * created by the caller and must outlive it.
 *
 * ### Usage
 * @code
 * BusDaemon daemon(cfg, backend, *catalog, lock, exporter);
 * if (auto s = daemon.prepare(); s.is_error()) { ... }
 * daemon.recover();
 * daemon.run();          // until stop()
 * @endcode
 */
#include "bus/artifact_store.hpp"
#include "bus/bus_config.hpp"
#include "bus/bus_types.hpp"
#include "bus/catalog_lock.hpp"
#include "bus/catalog_store.hpp"
#include "bus/export_engine.hpp"
#include "bus/manifest.hpp"
#include "bus/storage_backend.hpp"
#include "utils/file_lock.hpp"

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace artbus::bus
{

/// What happened to one job during a scan.
struct JobOutcome
{
    std::string job_id;
    JobState state{JobState::Incoming};
    std::optional<BusError> error;
    std::string reason;
};

struct ScanReport
{
    size_t committed{0};
    /// Committed jobs whose artifact was already stored and cataloged.
    size_t already_present{0};
    size_t rejected{0};
    size_t deferred{0};
    size_t skipped_incomplete{0};
    /// Pending commit markers finished at the start of the scan.
    size_t replayed{0};
    std::vector<JobOutcome> jobs;

    [[nodiscard]] ARTBUS_EXPORT const JobOutcome *find(const std::string &job_id) const;
};

struct RecoveryReport
{
    /// Stored but not cataloged: upsert replayed.
    size_t replayed{0};
    /// Move never happened: marker cleared, job back in the queue.
    size_t retried{0};
    /// Neither store nor inbox copy left: manifest rejected.
    size_t lost{0};
    /// Still unresolved (lock timeout, catalog error); marker kept.
    size_t deferred{0};
    /// Catalog rows whose canonical file is missing.
    std::vector<std::string> corrupt;
    /// Store files with neither catalog row nor marker.
    std::vector<std::string> orphans;
};

class ARTBUS_EXPORT BusDaemon
{
  public:
    BusDaemon(DaemonConfig config, StorageBackend &backend, CatalogStore &catalog,
              CatalogLock &lock, ExportEngine &exporter);

    BusDaemon(const BusDaemon &) = delete;
    BusDaemon &operator=(const BusDaemon &) = delete;

    /**
     * @brief Claims the inbox, creates the bus directories, migrates the catalog
     *        and registers the configured schema hints.
     *
     * The inbox claim is a non-blocking `FileLock` on the inbox directory, held
     * until the daemon is destroyed. A second daemon on the same inbox fails here
     * with IoError and `error_code() == EAGAIN`.
     */
    BusStatus prepare();

    /**
     * @brief Resolves commit markers left by a crash and audits the store against
     *        the catalog. Run once at startup, before the first scan.
     */
    RecoveryReport recover();

    /// One pass over the inbox.
    ScanReport scan_once();

    /// Scans every `poll_interval`, draining exports after each scan, until `stop()`.
    void run();

    /// Makes `run()` return within one wait slice. Only stores a flag, so it may be
    /// called from a signal handler.
    void stop() noexcept;

    [[nodiscard]] bool stop_requested() const noexcept { return m_stop.load(); }

    [[nodiscard]] const DaemonConfig &config() const noexcept { return m_config; }
    [[nodiscard]] const ArtifactStore &store() const noexcept { return m_store; }

  private:
    struct Candidate;

    // scan
    void collect_candidates(ScanReport &report, std::vector<Candidate> &out);
    void validate_all(std::vector<Candidate> &candidates) const;
    void validate_one(Candidate &c) const;
    JobOutcome commit_one(const Candidate &c, ScanReport &report);

    // catalog
    BusResult<UpsertOutcome> upsert_locked(const CatalogEntry &entry);
    BusResult<UpsertOutcome> finish_commit(const CommitMarker &marker);

    // rejected/
    bool move_to_rejected(const std::string &job_id, const std::filesystem::path &manifest,
                          const std::filesystem::path &data, BusError error,
                          const std::string &reason);
    JobOutcome reject(const std::string &job_id, const std::filesystem::path &manifest,
                      const std::filesystem::path &data, BusError error,
                      const std::string &reason);
    std::filesystem::path free_rejected_name(const std::string &file_name) const;

    // recovery
    void resolve_markers(RecoveryReport &report);
    void audit_store(RecoveryReport &report);

    DaemonConfig m_config;
    StorageBackend &m_backend;
    CatalogStore &m_catalog;
    CatalogLock &m_lock;
    ExportEngine &m_exporter;
    ArtifactStore m_store;

    std::optional<utils::FileLock> m_inbox_claim;
    std::atomic<bool> m_stop{false};
};

} // namespace artbus::bus
