#pragma once
/**
 * @file catalog_store.hpp
 * @brief SQLite-backed schema authority of the bus.
 *
 * Schema (managed by numbered migrations tracked in `PRAGMA user_version`):
 *
 * - `runs_d`: one row per (run_id, producer, kind) with the latest committed
 *   artifact of that triple, its canonical path and a monotonically increasing
 *   `commit_seq`.
 * - `artifacts`: one row per full identity; the write-once record.
 * - `latest_artifacts_v`: the `runs_d` row with the highest `commit_seq` per
 *   (producer, kind).
 * - `schema_hints`: registry of schema hint names producers may reference.
 *
 * Only the daemon writes, and every mutation takes a `CatalogLease`. Readers open
 * with `Mode::ReadOnly` and never take the lock.
 */
#include "bus/bus_types.hpp"
#include "bus/catalog_lock.hpp"
#include "utils/module_def.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace artbus::bus
{

/// Everything the daemon knows about a committed artifact.
struct CatalogEntry
{
    ArtifactIdentity identity;
    std::string canonical_path;
    std::optional<std::string> schema_hint;
    int64_t rows{0};
    uint64_t bytes{0};
    std::string content_hash;
    nlohmann::json meta = nlohmann::json::object();
    std::string created_at;
    std::string last_seen_at;
    int64_t commit_seq{0};
};

/// Row of the `artifacts` table.
struct ArtifactRecord
{
    ArtifactIdentity identity;
    std::string content_hash;
    std::string canonical_path;
    int64_t rows{0};
    uint64_t bytes{0};
    std::optional<std::string> schema_hint;
    nlohmann::json meta = nlohmann::json::object();
    std::string committed_at;
};

/// Row of `latest_artifacts_v`.
struct LatestArtifact
{
    ArtifactIdentity identity;
    std::string canonical_path;
    int64_t rows{0};
    std::optional<std::string> schema_hint;
    std::string content_hash;
    std::string last_seen_at;
    int64_t commit_seq{0};
};

struct RunFilter
{
    std::optional<std::string> producer;
    std::optional<std::string> kind;
    std::optional<std::string> run_id;
    /// Inclusive bounds on `created_at` (ISO-8601 UTC strings compare in order).
    std::optional<std::string> created_from;
    std::optional<std::string> created_to;
    int limit{100};
};

struct CatalogHealth
{
    bool available{false};
    int schema_version{0};
    std::string error;
};

enum class UpsertOutcome
{
    Inserted,
    Updated,
    AlreadyPresent
};

class ARTBUS_EXPORT CatalogStore
{
  public:
    enum class Mode
    {
        ReadWrite,
        ReadOnly
    };

    /// Schema version produced by `migrate()`.
    static constexpr int kSchemaVersion = 2;
    static constexpr int kMaxRunLimit = 10000;

    /// Lifecycle module "CatalogStore": initializes SQLite; depends on the Logger.
    static utils::ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

    /**
     * @brief Opens the catalog.
     *
     * ReadWrite creates the file if needed (the schema is created by `migrate()`).
     * ReadOnly fails with CatalogSchemaMissing if the file is missing or carries
     * no schema.
     */
    static BusResult<std::unique_ptr<CatalogStore>> open(const std::filesystem::path &path,
                                                        Mode mode);

    ~CatalogStore();
    CatalogStore(const CatalogStore &) = delete;
    CatalogStore &operator=(const CatalogStore &) = delete;

    [[nodiscard]] Mode mode() const noexcept;
    [[nodiscard]] const std::filesystem::path &path() const noexcept;

    /// Applies pending migrations. Never drops or rewrites existing rows.
    BusStatus migrate();

    /// Current `PRAGMA user_version`.
    BusResult<int> schema_version() const;

    /**
     * @brief Records a committed artifact in `artifacts` and `runs_d`, in one
     *        transaction.
     *
     * Same identity with the same hash is AlreadyPresent (only `last_seen_at`
     * moves); a different hash is a ValidationError (write-once violation).
     * `created_at` of an existing `runs_d` row is kept.
     */
    BusResult<UpsertOutcome> upsert(const CatalogLease &lease, const CatalogEntry &entry);

    BusResult<std::vector<LatestArtifact>>
    latest_artifacts(const std::optional<std::string> &producer = std::nullopt,
                     const std::optional<std::string> &kind = std::nullopt) const;

    BusResult<std::optional<ArtifactRecord>> find_artifact(const ArtifactIdentity &identity) const;

    /// `runs_d` rows matching `filter`, newest first. `limit` must be 1..10000.
    BusResult<std::vector<CatalogEntry>> list_runs(const RunFilter &filter) const;

    /// Every `runs_d` row, oldest commit first.
    BusResult<std::vector<CatalogEntry>> all_entries() const;

    /// Every `artifacts` row.
    BusResult<std::vector<ArtifactRecord>> all_artifacts() const;

    BusStatus register_schema_hint(const CatalogLease &lease, const std::string &name);
    BusResult<bool> is_known_schema_hint(const std::string &name) const;
    BusResult<std::vector<std::string>> schema_hints() const;

    CatalogHealth health_check() const;

  private:
    CatalogStore();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

ARTBUS_EXPORT const char *to_string(UpsertOutcome outcome) noexcept;

} // namespace artbus::bus
