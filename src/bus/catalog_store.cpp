/**
 * @file catalog_store.cpp
 * @brief SQLite catalog: migrations, write-once upsert and the read surface.
 */
#include "abus_service.hpp"
#include "bus/catalog_store.hpp"

#include <iterator>
#include <mutex>
#include <stdexcept>

#include <sqlite3.h>

namespace fs = std::filesystem;
using nlohmann::json;

namespace artbus::bus
{

namespace
{
std::atomic<bool> g_catalog_initialized{false};
constexpr std::chrono::milliseconds kCatalogShutdownTimeoutMs(2000);
constexpr int kBusyTimeoutMs = 5000;

// Numbered migrations; migration N brings user_version from N-1 to N.
constexpr const char *kMigrations[] = {
    // 1: tables
    R"SQL(
        CREATE TABLE IF NOT EXISTS artifacts (
            run_id         TEXT NOT NULL,
            producer       TEXT NOT NULL,
            kind           TEXT NOT NULL,
            artifact_id    TEXT NOT NULL,
            content_hash   TEXT NOT NULL,
            canonical_path TEXT NOT NULL,
            row_count      INTEGER NOT NULL,
            bytes          INTEGER NOT NULL,
            schema_hint    TEXT,
            meta           TEXT NOT NULL DEFAULT '{}',
            committed_at   TEXT NOT NULL,
            PRIMARY KEY (run_id, producer, kind, artifact_id)
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_artifacts_path ON artifacts(canonical_path);

        CREATE TABLE IF NOT EXISTS runs_d (
            run_id         TEXT NOT NULL,
            producer       TEXT NOT NULL,
            kind           TEXT NOT NULL,
            created_at     TEXT NOT NULL,
            last_seen_at   TEXT NOT NULL,
            canonical_path TEXT NOT NULL,
            schema_hint    TEXT,
            row_count      INTEGER NOT NULL,
            bytes          INTEGER NOT NULL,
            meta           TEXT NOT NULL DEFAULT '{}',
            artifact_id    TEXT NOT NULL,
            content_hash   TEXT NOT NULL,
            commit_seq     INTEGER NOT NULL,
            PRIMARY KEY (run_id, producer, kind)
        );
        CREATE INDEX IF NOT EXISTS idx_runs_d_producer_kind ON runs_d(producer, kind, commit_seq);
        CREATE INDEX IF NOT EXISTS idx_runs_d_created ON runs_d(created_at);

        CREATE TABLE IF NOT EXISTS schema_hints (
            name          TEXT PRIMARY KEY,
            registered_at TEXT NOT NULL
        );
    )SQL",
    // 2: read view
    R"SQL(
        CREATE VIEW IF NOT EXISTS latest_artifacts_v AS
        SELECT r.* FROM runs_d r
        WHERE r.commit_seq = (SELECT MAX(r2.commit_seq) FROM runs_d r2
                              WHERE r2.producer = r.producer AND r2.kind = r.kind);
    )SQL",
};
static_assert(static_cast<int>(std::size(kMigrations)) == CatalogStore::kSchemaVersion);

constexpr const char *kRunsColumns =
    "run_id, producer, kind, created_at, last_seen_at, canonical_path, schema_hint, row_count, "
    "bytes, meta, artifact_id, content_hash, commit_seq";

constexpr const char *kArtifactColumns = "run_id, producer, kind, artifact_id, content_hash, "
                                         "canonical_path, row_count, bytes, schema_hint, meta, "
                                         "committed_at";

// ----------------------------------------------------------------------------
// Statement wrapper
// ----------------------------------------------------------------------------

class Statement
{
  public:
    Statement(sqlite3 *db, const char *sql)
    {
        m_rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
    }
    ~Statement() { sqlite3_finalize(m_stmt); }
    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    [[nodiscard]] bool ok() const noexcept { return m_rc == SQLITE_OK && m_stmt != nullptr; }
    [[nodiscard]] int prepare_rc() const noexcept { return m_rc; }

    Statement &bind(int idx, const std::string &value)
    {
        sqlite3_bind_text(m_stmt, idx, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT);
        return *this;
    }
    Statement &bind(int idx, const std::optional<std::string> &value)
    {
        if (value)
        {
            return bind(idx, *value);
        }
        sqlite3_bind_null(m_stmt, idx);
        return *this;
    }
    Statement &bind(int idx, int64_t value)
    {
        sqlite3_bind_int64(m_stmt, idx, static_cast<sqlite3_int64>(value));
        return *this;
    }

    int step() { return sqlite3_step(m_stmt); }

    [[nodiscard]] std::string text(int col) const
    {
        const auto *p = sqlite3_column_text(m_stmt, col);
        return p == nullptr ? std::string{} : std::string(reinterpret_cast<const char *>(p));
    }
    [[nodiscard]] std::optional<std::string> opt_text(int col) const
    {
        if (sqlite3_column_type(m_stmt, col) == SQLITE_NULL)
        {
            return std::nullopt;
        }
        return text(col);
    }
    [[nodiscard]] int64_t int64(int col) const
    {
        return static_cast<int64_t>(sqlite3_column_int64(m_stmt, col));
    }

  private:
    sqlite3_stmt *m_stmt{nullptr};
    int m_rc{SQLITE_ERROR};
};

json parse_meta(const std::string &text)
{
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    return (j.is_discarded() || !j.is_object()) ? json::object() : j;
}

CatalogEntry read_runs_row(const Statement &st)
{
    CatalogEntry e;
    e.identity.run_id = st.text(0);
    e.identity.producer = st.text(1);
    e.identity.kind = st.text(2);
    e.created_at = st.text(3);
    e.last_seen_at = st.text(4);
    e.canonical_path = st.text(5);
    e.schema_hint = st.opt_text(6);
    e.rows = st.int64(7);
    e.bytes = static_cast<uint64_t>(st.int64(8));
    e.meta = parse_meta(st.text(9));
    e.identity.artifact_id = st.text(10);
    e.content_hash = st.text(11);
    e.commit_seq = st.int64(12);
    return e;
}

ArtifactRecord read_artifact_row(const Statement &st)
{
    ArtifactRecord r;
    r.identity.run_id = st.text(0);
    r.identity.producer = st.text(1);
    r.identity.kind = st.text(2);
    r.identity.artifact_id = st.text(3);
    r.content_hash = st.text(4);
    r.canonical_path = st.text(5);
    r.rows = st.int64(6);
    r.bytes = static_cast<uint64_t>(st.int64(7));
    r.schema_hint = st.opt_text(8);
    r.meta = parse_meta(st.text(9));
    r.committed_at = st.text(10);
    return r;
}

} // namespace

// ============================================================================
// Impl
// ============================================================================

struct CatalogStore::Impl
{
    sqlite3 *db{nullptr};
    fs::path path;
    Mode mode{Mode::ReadOnly};
    mutable std::mutex mutex;

    ~Impl()
    {
        if (db != nullptr)
        {
            sqlite3_close_v2(db);
        }
    }

    template <typename T> BusResult<T> sql_error(std::string_view what, int rc) const
    {
        return BusResult<T>::error(BusError::CatalogError, rc,
                                   fmt::format("{} failed on '{}': {} ({})", what, path.string(),
                                               sqlite3_errmsg(db), sqlite3_errstr(rc)));
    }

    BusStatus exec(const char *sql, std::string_view what) const
    {
        char *err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK)
        {
            std::string msg = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
            sqlite3_free(err_msg);
            return BusStatus::error(BusError::CatalogError, rc,
                                    fmt::format("{} failed on '{}': {}", what, path.string(), msg));
        }
        return ok_status();
    }

    BusResult<int> user_version() const
    {
        Statement st(db, "PRAGMA user_version");
        if (!st.ok())
        {
            return sql_error<int>("PRAGMA user_version", st.prepare_rc());
        }
        const int rc = st.step();
        if (rc != SQLITE_ROW)
        {
            return sql_error<int>("PRAGMA user_version", rc);
        }
        return BusResult<int>::ok(static_cast<int>(st.int64(0)));
    }

    // CatalogSchemaMissing unless every migration has been applied.
    BusStatus require_schema() const
    {
        auto version = user_version();
        if (version.is_error())
        {
            return BusStatus::error_from(version);
        }
        if (version.content() < kSchemaVersion)
        {
            return BusStatus::error(BusError::CatalogSchemaMissing, version.content(),
                                    fmt::format("catalog '{}' has schema version {}, need {}",
                                                path.string(), version.content(), kSchemaVersion));
        }
        return ok_status();
    }

    BusStatus require_writable(const CatalogLease &lease) const
    {
        if (mode != Mode::ReadWrite)
        {
            return BusStatus::error(BusError::CatalogError, SQLITE_READONLY,
                                    fmt::format("catalog '{}' is open read-only", path.string()));
        }
        if (!lease.held())
        {
            return BusStatus::error(BusError::CatalogError, 0,
                                    "catalog mutation attempted without a held lease");
        }
        return require_schema();
    }

    template <typename T, typename RowFn>
    BusResult<std::vector<T>> query(Statement &st, std::string_view what, RowFn read_row) const
    {
        std::vector<T> rows;
        int rc;
        while ((rc = st.step()) == SQLITE_ROW)
        {
            rows.push_back(read_row(st));
        }
        if (rc != SQLITE_DONE)
        {
            return sql_error<std::vector<T>>(what, rc);
        }
        return BusResult<std::vector<T>>::ok(std::move(rows));
    }
};

// ============================================================================
// Open / migrate
// ============================================================================

CatalogStore::CatalogStore() : pImpl(std::make_unique<Impl>()) {}

CatalogStore::~CatalogStore() = default;

CatalogStore::Mode CatalogStore::mode() const noexcept
{
    return pImpl->mode;
}

const fs::path &CatalogStore::path() const noexcept
{
    return pImpl->path;
}

BusResult<std::unique_ptr<CatalogStore>> CatalogStore::open(const fs::path &path, Mode mode)
{
    using R = BusResult<std::unique_ptr<CatalogStore>>;
    if (!lifecycle_initialized())
    {
        ABUS_PANIC("FATAL: CatalogStore opened before its module was initialized via "
                   "LifecycleManager. Aborting.");
    }

    std::unique_ptr<CatalogStore> store(new CatalogStore());
    store->pImpl->path = path;
    store->pImpl->mode = mode;

    std::error_code ec;
    if (mode == Mode::ReadOnly && !fs::exists(path, ec))
    {
        return R::error(BusError::CatalogSchemaMissing, 0,
                        fmt::format("catalog '{}' does not exist", path.string()));
    }
    if (mode == Mode::ReadWrite && path.has_parent_path())
    {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
        {
            return R::error(BusError::CatalogError, ec.value(),
                            fmt::format("cannot create directory for catalog '{}': {}",
                                        path.string(), ec.message()));
        }
    }

    const int flags = SQLITE_OPEN_FULLMUTEX |
                      (mode == Mode::ReadOnly ? SQLITE_OPEN_READONLY
                                              : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE));
    const int rc = sqlite3_open_v2(path.c_str(), &store->pImpl->db, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        return store->pImpl->sql_error<std::unique_ptr<CatalogStore>>("open", rc);
    }
    sqlite3_busy_timeout(store->pImpl->db, kBusyTimeoutMs);

    if (mode == Mode::ReadWrite)
    {
        if (auto st = store->pImpl->exec("PRAGMA journal_mode=WAL; PRAGMA synchronous=FULL;",
                                         "configure");
            st.is_error())
        {
            return R::error_from(st);
        }
    }
    else if (auto st = store->pImpl->require_schema(); st.is_error())
    {
        return R::error_from(st);
    }

    LOGGER_DEBUG("CatalogStore: opened '{}' ({})", path.string(),
                 mode == Mode::ReadOnly ? "read-only" : "read-write");
    return R::ok(std::move(store));
}

BusResult<int> CatalogStore::schema_version() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->user_version();
}

BusStatus CatalogStore::migrate()
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->mode != Mode::ReadWrite)
    {
        return BusStatus::error(BusError::CatalogError, SQLITE_READONLY,
                                "migrate() requires a read-write catalog");
    }
    auto version = pImpl->user_version();
    if (version.is_error())
    {
        return BusStatus::error_from(version);
    }
    int current = version.content();
    if (current > kSchemaVersion)
    {
        return BusStatus::error(BusError::CatalogError, current,
                                fmt::format("catalog '{}' has schema version {} newer than this "
                                            "build ({})",
                                            pImpl->path.string(), current, kSchemaVersion));
    }
    while (current < kSchemaVersion)
    {
        const int target = current + 1;
        if (auto st = pImpl->exec("BEGIN IMMEDIATE", "begin migration"); st.is_error())
        {
            return st;
        }
        auto rollback = basics::make_scope_guard(
            [this]
            {
                char *err = nullptr;
                sqlite3_exec(pImpl->db, "ROLLBACK", nullptr, nullptr, &err);
                sqlite3_free(err);
            });
        if (auto st = pImpl->exec(kMigrations[current], "migration"); st.is_error())
        {
            return st;
        }
        const std::string set_version = fmt::format("PRAGMA user_version = {}", target);
        if (auto st = pImpl->exec(set_version.c_str(), "set user_version"); st.is_error())
        {
            return st;
        }
        if (auto st = pImpl->exec("COMMIT", "commit migration"); st.is_error())
        {
            return st;
        }
        rollback.dismiss();
        LOGGER_INFO("CatalogStore: migrated '{}' to schema version {}", pImpl->path.string(),
                    target);
        current = target;
    }
    return ok_status();
}

// ============================================================================
// Mutations
// ============================================================================

BusResult<UpsertOutcome> CatalogStore::upsert(const CatalogLease &lease, const CatalogEntry &entry)
{
    using R = BusResult<UpsertOutcome>;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (auto st = pImpl->require_writable(lease); st.is_error())
    {
        return R::error_from(st);
    }
    sqlite3 *db = pImpl->db;
    const std::string now = format_tools::iso8601_utc_now();
    const std::string meta_text = entry.meta.is_object() ? entry.meta.dump() : "{}";
    const auto &id = entry.identity;

    if (auto st = pImpl->exec("BEGIN IMMEDIATE", "begin upsert"); st.is_error())
    {
        return R::error_from(st);
    }
    auto rollback = basics::make_scope_guard(
        [db]
        {
            char *err = nullptr;
            sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, &err);
            sqlite3_free(err);
        });

    // Write-once check.
    {
        Statement st(db, "SELECT content_hash FROM artifacts "
                         "WHERE run_id = ?1 AND producer = ?2 AND kind = ?3 AND artifact_id = ?4");
        if (!st.ok())
        {
            return pImpl->sql_error<UpsertOutcome>("prepare write-once check", st.prepare_rc());
        }
        st.bind(1, id.run_id).bind(2, id.producer).bind(3, id.kind).bind(4, id.artifact_id);
        const int rc = st.step();
        if (rc == SQLITE_ROW)
        {
            const std::string existing = st.text(0);
            if (existing != entry.content_hash)
            {
                return R::error(BusError::ValidationError, 0,
                                fmt::format("write-once violation: {} already committed with {}, "
                                            "got {}",
                                            id.to_string(), existing, entry.content_hash));
            }
            Statement touch(db, "UPDATE runs_d SET last_seen_at = ?1 WHERE run_id = ?2 AND "
                                "producer = ?3 AND kind = ?4 AND artifact_id = ?5");
            if (!touch.ok())
            {
                return pImpl->sql_error<UpsertOutcome>("prepare touch", touch.prepare_rc());
            }
            touch.bind(1, now).bind(2, id.run_id).bind(3, id.producer).bind(4, id.kind).bind(
                5, id.artifact_id);
            if (const int trc = touch.step(); trc != SQLITE_DONE)
            {
                return pImpl->sql_error<UpsertOutcome>("touch runs_d", trc);
            }
            if (auto c = pImpl->exec("COMMIT", "commit upsert"); c.is_error())
            {
                return R::error_from(c);
            }
            rollback.dismiss();
            return R::ok(UpsertOutcome::AlreadyPresent);
        }
        if (rc != SQLITE_DONE)
        {
            return pImpl->sql_error<UpsertOutcome>("write-once check", rc);
        }
    }

    {
        const std::string sql = fmt::format(
            "INSERT INTO artifacts ({}) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)",
            kArtifactColumns);
        Statement st(db, sql.c_str());
        if (!st.ok())
        {
            return pImpl->sql_error<UpsertOutcome>("prepare insert artifact", st.prepare_rc());
        }
        st.bind(1, id.run_id).bind(2, id.producer).bind(3, id.kind).bind(4, id.artifact_id);
        st.bind(5, entry.content_hash).bind(6, entry.canonical_path).bind(7, entry.rows);
        st.bind(8, static_cast<int64_t>(entry.bytes)).bind(9, entry.schema_hint);
        st.bind(10, meta_text).bind(11, now);
        if (const int rc = st.step(); rc != SQLITE_DONE)
        {
            return pImpl->sql_error<UpsertOutcome>("insert artifact", rc);
        }
    }

    bool existed = false;
    {
        Statement st(db, "SELECT 1 FROM runs_d WHERE run_id = ?1 AND producer = ?2 AND kind = ?3");
        if (!st.ok())
        {
            return pImpl->sql_error<UpsertOutcome>("prepare runs_d lookup", st.prepare_rc());
        }
        st.bind(1, id.run_id).bind(2, id.producer).bind(3, id.kind);
        const int rc = st.step();
        if (rc != SQLITE_ROW && rc != SQLITE_DONE)
        {
            return pImpl->sql_error<UpsertOutcome>("runs_d lookup", rc);
        }
        existed = (rc == SQLITE_ROW);
    }

    {
        const std::string sql = fmt::format(
            "INSERT INTO runs_d ({}) VALUES (?1, ?2, ?3, ?4, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, "
            "(SELECT COALESCE(MAX(commit_seq), 0) + 1 FROM runs_d)) "
            "ON CONFLICT(run_id, producer, kind) DO UPDATE SET "
            "last_seen_at = excluded.last_seen_at, canonical_path = excluded.canonical_path, "
            "schema_hint = excluded.schema_hint, row_count = excluded.row_count, "
            "bytes = excluded.bytes, meta = excluded.meta, artifact_id = excluded.artifact_id, "
            "content_hash = excluded.content_hash, commit_seq = excluded.commit_seq",
            kRunsColumns);
        Statement st(db, sql.c_str());
        if (!st.ok())
        {
            return pImpl->sql_error<UpsertOutcome>("prepare upsert runs_d", st.prepare_rc());
        }
        st.bind(1, id.run_id).bind(2, id.producer).bind(3, id.kind).bind(4, now);
        st.bind(5, entry.canonical_path).bind(6, entry.schema_hint).bind(7, entry.rows);
        st.bind(8, static_cast<int64_t>(entry.bytes)).bind(9, meta_text);
        st.bind(10, id.artifact_id).bind(11, entry.content_hash);
        if (const int rc = st.step(); rc != SQLITE_DONE)
        {
            return pImpl->sql_error<UpsertOutcome>("upsert runs_d", rc);
        }
    }

    if (auto c = pImpl->exec("COMMIT", "commit upsert"); c.is_error())
    {
        return R::error_from(c);
    }
    rollback.dismiss();
    return R::ok(existed ? UpsertOutcome::Updated : UpsertOutcome::Inserted);
}

BusStatus CatalogStore::register_schema_hint(const CatalogLease &lease, const std::string &name)
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (auto st = pImpl->require_writable(lease); st.is_error())
    {
        return st;
    }
    if (name.empty())
    {
        return BusStatus::error(BusError::ValidationError, 0, "schema hint name is empty");
    }
    Statement st(pImpl->db,
                 "INSERT OR IGNORE INTO schema_hints (name, registered_at) VALUES (?1, ?2)");
    if (!st.ok())
    {
        return pImpl->sql_error<std::monostate>("prepare register schema hint", st.prepare_rc());
    }
    st.bind(1, name).bind(2, format_tools::iso8601_utc_now());
    if (const int rc = st.step(); rc != SQLITE_DONE)
    {
        return pImpl->sql_error<std::monostate>("register schema hint", rc);
    }
    return ok_status();
}

// ============================================================================
// Reads
// ============================================================================

BusResult<std::vector<LatestArtifact>>
CatalogStore::latest_artifacts(const std::optional<std::string> &producer,
                               const std::optional<std::string> &kind) const
{
    using R = BusResult<std::vector<LatestArtifact>>;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (auto st = pImpl->require_schema(); st.is_error())
    {
        return R::error_from(st);
    }
    Statement st(pImpl->db,
                 "SELECT run_id, producer, kind, artifact_id, canonical_path, row_count, "
                 "schema_hint, content_hash, last_seen_at, commit_seq FROM latest_artifacts_v "
                 "WHERE (?1 IS NULL OR producer = ?1) AND (?2 IS NULL OR kind = ?2) "
                 "ORDER BY producer, kind");
    if (!st.ok())
    {
        return pImpl->sql_error<std::vector<LatestArtifact>>("prepare latest_artifacts",
                                                             st.prepare_rc());
    }
    st.bind(1, producer).bind(2, kind);
    return pImpl->query<LatestArtifact>(st, "latest_artifacts",
                                        [](const Statement &row)
                                        {
                                            LatestArtifact a;
                                            a.identity.run_id = row.text(0);
                                            a.identity.producer = row.text(1);
                                            a.identity.kind = row.text(2);
                                            a.identity.artifact_id = row.text(3);
                                            a.canonical_path = row.text(4);
                                            a.rows = row.int64(5);
                                            a.schema_hint = row.opt_text(6);
                                            a.content_hash = row.text(7);
                                            a.last_seen_at = row.text(8);
                                            a.commit_seq = row.int64(9);
                                            return a;
                                        });
}

BusResult<std::optional<ArtifactRecord>>
CatalogStore::find_artifact(const ArtifactIdentity &identity) const
{
    using R = BusResult<std::optional<ArtifactRecord>>;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (auto st = pImpl->require_schema(); st.is_error())
    {
        return R::error_from(st);
    }
    const std::string sql = fmt::format("SELECT {} FROM artifacts WHERE run_id = ?1 AND "
                                        "producer = ?2 AND kind = ?3 AND artifact_id = ?4",
                                        kArtifactColumns);
    Statement st(pImpl->db, sql.c_str());
    if (!st.ok())
    {
        return pImpl->sql_error<std::optional<ArtifactRecord>>("prepare find_artifact",
                                                               st.prepare_rc());
    }
    st.bind(1, identity.run_id).bind(2, identity.producer).bind(3, identity.kind);
    st.bind(4, identity.artifact_id);
    const int rc = st.step();
    if (rc == SQLITE_ROW)
    {
        return R::ok(read_artifact_row(st));
    }
    if (rc != SQLITE_DONE)
    {
        return pImpl->sql_error<std::optional<ArtifactRecord>>("find_artifact", rc);
    }
    return R::ok(std::nullopt);
}

BusResult<std::vector<CatalogEntry>> CatalogStore::list_runs(const RunFilter &filter) const
{
    using R = BusResult<std::vector<CatalogEntry>>;
    if (filter.limit < 1 || filter.limit > kMaxRunLimit)
    {
        return R::error(BusError::ValidationError, 0,
                        fmt::format("limit must be 1..{}, got {}", kMaxRunLimit, filter.limit));
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (auto st = pImpl->require_schema(); st.is_error())
    {
        return R::error_from(st);
    }
    const std::string sql = fmt::format(
        "SELECT {} FROM runs_d WHERE (?1 IS NULL OR producer = ?1) AND (?2 IS NULL OR kind = ?2) "
        "AND (?3 IS NULL OR run_id = ?3) AND (?4 IS NULL OR created_at >= ?4) "
        "AND (?5 IS NULL OR created_at <= ?5) ORDER BY created_at DESC, commit_seq DESC LIMIT ?6",
        kRunsColumns);
    Statement st(pImpl->db, sql.c_str());
    if (!st.ok())
    {
        return pImpl->sql_error<std::vector<CatalogEntry>>("prepare list_runs", st.prepare_rc());
    }
    st.bind(1, filter.producer).bind(2, filter.kind).bind(3, filter.run_id);
    st.bind(4, filter.created_from).bind(5, filter.created_to);
    st.bind(6, static_cast<int64_t>(filter.limit));
    return pImpl->query<CatalogEntry>(st, "list_runs", read_runs_row);
}

BusResult<std::vector<CatalogEntry>> CatalogStore::all_entries() const
{
    using R = BusResult<std::vector<CatalogEntry>>;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (auto st = pImpl->require_schema(); st.is_error())
    {
        return R::error_from(st);
    }
    const std::string sql = fmt::format("SELECT {} FROM runs_d ORDER BY commit_seq", kRunsColumns);
    Statement st(pImpl->db, sql.c_str());
    if (!st.ok())
    {
        return pImpl->sql_error<std::vector<CatalogEntry>>("prepare all_entries", st.prepare_rc());
    }
    return pImpl->query<CatalogEntry>(st, "all_entries", read_runs_row);
}

BusResult<std::vector<ArtifactRecord>> CatalogStore::all_artifacts() const
{
    using R = BusResult<std::vector<ArtifactRecord>>;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (auto st = pImpl->require_schema(); st.is_error())
    {
        return R::error_from(st);
    }
    const std::string sql =
        fmt::format("SELECT {} FROM artifacts ORDER BY committed_at", kArtifactColumns);
    Statement st(pImpl->db, sql.c_str());
    if (!st.ok())
    {
        return pImpl->sql_error<std::vector<ArtifactRecord>>("prepare all_artifacts",
                                                             st.prepare_rc());
    }
    return pImpl->query<ArtifactRecord>(st, "all_artifacts", read_artifact_row);
}

BusResult<bool> CatalogStore::is_known_schema_hint(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (auto st = pImpl->require_schema(); st.is_error())
    {
        return BusResult<bool>::error_from(st);
    }
    Statement st(pImpl->db, "SELECT 1 FROM schema_hints WHERE name = ?1");
    if (!st.ok())
    {
        return pImpl->sql_error<bool>("prepare schema hint lookup", st.prepare_rc());
    }
    st.bind(1, name);
    const int rc = st.step();
    if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    {
        return pImpl->sql_error<bool>("schema hint lookup", rc);
    }
    return BusResult<bool>::ok(rc == SQLITE_ROW);
}

BusResult<std::vector<std::string>> CatalogStore::schema_hints() const
{
    using R = BusResult<std::vector<std::string>>;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (auto st = pImpl->require_schema(); st.is_error())
    {
        return R::error_from(st);
    }
    Statement st(pImpl->db, "SELECT name FROM schema_hints ORDER BY name");
    if (!st.ok())
    {
        return pImpl->sql_error<std::vector<std::string>>("prepare schema_hints", st.prepare_rc());
    }
    return pImpl->query<std::string>(st, "schema_hints",
                                     [](const Statement &row) { return row.text(0); });
}

CatalogHealth CatalogStore::health_check() const
{
    CatalogHealth health;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto version = pImpl->user_version();
    if (version.is_error())
    {
        health.error = version.error_message();
        return health;
    }
    health.schema_version = version.content();
    if (health.schema_version < kSchemaVersion)
    {
        health.error = fmt::format("schema version {} < {}", health.schema_version, kSchemaVersion);
        return health;
    }
    Statement st(pImpl->db, "SELECT COUNT(*) FROM runs_d");
    const int rc = st.ok() ? st.step() : st.prepare_rc();
    if (rc != SQLITE_ROW)
    {
        health.error = fmt::format("health query failed: {}", sqlite3_errstr(rc));
        return health;
    }
    health.available = true;
    return health;
}

const char *to_string(UpsertOutcome outcome) noexcept
{
    switch (outcome)
    {
    case UpsertOutcome::Inserted:
        return "inserted";
    case UpsertOutcome::Updated:
        return "updated";
    case UpsertOutcome::AlreadyPresent:
        return "already-present";
    }
    return "unknown";
}

// ============================================================================
// Lifecycle
// ============================================================================

bool CatalogStore::lifecycle_initialized() noexcept
{
    return g_catalog_initialized.load(std::memory_order_acquire);
}

namespace
{
void do_catalog_startup(const char *arg)
{
    (void)arg;
    const int rc = sqlite3_initialize();
    if (rc != SQLITE_OK)
    {
        throw std::runtime_error(
            fmt::format("CatalogStore: sqlite3_initialize failed: {}", sqlite3_errstr(rc)));
    }
    if (sqlite3_threadsafe() == 0)
    {
        throw std::runtime_error("CatalogStore: SQLite was built without thread safety");
    }
    LOGGER_DEBUG("CatalogStore: SQLite {} initialized", sqlite3_libversion());
    g_catalog_initialized.store(true, std::memory_order_release);
}

void do_catalog_shutdown(const char *arg)
{
    (void)arg;
    g_catalog_initialized.store(false, std::memory_order_release);
    sqlite3_shutdown();
}
} // namespace

utils::ModuleDef CatalogStore::GetLifecycleModule()
{
    utils::ModuleDef module("CatalogStore");
    module.depends_on("Logger");
    module.on_start(&do_catalog_startup);
    module.on_stop(&do_catalog_shutdown, kCatalogShutdownTimeoutMs);
    return module;
}

} // namespace artbus::bus
