#pragma once
/**
 * @file export_engine.hpp
 * @brief Golden files per (producer, kind) and the export status ledger.
 *
 * For each (producer, kind) with a committed artifact the engine keeps
 * `exports/<producer>/<kind>/latest.parquet` equal to the catalog's latest
 * canonical file, and records every attempt in `exports/export_status.json`:
 *
 * @code{.json}
 * {
 *   "last_run_at": "2026-10-17T12:00:01.250Z",
 *   "exports": {
 *     "simulation/fills": {
 *       "status": "ok", "at": "...", "source_path": ".../r1/fills-0001.parquet",
 *       "content_hash": "blake2b-256:...", "golden_path": ".../latest.parquet", "error": ""
 *     }
 *   }
 * }
 * @endcode
 *
 * The engine reads the catalog through a const handle and never takes the catalog
 * lock. Failures are recorded in the ledger and logged; they never reach ingestion.
 */
#include "bus/bus_types.hpp"
#include "bus/catalog_store.hpp"
#include "bus/storage_backend.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace artbus::bus
{

struct ExportOutcome
{
    std::string status; // "ok" or "error"
    std::string at;
    std::string source_path;
    std::string content_hash;
    std::string golden_path;
    std::string error;

    [[nodiscard]] bool ok() const noexcept { return status == "ok"; }
};

struct ExportLedger
{
    std::string last_run_at;
    /// Keyed by "producer/kind".
    std::map<std::string, ExportOutcome> exports;

    [[nodiscard]] ARTBUS_EXPORT nlohmann::json to_json() const;
    ARTBUS_EXPORT static ExportLedger from_json(const nlohmann::json &j);
};

class ARTBUS_EXPORT ExportEngine
{
  public:
    ExportEngine(StorageBackend &backend, const CatalogStore &catalog,
                 std::filesystem::path export_dir);
    ~ExportEngine();

    ExportEngine(const ExportEngine &) = delete;
    ExportEngine &operator=(const ExportEngine &) = delete;

    /// Queues (producer, kind); duplicates collapse. Wakes the worker if running.
    void request_refresh(const std::string &producer, const std::string &kind);

    /// Processes every queued request on the calling thread. Returns the number of
    /// golden files rewritten.
    size_t drain();

    /// Queues every (producer, kind) known to the catalog, then drains.
    size_t refresh_all();

    /// Starts a background worker that drains whenever requests arrive.
    void start();

    /// Stops the worker after it finishes the request in progress. Idempotent.
    void stop();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] size_t pending() const;

    /// Snapshot of the ledger.
    [[nodiscard]] ExportLedger ledger() const;

    [[nodiscard]] std::filesystem::path golden_path(const std::string &producer,
                                                    const std::string &kind) const;
    [[nodiscard]] std::filesystem::path ledger_path() const;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace artbus::bus
