#pragma once
/**
 * @file artifact_store.hpp
 * @brief Write-once store of committed artifacts plus durable commit markers.
 *
 * Layout under `store_dir`:
 *
 *     <producer>/<kind>/<run_id>/<artifact_id>.parquet   committed artifacts
 *     .pending/<job_id>.json                              commit markers
 *
 * A marker is written before an artifact is moved into the store and removed only
 * after its catalog row exists, so after a crash "stored but not cataloged" can be
 * told apart from "committed".
 */
#include "bus/bus_types.hpp"
#include "bus/manifest.hpp"
#include "bus/storage_backend.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace artbus::bus
{

struct CommitMarker
{
    Manifest manifest;
    std::string canonical_path;
    std::string inbox_data;
    std::string inbox_manifest;
    std::string started_at;

    [[nodiscard]] ARTBUS_EXPORT nlohmann::json to_json() const;
    ARTBUS_EXPORT static BusResult<CommitMarker> from_json(const nlohmann::json &j);
};

enum class CommitOutcome
{
    Moved,
    AlreadyPresent
};

class ARTBUS_EXPORT ArtifactStore
{
  public:
    ArtifactStore(StorageBackend &backend, std::filesystem::path store_dir);

    [[nodiscard]] const std::filesystem::path &root() const noexcept { return m_store_dir; }
    [[nodiscard]] std::filesystem::path pending_dir() const { return m_store_dir / ".pending"; }

    /// `<store>/<producer>/<kind>/<run_id>/<artifact_id>.parquet`. Deterministic.
    [[nodiscard]] std::filesystem::path canonical_path(const ArtifactIdentity &identity) const;

    [[nodiscard]] std::filesystem::path marker_path(const std::string &job_id) const;

    BusStatus write_marker(const CommitMarker &marker);

    /// Markers in job-id order. Unparseable markers are logged and left in place.
    BusResult<std::vector<CommitMarker>> list_markers() const;

    [[nodiscard]] bool has_marker(const std::string &job_id) const;
    BusStatus clear_marker(const std::string &job_id);

    /**
     * @brief Moves `inbox_data` to the canonical path of `identity`.
     *
     * If the canonical file already exists with `content_hash`, the inbox copy is
     * discarded and AlreadyPresent returned. Existing different content is a
     * ValidationError; any failed move is CommitIOError and leaves the inbox file.
     */
    BusResult<CommitOutcome> commit(const std::filesystem::path &inbox_data,
                                    const ArtifactIdentity &identity,
                                    const std::string &content_hash);

    /// Every committed file (markers excluded).
    BusResult<std::vector<std::filesystem::path>> stored_files() const;

  private:
    StorageBackend &m_backend;
    std::filesystem::path m_store_dir;
};

} // namespace artbus::bus
