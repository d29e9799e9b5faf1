#include "abus_service.hpp"
#include "bus/artifact_store.hpp"

#include <cerrno>

namespace fs = std::filesystem;
using nlohmann::json;

namespace artbus::bus
{

namespace
{
constexpr std::string_view kMarkerSuffix = ".json";
}

json CommitMarker::to_json() const
{
    return json{{"job_id", manifest.job_id},
                {"canonical_path", canonical_path},
                {"inbox_data", inbox_data},
                {"inbox_manifest", inbox_manifest},
                {"started_at", started_at},
                {"manifest", manifest.to_json()}};
}

BusResult<CommitMarker> CommitMarker::from_json(const json &j)
{
    using R = BusResult<CommitMarker>;
    if (!j.is_object() || !j.contains("manifest"))
    {
        return R::error(BusError::Corruption, 0, "commit marker has no manifest");
    }
    auto manifest = Manifest::from_json(j["manifest"]);
    if (manifest.is_error())
    {
        return R::error(BusError::Corruption, 0,
                        "commit marker manifest invalid: " + manifest.error_message());
    }
    CommitMarker m;
    m.manifest = std::move(manifest).content();
    for (auto [key, field] : {std::pair{"canonical_path", &m.canonical_path},
                              std::pair{"inbox_data", &m.inbox_data},
                              std::pair{"inbox_manifest", &m.inbox_manifest}})
    {
        if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty())
        {
            return R::error(BusError::Corruption, 0,
                            fmt::format("commit marker field '{}' missing", key));
        }
        *field = j[key].get<std::string>();
    }
    if (j.contains("started_at") && j["started_at"].is_string())
    {
        m.started_at = j["started_at"].get<std::string>();
    }
    return R::ok(std::move(m));
}

ArtifactStore::ArtifactStore(StorageBackend &backend, fs::path store_dir)
    : m_backend(backend), m_store_dir(std::move(store_dir))
{
}

fs::path ArtifactStore::canonical_path(const ArtifactIdentity &identity) const
{
    return m_store_dir / identity.producer / identity.kind / identity.run_id /
           (identity.artifact_id + std::string(kDataSuffix));
}

fs::path ArtifactStore::marker_path(const std::string &job_id) const
{
    return pending_dir() / (job_id + std::string(kMarkerSuffix));
}

BusStatus ArtifactStore::write_marker(const CommitMarker &marker)
{
    auto status = m_backend.write_file_atomic(marker_path(marker.manifest.job_id),
                                              marker.to_json().dump(4));
    if (status.is_error())
    {
        return BusStatus::error(BusError::CommitIOError, status.error_code(),
                                "cannot write commit marker: " + status.error_message());
    }
    return status;
}

BusResult<std::vector<CommitMarker>> ArtifactStore::list_markers() const
{
    using R = BusResult<std::vector<CommitMarker>>;
    auto entries = m_backend.list(pending_dir());
    if (entries.is_error())
    {
        return R::error_from(entries);
    }
    std::vector<CommitMarker> markers;
    for (const auto &entry : entries.content())
    {
        if (entry.is_directory || !entry.name.ends_with(kMarkerSuffix))
        {
            continue;
        }
        const fs::path path = pending_dir() / entry.name;
        auto text = m_backend.read_file(path);
        if (text.is_error())
        {
            LOGGER_ERROR("ArtifactStore: cannot read commit marker '{}': {}", path.string(),
                         text.error_message());
            continue;
        }
        json j = json::parse(text.content(), nullptr, /*allow_exceptions=*/false);
        auto marker = CommitMarker::from_json(j);
        if (marker.is_error())
        {
            LOGGER_ERROR("ArtifactStore: unusable commit marker '{}': {}", path.string(),
                         marker.error_message());
            continue;
        }
        markers.push_back(std::move(marker).content());
    }
    return R::ok(std::move(markers));
}

bool ArtifactStore::has_marker(const std::string &job_id) const
{
    return m_backend.exists(marker_path(job_id));
}

BusStatus ArtifactStore::clear_marker(const std::string &job_id)
{
    return m_backend.remove(marker_path(job_id));
}

BusResult<CommitOutcome> ArtifactStore::commit(const fs::path &inbox_data,
                                               const ArtifactIdentity &identity,
                                               const std::string &content_hash)
{
    using R = BusResult<CommitOutcome>;
    const fs::path dst = canonical_path(identity);

    auto moved = m_backend.rename_no_replace(inbox_data, dst);
    if (moved.is_ok())
    {
        return R::ok(CommitOutcome::Moved);
    }
    if (moved.error_code() != EEXIST)
    {
        return R::error(BusError::CommitIOError, moved.error_code(),
                        fmt::format("cannot move {} into the store: {}", identity.to_string(),
                                    moved.error_message()));
    }

    auto existing = m_backend.hash_file(dst);
    if (existing.is_error())
    {
        return R::error(BusError::CommitIOError, existing.error_code(),
                        "cannot hash existing store file: " + existing.error_message());
    }
    if (existing.content() != content_hash)
    {
        return R::error(BusError::ValidationError, 0,
                        fmt::format("write-once violation: {} is already stored with {}, got {}",
                                    dst.string(), existing.content(), content_hash));
    }
    if (auto removed = m_backend.remove(inbox_data); removed.is_error())
    {
        LOGGER_WARN("ArtifactStore: duplicate inbox data '{}' not removed: {}",
                    inbox_data.string(), removed.error_message());
    }
    return R::ok(CommitOutcome::AlreadyPresent);
}

BusResult<std::vector<fs::path>> ArtifactStore::stored_files() const
{
    return m_backend.list_files_recursive(m_store_dir);
}

} // namespace artbus::bus
