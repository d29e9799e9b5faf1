#pragma once
/**
 * @file producer_client.hpp
 * @brief Producer side of the bus: submits an artifact into the inbox.
 *
 * A submission is a pair of files in the inbox:
 *
 *     <job_id>.parquet          copied from the producer's data file
 *     <job_id>.manifest.json    written last; its appearance commits the job
 *
 * Both are written through hidden temp files and renamed into place, so the daemon
 * never sees a partial file. The client never touches the catalog or the store.
 */
#include "bus/bus_types.hpp"
#include "bus/storage_backend.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace artbus::bus
{

struct SubmitRequest
{
    ArtifactIdentity identity;
    std::filesystem::path data_path;
    std::optional<std::string> schema_hint;
    int64_t rows{0};
    nlohmann::json meta = nlohmann::json::object();
};

struct SubmitReceipt
{
    std::string job_id;
    std::string content_hash;
    uint64_t bytes{0};
    std::filesystem::path manifest_path;
    std::filesystem::path data_path;
};

class ARTBUS_EXPORT ProducerClient
{
  public:
    ProducerClient(StorageBackend &backend, std::filesystem::path inbox_dir);

    /**
     * @brief Validates, hashes and submits one artifact.
     *
     * Fails with ValidationError for a bad identity, negative rows or non-object
     * meta, and with IoError when the data file cannot be read or the inbox
     * written. On failure nothing this call wrote remains in the inbox.
     */
    BusResult<SubmitReceipt> submit_artifact(const SubmitRequest &request);

    [[nodiscard]] const std::filesystem::path &inbox_dir() const noexcept { return m_inbox_dir; }

  private:
    StorageBackend &m_backend;
    std::filesystem::path m_inbox_dir;
};

} // namespace artbus::bus
