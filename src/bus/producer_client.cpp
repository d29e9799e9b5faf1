#include "abus_service.hpp"
#include "bus/manifest.hpp"
#include "bus/producer_client.hpp"

namespace fs = std::filesystem;

namespace artbus::bus
{

ProducerClient::ProducerClient(StorageBackend &backend, fs::path inbox_dir)
    : m_backend(backend), m_inbox_dir(std::move(inbox_dir))
{
}

BusResult<SubmitReceipt> ProducerClient::submit_artifact(const SubmitRequest &request)
{
    using R = BusResult<SubmitReceipt>;

    // ── Local validation ─────────────────────────────────────────────────────
    if (auto status = validate_identity(request.identity); status.is_error())
    {
        return R::error_from(status);
    }
    if (request.rows < 0)
    {
        return R::error(BusError::ValidationError, 0,
                        fmt::format("rows must be >= 0, got {}", request.rows));
    }
    if (!request.meta.is_object())
    {
        return R::error(BusError::ValidationError, 0, "meta must be a JSON object");
    }
    if (request.schema_hint && request.schema_hint->empty())
    {
        return R::error(BusError::ValidationError, 0, "schema_hint must not be empty");
    }

    auto size = m_backend.file_size(request.data_path);
    if (size.is_error())
    {
        return R::error(BusError::IoError, size.error_code(),
                        "data file not readable: " + size.error_message());
    }
    auto hash = m_backend.hash_file(request.data_path);
    if (hash.is_error())
    {
        return R::error(BusError::IoError, hash.error_code(),
                        "cannot hash data file: " + hash.error_message());
    }

    Manifest manifest;
    manifest.job_id = make_job_id();
    manifest.identity = request.identity;
    manifest.data_file = data_file_name(manifest.job_id);
    manifest.schema_hint = request.schema_hint;
    manifest.rows = request.rows;
    manifest.bytes = size.content();
    manifest.content_hash = hash.content();
    manifest.meta = request.meta;
    manifest.submitted_at = format_tools::iso8601_utc_now();
    manifest.producer_pid = platform::get_pid();

    const fs::path data_dst = m_inbox_dir / manifest.data_file;
    const fs::path manifest_dst = m_inbox_dir / manifest_file_name(manifest.job_id);

    // ── Data first, manifest last ────────────────────────────────────────────
    if (auto copied = m_backend.copy_file_atomic(request.data_path, data_dst); copied.is_error())
    {
        // A failed copy can leave dst behind on backends without temp staging.
        if (auto removed = m_backend.remove(data_dst); removed.is_error())
        {
            LOGGER_ERROR("ProducerClient: cleanup of '{}' failed: {}", data_dst.string(),
                         removed.error_message());
        }
        return R::error(BusError::IoError, copied.error_code(),
                        "cannot copy data into inbox: " + copied.error_message());
    }
    auto remove_data = basics::make_scope_guard(
        [&]
        {
            if (auto removed = m_backend.remove(data_dst); removed.is_error())
            {
                LOGGER_ERROR("ProducerClient: cleanup of '{}' failed: {}", data_dst.string(),
                             removed.error_message());
            }
        });

    if (auto written = m_backend.write_file_atomic(manifest_dst, manifest.to_json().dump(4));
        written.is_error())
    {
        return R::error(BusError::IoError, written.error_code(),
                        "cannot write manifest: " + written.error_message());
    }
    remove_data.dismiss();

    LOGGER_INFO("ProducerClient: submitted job {} for {} ({} bytes, {})", manifest.job_id,
                request.identity.to_string(), manifest.bytes, manifest.content_hash);

    SubmitReceipt receipt;
    receipt.job_id = manifest.job_id;
    receipt.content_hash = manifest.content_hash;
    receipt.bytes = manifest.bytes;
    receipt.manifest_path = manifest_dst;
    receipt.data_path = data_dst;
    return R::ok(std::move(receipt));
}

} // namespace artbus::bus
