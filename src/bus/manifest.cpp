#include "abus_service.hpp"
#include "bus/manifest.hpp"

#include <chrono>

using nlohmann::json;

namespace artbus::bus
{

namespace
{

BusResult<Manifest> invalid(std::string message)
{
    return BusResult<Manifest>::error(BusError::ValidationError, 0,
                                      "malformed manifest: " + std::move(message));
}

bool is_plain_file_name(std::string_view name) noexcept
{
    return !name.empty() && name.front() != '.' && name.find('/') == std::string_view::npos &&
           name.find('\0') == std::string_view::npos;
}

// Reads a required string member; nullopt names the problem in `why`.
std::optional<std::string> required_string(const json &j, const char *key, std::string &why)
{
    const auto it = j.find(key);
    if (it == j.end())
    {
        why = fmt::format("missing required field '{}'", key);
        return std::nullopt;
    }
    if (!it->is_string())
    {
        why = fmt::format("field '{}' must be a string", key);
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

json Manifest::to_json() const
{
    json j;
    j["manifest_version"] = manifest_version;
    j["job_id"] = job_id;
    j["run_id"] = identity.run_id;
    j["producer"] = identity.producer;
    j["kind"] = identity.kind;
    j["artifact_id"] = identity.artifact_id;
    j["data_file"] = data_file;
    j["schema_hint"] = schema_hint ? json(*schema_hint) : json(nullptr);
    j["rows"] = rows;
    j["bytes"] = bytes;
    j["content_hash"] = content_hash;
    j["meta"] = meta;
    j["submitted_at"] = submitted_at;
    j["producer_pid"] = producer_pid;
    return j;
}

BusResult<Manifest> Manifest::from_json(const json &j)
{
    if (!j.is_object())
    {
        return invalid("top level is not a JSON object");
    }

    Manifest m;
    std::string why;

    const auto version = j.find("manifest_version");
    if (version == j.end() || !version->is_number_integer())
    {
        return invalid("missing or non-integer 'manifest_version'");
    }
    if (version->get<int64_t>() != kManifestVersion)
    {
        return invalid(fmt::format("unsupported manifest_version {} (expected {})",
                                   version->get<int64_t>(), kManifestVersion));
    }

    auto job_id = required_string(j, "job_id", why);
    if (!job_id)
    {
        return invalid(why);
    }
    if (!is_valid_identifier(*job_id))
    {
        return invalid(fmt::format("invalid job_id '{}'", *job_id));
    }
    m.job_id = std::move(*job_id);

    std::string *identity_fields[] = {&m.identity.run_id, &m.identity.producer, &m.identity.kind,
                                      &m.identity.artifact_id};
    const char *identity_keys[] = {"run_id", "producer", "kind", "artifact_id"};
    for (size_t i = 0; i < 4; ++i)
    {
        auto value = required_string(j, identity_keys[i], why);
        if (!value)
        {
            return invalid(why);
        }
        *identity_fields[i] = std::move(*value);
    }
    if (auto status = validate_identity(m.identity); status.is_error())
    {
        return BusResult<Manifest>::error_from(status);
    }

    auto data_file = required_string(j, "data_file", why);
    if (!data_file)
    {
        return invalid(why);
    }
    if (!is_plain_file_name(*data_file))
    {
        return invalid(fmt::format("data_file '{}' is not a plain file name", *data_file));
    }
    m.data_file = std::move(*data_file);

    if (const auto hint = j.find("schema_hint"); hint != j.end() && !hint->is_null())
    {
        if (!hint->is_string() || hint->get<std::string>().empty())
        {
            return invalid("field 'schema_hint' must be a non-empty string or null");
        }
        m.schema_hint = hint->get<std::string>();
    }

    const auto rows = j.find("rows");
    if (rows == j.end() || !rows->is_number_integer())
    {
        return invalid("missing or non-integer 'rows'");
    }
    if (rows->is_number_unsigned())
    {
        m.rows = static_cast<int64_t>(rows->get<uint64_t>());
    }
    else
    {
        m.rows = rows->get<int64_t>();
    }
    if (m.rows < 0)
    {
        return BusResult<Manifest>::error(BusError::ValidationError, 0,
                                          fmt::format("rows must be >= 0, got {}", m.rows));
    }

    const auto bytes = j.find("bytes");
    if (bytes == j.end() || !bytes->is_number_unsigned())
    {
        return invalid("missing or non-negative-integer 'bytes'");
    }
    m.bytes = bytes->get<uint64_t>();

    auto content_hash = required_string(j, "content_hash", why);
    if (!content_hash)
    {
        return invalid(why);
    }
    if (!crypto::is_valid_content_hash(*content_hash))
    {
        return invalid(fmt::format("content_hash '{}' is not of the form {}<64 lowercase hex>",
                                   *content_hash, crypto::kContentHashPrefix));
    }
    m.content_hash = std::move(*content_hash);

    if (const auto meta = j.find("meta"); meta != j.end() && !meta->is_null())
    {
        if (!meta->is_object())
        {
            return invalid("field 'meta' must be an object");
        }
        m.meta = *meta;
    }
    if (const auto at = j.find("submitted_at"); at != j.end() && !at->is_null())
    {
        if (!at->is_string())
        {
            return invalid("field 'submitted_at' must be a string");
        }
        m.submitted_at = at->get<std::string>();
    }
    if (const auto pid = j.find("producer_pid"); pid != j.end() && !pid->is_null())
    {
        if (!pid->is_number_unsigned())
        {
            return invalid("field 'producer_pid' must be a non-negative integer");
        }
        m.producer_pid = pid->get<uint64_t>();
    }

    return BusResult<Manifest>::ok(std::move(m));
}

BusResult<Manifest> Manifest::parse(std::string_view text)
{
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded())
    {
        return invalid("not well-formed JSON");
    }
    return from_json(j);
}

std::string make_job_id()
{
    return fmt::format("job-{}-{:016x}",
                       format_tools::epoch_millis(std::chrono::system_clock::now()),
                       crypto::generate_random_u64());
}

std::string manifest_file_name(std::string_view job_id)
{
    return fmt::format("{}{}", job_id, kManifestSuffix);
}

std::string data_file_name(std::string_view job_id)
{
    return fmt::format("{}{}", job_id, kDataSuffix);
}

} // namespace artbus::bus
