#include "bus/bus_types.hpp"

#include <fmt/format.h>

namespace artbus::bus
{

const char *to_string(BusError err) noexcept
{
    switch (err)
    {
    case BusError::ValidationError:
        return "ValidationError";
    case BusError::LockTimeout:
        return "LockTimeout";
    case BusError::CommitIOError:
        return "CommitIOError";
    case BusError::ExportError:
        return "ExportError";
    case BusError::CatalogSchemaMissing:
        return "CatalogSchemaMissing";
    case BusError::CatalogError:
        return "CatalogError";
    case BusError::IoError:
        return "IoError";
    case BusError::Corruption:
        return "Corruption";
    }
    return "Unknown";
}

const char *to_string(JobState state) noexcept
{
    switch (state)
    {
    case JobState::Incoming:
        return "Incoming";
    case JobState::Validated:
        return "Validated";
    case JobState::Committed:
        return "Committed";
    case JobState::Rejected:
        return "Rejected";
    case JobState::Deferred:
        return "Deferred";
    }
    return "Unknown";
}

bool is_valid_identifier(std::string_view value) noexcept
{
    if (value.empty() || value.size() > kMaxIdentifierLen || value.front() == '.')
    {
        return false;
    }
    for (const char c : value)
    {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '_' || c == '.' || c == ':' || c == '-';
        if (!ok)
        {
            return false;
        }
    }
    return true;
}

std::string ArtifactIdentity::to_string() const
{
    return fmt::format("{}/{}/{}/{}", producer, kind, run_id, artifact_id);
}

BusStatus validate_identity(const ArtifactIdentity &identity)
{
    const std::pair<const char *, const std::string *> fields[] = {
        {"run_id", &identity.run_id},
        {"producer", &identity.producer},
        {"kind", &identity.kind},
        {"artifact_id", &identity.artifact_id},
    };
    for (const auto &[name, value] : fields)
    {
        if (!is_valid_identifier(*value))
        {
            return BusStatus::error(
                BusError::ValidationError, 0,
                fmt::format("invalid {} '{}': expected 1..{} chars from [A-Za-z0-9_.:-], "
                            "not starting with '.'",
                            name, *value, kMaxIdentifierLen));
        }
    }
    return ok_status();
}

} // namespace artbus::bus
