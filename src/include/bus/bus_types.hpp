#pragma once
/**
 * @file bus_types.hpp
 * @brief Error taxonomy, result aliases, artifact identity and job state of the bus.
 */
#include "artbus_export.h"
#include "utils/result.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace artbus::bus
{

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Failure kinds of bus operations.
 *
 * | Kind                 | Handling                                            |
 * |----------------------|-----------------------------------------------------|
 * | ValidationError      | job rejected, never retried                         |
 * | LockTimeout          | job deferred, retried on a later scan               |
 * | CommitIOError        | store move failed; job stays in the inbox           |
 * | ExportError          | recorded in the export ledger only                  |
 * | CatalogSchemaMissing | daemon runs migrations; readers see the error       |
 * | CatalogError         | SQLite failure; transient for the daemon            |
 * | IoError              | producer side or generic filesystem failure         |
 * | Corruption           | catalog row whose store file is missing             |
 */
enum class BusError : int
{
    ValidationError = 1,
    LockTimeout,
    CommitIOError,
    ExportError,
    CatalogSchemaMissing,
    CatalogError,
    IoError,
    Corruption
};

ARTBUS_EXPORT const char *to_string(BusError err) noexcept;

template <typename T> using BusResult = utils::Result<T, BusError>;

/// Result of an operation that produces no value.
using BusStatus = BusResult<std::monostate>;

[[nodiscard]] inline BusStatus ok_status()
{
    return BusStatus::ok(std::monostate{});
}

// ============================================================================
// Identity
// ============================================================================

inline constexpr size_t kMaxIdentifierLen = 128;

/**
 * @brief True when `value` is 1..128 chars from [A-Za-z0-9_.:-] and does not
 *        start with '.'. Identity fields become path components, so this rules out
 *        separators, "..", and hidden names.
 */
ARTBUS_EXPORT bool is_valid_identifier(std::string_view value) noexcept;

struct ArtifactIdentity
{
    std::string run_id;
    std::string producer;
    std::string kind;
    std::string artifact_id;

    bool operator==(const ArtifactIdentity &) const = default;

    /// "producer/kind/run_id/artifact_id", for logs.
    [[nodiscard]] ARTBUS_EXPORT std::string to_string() const;
};

/// ValidationError naming the first offending field.
ARTBUS_EXPORT BusStatus validate_identity(const ArtifactIdentity &identity);

// ============================================================================
// Job state
// ============================================================================

enum class JobState
{
    Incoming,
    Validated,
    Committed,
    Rejected,
    Deferred
};

ARTBUS_EXPORT const char *to_string(JobState state) noexcept;

} // namespace artbus::bus
