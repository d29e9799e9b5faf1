#pragma once
/**
 * @file manifest.hpp
 * @brief The JSON descriptor written next to every submitted data file.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "manifest_version": 1,
 *   "job_id":       "job-1760700000000-3f2a9c01d4e5b6a7",
 *   "run_id":       "r1",
 *   "producer":     "simulation",
 *   "kind":         "fills",
 *   "artifact_id":  "fills-0001",
 *   "data_file":    "job-1760700000000-3f2a9c01d4e5b6a7.parquet",
 *   "schema_hint":  "fills_v1",
 *   "rows":         1000,
 *   "bytes":        52311,
 *   "content_hash": "blake2b-256:<64 lowercase hex>",
 *   "meta":         {"strategy": "momentum"},
 *   "submitted_at": "2026-10-17T12:00:00.000Z",
 *   "producer_pid": 4242
 * }
 * @endcode
 *
 * `schema_hint`, `meta`, `submitted_at` and `producer_pid` are optional; every other
 * field is required and type-checked by `Manifest::from_json`.
 */
#include "bus/bus_types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace artbus::bus
{

inline constexpr int kManifestVersion = 1;
inline constexpr std::string_view kManifestSuffix = ".manifest.json";
inline constexpr std::string_view kDataSuffix = ".parquet";
inline constexpr std::string_view kReasonSuffix = ".reason.json";

/// Hint value treated like an absent schema hint.
inline constexpr std::string_view kUntypedSchemaHint = "untyped";

struct Manifest
{
    int manifest_version{kManifestVersion};
    std::string job_id;
    ArtifactIdentity identity;
    std::string data_file;
    std::optional<std::string> schema_hint;
    int64_t rows{0};
    uint64_t bytes{0};
    std::string content_hash;
    nlohmann::json meta = nlohmann::json::object();
    std::string submitted_at;
    uint64_t producer_pid{0};

    [[nodiscard]] ARTBUS_EXPORT nlohmann::json to_json() const;

    /// Type-checks every field. Failures are ValidationError naming the field.
    ARTBUS_EXPORT static BusResult<Manifest> from_json(const nlohmann::json &j);

    /// Parses manifest text; malformed JSON is a ValidationError.
    ARTBUS_EXPORT static BusResult<Manifest> parse(std::string_view text);

    /// True when the hint is absent or "untyped".
    [[nodiscard]] bool is_untyped() const noexcept
    {
        return !schema_hint.has_value() || *schema_hint == kUntypedSchemaHint;
    }
};

/// New job id: "job-<epoch ms>-<16 random hex>".
ARTBUS_EXPORT std::string make_job_id();

/// "<job_id>.manifest.json"
ARTBUS_EXPORT std::string manifest_file_name(std::string_view job_id);

/// "<job_id>.parquet"
ARTBUS_EXPORT std::string data_file_name(std::string_view job_id);

} // namespace artbus::bus
