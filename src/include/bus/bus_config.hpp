#pragma once
/**
 * @file bus_config.hpp
 * @brief Bus directory layout and daemon configuration, loaded from a JSON file.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "bus": {
 *     "root":               "/data/bus",
 *     "inbox_dir":          "inbox",
 *     "rejected_dir":       "rejected",
 *     "store_dir":          "store",
 *     "export_dir":         "exports",
 *     "catalog_path":       "catalog.sqlite",
 *     "lock_path":          "catalog.lock",
 *     "lock_timeout_s":     10,
 *     "poll_interval_ms":   1000,
 *     "validate_workers":   4,
 *     "known_schema_hints": ["fills_v1", "ohlcv_v2"],
 *     "allow_untyped":      true,
 *     "log_level":          "info",
 *     "log_file":           "/var/log/artbus/daemon.log"
 *   }
 * }
 * @endcode
 *
 * Only `root` is required (unless every directory and path is given). Relative
 * paths resolve against `root`; a relative `root` resolves against the directory
 * of the config file. `ARTBUS_ROOT` and `ARTBUS_LOCK_TIMEOUT_S` in the
 * environment override the file.
 */
#include "artbus_export.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace artbus::bus
{

/// Where every part of one bus lives.
struct BusPaths
{
    std::filesystem::path root;
    std::filesystem::path inbox_dir;
    std::filesystem::path rejected_dir;
    std::filesystem::path store_dir;
    std::filesystem::path export_dir;
    std::filesystem::path catalog_path;
    std::filesystem::path lock_path;

    /// Default layout: inbox/, rejected/, store/, exports/, catalog.sqlite, catalog.lock.
    ARTBUS_EXPORT static BusPaths under_root(const std::filesystem::path &root);

    [[nodiscard]] std::filesystem::path pending_dir() const { return store_dir / ".pending"; }
    [[nodiscard]] std::filesystem::path ledger_path() const
    {
        return export_dir / "export_status.json";
    }
};

struct DaemonConfig
{
    BusPaths paths;
    std::chrono::milliseconds lock_timeout{10000};
    std::chrono::milliseconds poll_interval{1000};
    int validate_workers{4};
    std::vector<std::string> known_schema_hints;
    bool allow_untyped{true};
    std::string log_level{"info"};
    std::string log_file;

    /// Defaults for a bus under `root`.
    ARTBUS_EXPORT static DaemonConfig for_root(const std::filesystem::path &root);

    /**
     * @brief Parses the `"bus"` object of `j`.
     * @param base_dir Directory a relative `root` resolves against.
     * @throws std::runtime_error naming the offending key.
     */
    ARTBUS_EXPORT static DaemonConfig from_json(const nlohmann::json &j,
                                                const std::filesystem::path &base_dir);

    /// @throws std::runtime_error if the file is unreadable or invalid.
    ARTBUS_EXPORT static DaemonConfig from_json_file(const std::filesystem::path &path);

    [[nodiscard]] ARTBUS_EXPORT nlohmann::json to_json() const;
};

} // namespace artbus::bus
