#pragma once
/**
 * @file json_io.hpp
 * @brief Crash-safe file writes and JSON file helpers (POSIX).
 *
 * `atomic_write_file` is the one primitive every durable write on the bus goes
 * through: manifests, commit markers, the export ledger and golden exports. The
 * sequence is
 *
 *   ensure parent dir -> refuse symlinked target -> mkstemp `.<name>.tmp.XXXXXX`
 *   -> write -> fsync -> close -> rename over target -> fsync parent dir
 *
 * so a reader sees either the old file or the complete new one, never a torn
 * write. Temp files start with a dot so directory scans can ignore them.
 *
 * Errors are reported through an optional `std::error_code *` and logged; none of
 * these functions throw.
 */
#include "artbus_export.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

namespace artbus::utils
{

/// Prefix and infix of temp files created by `atomic_write_file`.
inline constexpr std::string_view kTempFileInfix = ".tmp.";

/**
 * @brief Returns true if `name` is a temp file produced by `atomic_write_file`
 *        (a dot-file whose name contains ".tmp.").
 */
ARTBUS_EXPORT bool is_temp_file_name(std::string_view name) noexcept;

/**
 * @brief Atomically replaces `target` with `content`.
 * @param err_code May be null. Cleared on success; set on failure.
 * @return true on success. On failure no temp file is left behind.
 */
ARTBUS_EXPORT bool atomic_write_file(const std::filesystem::path &target, std::string_view content,
                                     std::error_code *err_code) noexcept;

/// `atomic_write_file(target, j.dump(4))`.
ARTBUS_EXPORT bool atomic_write_json(const std::filesystem::path &target, const nlohmann::json &j,
                                     std::error_code *err_code) noexcept;

/**
 * @brief Reads and parses a JSON file.
 * @param err_code Set to the errno of a failed read, or to
 *                 `std::errc::illegal_byte_sequence` when the text is not valid JSON.
 */
ARTBUS_EXPORT std::optional<nlohmann::json> read_json_file(const std::filesystem::path &path,
                                                           std::error_code *err_code) noexcept;

/// fsyncs a directory so a rename or unlink inside it is durable.
ARTBUS_EXPORT bool fsync_directory(const std::filesystem::path &dir,
                                   std::error_code *err_code) noexcept;

} // namespace artbus::utils
