/**
 * @file bus_config.cpp
 * @brief DaemonConfig JSON parsing with environment overrides.
 */
#include "abus_service.hpp"
#include "bus/bus_config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace fs = std::filesystem;
using nlohmann::json;

namespace artbus::bus
{

namespace
{

constexpr int kMaxValidateWorkers = 64;
constexpr double kMaxLockTimeoutSeconds = 86400.0;
constexpr int64_t kMaxPollIntervalMs = 86400000;

[[noreturn]] void config_error(const std::string &message)
{
    throw std::runtime_error("Bus config: " + message);
}

std::string get_string(const json &bus, const char *key, const std::string &fallback)
{
    const auto it = bus.find(key);
    if (it == bus.end() || it->is_null())
    {
        return fallback;
    }
    if (!it->is_string())
    {
        config_error(fmt::format("'{}' must be a string", key));
    }
    return it->get<std::string>();
}

fs::path resolve_under(const fs::path &root, const fs::path &p)
{
    return p.is_absolute() ? p.lexically_normal() : (root / p).lexically_normal();
}

bool valid_timeout_seconds(double seconds)
{
    return seconds > 0.0 && seconds <= kMaxLockTimeoutSeconds;
}

double parse_timeout_seconds(const std::string &text, const char *what)
{
    const std::string message =
        fmt::format("{} must be a number in (0, {}], got '{}'", what, kMaxLockTimeoutSeconds, text);
    try
    {
        size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size() || !valid_timeout_seconds(value))
        {
            config_error(message);
        }
        return value;
    }
    catch (const std::logic_error &)
    {
        config_error(message);
    }
}

/// `seconds` must already be within (0, kMaxLockTimeoutSeconds].
std::chrono::milliseconds seconds_to_ms(double seconds)
{
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0 + 0.5));
}

} // namespace

BusPaths BusPaths::under_root(const fs::path &root)
{
    BusPaths p;
    p.root = root;
    p.inbox_dir = root / "inbox";
    p.rejected_dir = root / "rejected";
    p.store_dir = root / "store";
    p.export_dir = root / "exports";
    p.catalog_path = root / "catalog.sqlite";
    p.lock_path = root / "catalog.lock";
    return p;
}

DaemonConfig DaemonConfig::for_root(const fs::path &root)
{
    DaemonConfig cfg;
    cfg.paths = BusPaths::under_root(root);
    return cfg;
}

DaemonConfig DaemonConfig::from_json(const json &j, const fs::path &base_dir)
{
    if (!j.is_object() || !j.contains("bus") || !j["bus"].is_object())
    {
        config_error("missing required object 'bus'");
    }
    const json &bus = j["bus"];
    DaemonConfig cfg;

    // ── Paths ────────────────────────────────────────────────────────────────
    std::string root_text = get_string(bus, "root", "");
    if (const char *env_root = std::getenv("ARTBUS_ROOT"); env_root != nullptr && *env_root != '\0')
    {
        root_text = env_root;
    }
    const char *dir_keys[] = {"inbox_dir",  "rejected_dir", "store_dir",
                              "export_dir", "catalog_path", "lock_path"};
    if (root_text.empty())
    {
        for (const char *key : dir_keys)
        {
            const std::string value = get_string(bus, key, "");
            if (value.empty() || !fs::path(value).is_absolute())
            {
                config_error(fmt::format("missing required field 'root' (needed to resolve '{}')",
                                         key));
            }
        }
    }
    const fs::path root = root_text.empty() ? fs::path{} : resolve_under(base_dir, root_text);
    const BusPaths defaults = BusPaths::under_root(root);
    cfg.paths.root = root;
    cfg.paths.inbox_dir = resolve_under(root, get_string(bus, "inbox_dir", defaults.inbox_dir.string()));
    cfg.paths.rejected_dir =
        resolve_under(root, get_string(bus, "rejected_dir", defaults.rejected_dir.string()));
    cfg.paths.store_dir = resolve_under(root, get_string(bus, "store_dir", defaults.store_dir.string()));
    cfg.paths.export_dir = resolve_under(root, get_string(bus, "export_dir", defaults.export_dir.string()));
    cfg.paths.catalog_path =
        resolve_under(root, get_string(bus, "catalog_path", defaults.catalog_path.string()));
    cfg.paths.lock_path = resolve_under(root, get_string(bus, "lock_path", defaults.lock_path.string()));

    // ── Timing ───────────────────────────────────────────────────────────────
    if (const auto it = bus.find("lock_timeout_s"); it != bus.end())
    {
        if (!it->is_number() || !valid_timeout_seconds(it->get<double>()))
        {
            config_error(fmt::format("'lock_timeout_s' must be a number in (0, {}]",
                                     kMaxLockTimeoutSeconds));
        }
        cfg.lock_timeout = seconds_to_ms(it->get<double>());
    }
    if (const char *env_timeout = std::getenv("ARTBUS_LOCK_TIMEOUT_S");
        env_timeout != nullptr && *env_timeout != '\0')
    {
        cfg.lock_timeout =
            seconds_to_ms(parse_timeout_seconds(env_timeout, "ARTBUS_LOCK_TIMEOUT_S"));
    }
    if (const auto it = bus.find("poll_interval_ms"); it != bus.end())
    {
        if (!it->is_number_integer() || it->get<int64_t>() <= 0 ||
            it->get<int64_t>() > kMaxPollIntervalMs)
        {
            config_error(fmt::format("'poll_interval_ms' must be an integer in 1..{}",
                                     kMaxPollIntervalMs));
        }
        cfg.poll_interval = std::chrono::milliseconds(it->get<int64_t>());
    }

    // ── Validation ───────────────────────────────────────────────────────────
    if (const auto it = bus.find("validate_workers"); it != bus.end())
    {
        if (!it->is_number_integer() || it->get<int64_t>() < 1 ||
            it->get<int64_t>() > kMaxValidateWorkers)
        {
            config_error(fmt::format("'validate_workers' must be an integer in 1..{}",
                                     kMaxValidateWorkers));
        }
        cfg.validate_workers = it->get<int>();
    }
    if (const auto it = bus.find("known_schema_hints"); it != bus.end())
    {
        if (!it->is_array())
        {
            config_error("'known_schema_hints' must be an array of strings");
        }
        for (const auto &hint : *it)
        {
            if (!hint.is_string() || hint.get<std::string>().empty())
            {
                config_error("'known_schema_hints' must contain only non-empty strings");
            }
            cfg.known_schema_hints.push_back(hint.get<std::string>());
        }
    }
    if (const auto it = bus.find("allow_untyped"); it != bus.end())
    {
        if (!it->is_boolean())
        {
            config_error("'allow_untyped' must be a boolean");
        }
        cfg.allow_untyped = it->get<bool>();
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    cfg.log_level = get_string(bus, "log_level", cfg.log_level);
    if (!utils::Logger::level_from_string(cfg.log_level))
    {
        config_error(fmt::format("invalid 'log_level' = '{}' (must be trace, debug, info, warn "
                                 "or error)",
                                 cfg.log_level));
    }
    cfg.log_file = get_string(bus, "log_file", "");
    if (!cfg.log_file.empty() && !root.empty())
    {
        cfg.log_file = resolve_under(root, cfg.log_file).string();
    }
    return cfg;
}

DaemonConfig DaemonConfig::from_json_file(const fs::path &path)
{
    std::error_code ec;
    auto parsed = utils::read_json_file(path, &ec);
    if (!parsed)
    {
        if (ec == std::errc::illegal_byte_sequence)
        {
            config_error(fmt::format("'{}' is not valid JSON", path.string()));
        }
        config_error(fmt::format("cannot read '{}': {}", path.string(), ec.message()));
    }
    const fs::path base = path.has_parent_path() ? path.parent_path() : fs::current_path();
    return from_json(*parsed, base);
}

json DaemonConfig::to_json() const
{
    json bus;
    bus["root"] = paths.root.string();
    bus["inbox_dir"] = paths.inbox_dir.string();
    bus["rejected_dir"] = paths.rejected_dir.string();
    bus["store_dir"] = paths.store_dir.string();
    bus["export_dir"] = paths.export_dir.string();
    bus["catalog_path"] = paths.catalog_path.string();
    bus["lock_path"] = paths.lock_path.string();
    bus["lock_timeout_s"] = static_cast<double>(lock_timeout.count()) / 1000.0;
    bus["poll_interval_ms"] = poll_interval.count();
    bus["validate_workers"] = validate_workers;
    bus["known_schema_hints"] = known_schema_hints;
    bus["allow_untyped"] = allow_untyped;
    bus["log_level"] = log_level;
    bus["log_file"] = log_file;
    return json{{"bus", bus}};
}

} // namespace artbus::bus
