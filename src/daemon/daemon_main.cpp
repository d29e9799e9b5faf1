/**
 * @file daemon_main.cpp
 * @brief artbus-daemon: the single catalog writer of one bus.
 *
 *     artbus-daemon --config <bus.json> [--once | --recover-only | --validate]
 *
 * Startup: lifecycle modules, config, log sink, catalog (read-write, migrated),
 * crash recovery. Then either one scan plus export run (`--once`) or the poll loop
 * until SIGINT/SIGTERM.
 */
#include "abus_bus.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using namespace artbus::utils;
using namespace artbus::bus;

// ---------------------------------------------------------------------------
// Global shutdown flag (set by SIGINT/SIGTERM)
// ---------------------------------------------------------------------------

static std::atomic<bool> g_shutdown{false};
static BusDaemon *g_daemon_ptr{nullptr};

static void signal_handler(int /*sig*/) noexcept
{
    if (g_shutdown.load(std::memory_order_relaxed))
        std::_Exit(1); // second signal: give up on a clean stop
    g_shutdown.store(true, std::memory_order_relaxed);
    if (g_daemon_ptr != nullptr)
        g_daemon_ptr->stop();
}

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

namespace
{

struct DaemonArgs
{
    std::string config_path;
    bool once{false};
    bool recover_only{false};
    bool validate_only{false};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog << " --config <bus.json> [--once | --recover-only | --validate]\n\n"
              << "Options:\n"
              << "  --config <path>   Path to the bus JSON config (required)\n"
              << "  --once            Recover, scan the inbox once, run exports, exit\n"
              << "  --recover-only    Resolve pending commits and audit the store, then exit\n"
              << "  --validate        Parse the config and print the resolved layout; exit 0\n"
              << "  --help            Show this message\n\n"
              << "Exit status 4: another daemon already serves this inbox.\n";
}

DaemonArgs parse_args(int argc, char *argv[])
{
    DaemonArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--once")
        {
            args.once = true;
        }
        else if (arg == "--recover-only")
        {
            args.recover_only = true;
        }
        else if (arg == "--validate")
        {
            args.validate_only = true;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    if (args.config_path.empty())
    {
        std::cerr << "Error: --config <path> is required\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    if (static_cast<int>(args.once) + static_cast<int>(args.recover_only) +
            static_cast<int>(args.validate_only) > 1)
    {
        std::cerr << "Error: --once, --recover-only and --validate are exclusive\n";
        std::exit(1);
    }
    return args;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Parse arguments ───────────────────────────────────────────────────────
    const DaemonArgs args = parse_args(argc, argv);

    // ── Lifecycle guard ───────────────────────────────────────────────────────
    LifecycleGuard daemon_lifecycle(make_module_list(Logger::GetLifecycleModule(),
                                                   FileLock::GetLifecycleModule(),
                                                   artbus::crypto::GetLifecycleModule(),
                                                   CatalogStore::GetLifecycleModule()));

    // ── Load config ───────────────────────────────────────────────────────────
    DaemonConfig config;
    try
    {
        config = DaemonConfig::from_json_file(args.config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    if (args.validate_only)
    {
        std::cout << config.to_json().dump(4) << "\n\nValidation passed.\n";
        return 0;
    }

    // ── Logging ───────────────────────────────────────────────────────────────
    auto &logger = Logger::instance();
    if (auto level = Logger::level_from_string(config.log_level))
    {
        logger.set_level(*level);
    }
    if (!config.log_file.empty() && !logger.set_logfile(config.log_file))
    {
        std::cerr << "Cannot open log file '" << config.log_file << "'\n";
        return 1;
    }
    LOGGER_INFO("artbus-daemon {} starting, bus root '{}'", artbus::platform::get_version_string(),
                config.paths.root.string());

    // ── Catalog ───────────────────────────────────────────────────────────────
    auto catalog = CatalogStore::open(config.paths.catalog_path, CatalogStore::Mode::ReadWrite);
    if (catalog.is_error())
    {
        LOGGER_ERROR("cannot open catalog '{}': {}", config.paths.catalog_path.string(),
                     catalog.error_message());
        std::cerr << "Catalog error: " << catalog.error_message() << "\n";
        return 1;
    }

    FilesystemBackend backend;
    CatalogLock lock(config.paths.lock_path);
    ExportEngine exporter(backend, *catalog.content(), config.paths.export_dir);
    BusDaemon daemon(config, backend, *catalog.content(), lock, exporter);

    if (auto st = daemon.prepare(); st.is_error())
    {
        if (st.error_code() == EAGAIN)
        {
            std::cerr << "Startup refused: " << st.error_message() << "\n";
            return 4;
        }
        std::cerr << "Startup failed: " << to_string(st.error()) << ": " << st.error_message()
                  << "\n";
        return 1;
    }

    // ── Crash recovery ────────────────────────────────────────────────────────
    const RecoveryReport recovery = daemon.recover();
    if (args.recover_only)
    {
        std::cout << "replayed " << recovery.replayed << ", retried " << recovery.retried
                  << ", lost " << recovery.lost << ", deferred " << recovery.deferred
                  << ", corrupt " << recovery.corrupt.size() << ", orphans "
                  << recovery.orphans.size() << "\n";
        for (const auto &path : recovery.corrupt)
            std::cout << "  corrupt: " << path << "\n";
        for (const auto &path : recovery.orphans)
            std::cout << "  orphan:  " << path << "\n";
        return recovery.corrupt.empty() ? 0 : 2;
    }

    // ── Single pass ───────────────────────────────────────────────────────────
    if (args.once)
    {
        const ScanReport report = daemon.scan_once();
        exporter.drain();
        std::cout << "committed " << report.committed << ", rejected " << report.rejected
                  << ", deferred " << report.deferred << ", incomplete "
                  << report.skipped_incomplete << "\n";
        return report.deferred == 0 ? 0 : 3;
    }

    // ── Run mode ──────────────────────────────────────────────────────────────
    g_daemon_ptr = &daemon;
    if (g_shutdown.load())
        daemon.stop();
    exporter.refresh_all();
    exporter.start();
    daemon.run();
    exporter.stop();
    exporter.drain();
    g_daemon_ptr = nullptr;

    LOGGER_INFO("artbus-daemon exiting");
    return 0;
}
