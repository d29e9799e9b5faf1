/**
 * @file ctl_main.cpp
 * @brief artbus-ctl: submit artifacts and read the catalog and export ledger.
 *
 *     artbus-ctl <command> (--config <bus.json> | --root <dir>) [options]
 *
 * Every read command opens the catalog read-only and never takes the catalog lock.
 * Output is JSON on stdout; errors go to stderr with a non-zero exit code.
 */
#include "abus_bus.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

using namespace artbus::utils;
using namespace artbus::bus;
using nlohmann::json;

namespace
{

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

struct CtlArgs
{
    std::string command;
    std::map<std::string, std::string, std::less<>> options;

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const
    {
        const auto it = options.find(key);
        if (it == options.end())
            return std::nullopt;
        return it->second;
    }
};

void print_usage(const char *prog)
{
    std::cout
        << "Usage:\n"
        << "  " << prog << " <command> (--config <bus.json> | --root <dir>) [options]\n\n"
        << "Commands:\n"
        << "  submit   --run-id R --producer P --kind K --artifact-id A --data <file>\n"
        << "           [--schema-hint H] [--rows N] [--meta '<json object>']\n"
        << "  latest   [--producer P] [--kind K]\n"
        << "  runs     [--producer P] [--kind K] [--run-id R] [--from T] [--to T] [--limit N]\n"
        << "  find     --run-id R --producer P --kind K --artifact-id A\n"
        << "  health   catalog availability and schema version\n"
        << "  status   export ledger and catalog lock holder\n";
}

CtlArgs parse_args(int argc, char *argv[])
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        std::exit(1);
    }
    CtlArgs args;
    args.command = argv[1];
    if (args.command == "--help" || args.command == "-h")
    {
        print_usage(argv[0]);
        std::exit(0);
    }
    for (int i = 2; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (!arg.starts_with("--") || i + 1 >= argc)
        {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
        args.options[std::string(arg.substr(2))] = argv[++i];
    }
    if (!args.get("config") && !args.get("root"))
    {
        std::cerr << "Error: --config <path> or --root <dir> is required\n\n";
        print_usage(argv[0]);
        std::exit(1);
    }
    return args;
}

DaemonConfig load_config(const CtlArgs &args)
{
    if (auto path = args.get("config"))
    {
        return DaemonConfig::from_json_file(*path);
    }
    return DaemonConfig::for_root(std::filesystem::absolute(*args.get("root")));
}

int parse_int(const CtlArgs &args, std::string_view key, int fallback)
{
    const auto text = args.get(key);
    if (!text)
        return fallback;
    int value = 0;
    const char *end = text->data() + text->size();
    const auto [ptr, ec] = std::from_chars(text->data(), end, value);
    if (ec == std::errc{} && ptr == end)
        return value;
    throw std::runtime_error(fmt::format("--{} expects an integer, got '{}'", key, *text));
}

json to_json(const LatestArtifact &a)
{
    return json{{"run_id", a.identity.run_id},
                {"producer", a.identity.producer},
                {"kind", a.identity.kind},
                {"artifact_id", a.identity.artifact_id},
                {"canonical_path", a.canonical_path},
                {"rows", a.rows},
                {"schema_hint", a.schema_hint ? json(*a.schema_hint) : json(nullptr)},
                {"content_hash", a.content_hash},
                {"last_seen_at", a.last_seen_at},
                {"commit_seq", a.commit_seq}};
}

json to_json(const CatalogEntry &e)
{
    return json{{"run_id", e.identity.run_id},
                {"producer", e.identity.producer},
                {"kind", e.identity.kind},
                {"artifact_id", e.identity.artifact_id},
                {"canonical_path", e.canonical_path},
                {"schema_hint", e.schema_hint ? json(*e.schema_hint) : json(nullptr)},
                {"rows", e.rows},
                {"bytes", e.bytes},
                {"content_hash", e.content_hash},
                {"meta", e.meta},
                {"created_at", e.created_at},
                {"last_seen_at", e.last_seen_at},
                {"commit_seq", e.commit_seq}};
}

json to_json(const ArtifactRecord &a)
{
    return json{{"run_id", a.identity.run_id},
                {"producer", a.identity.producer},
                {"kind", a.identity.kind},
                {"artifact_id", a.identity.artifact_id},
                {"canonical_path", a.canonical_path},
                {"rows", a.rows},
                {"bytes", a.bytes},
                {"schema_hint", a.schema_hint ? json(*a.schema_hint) : json(nullptr)},
                {"content_hash", a.content_hash},
                {"meta", a.meta},
                {"committed_at", a.committed_at}};
}

template <typename T> int report_error(const BusResult<T> &r, std::string_view what)
{
    std::cerr << what << ": " << to_string(r.error()) << ": " << r.error_message() << "\n";
    return 1;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

int cmd_submit(const CtlArgs &args, const DaemonConfig &config)
{
    SubmitRequest request;
    request.identity.run_id = args.get("run-id").value_or("");
    request.identity.producer = args.get("producer").value_or("");
    request.identity.kind = args.get("kind").value_or("");
    request.identity.artifact_id = args.get("artifact-id").value_or("");
    request.data_path = args.get("data").value_or("");
    request.schema_hint = args.get("schema-hint");
    request.rows = parse_int(args, "rows", 0);
    if (auto meta = args.get("meta"))
    {
        request.meta = json::parse(*meta, nullptr, /*allow_exceptions=*/false);
        if (request.meta.is_discarded())
        {
            std::cerr << "--meta is not valid JSON\n";
            return 1;
        }
    }

    FilesystemBackend backend;
    ProducerClient client(backend, config.paths.inbox_dir);
    auto receipt = client.submit_artifact(request);
    if (receipt.is_error())
        return report_error(receipt, "submit failed");

    const auto &r = receipt.content();
    std::cout << json{{"job_id", r.job_id},
                      {"content_hash", r.content_hash},
                      {"bytes", r.bytes},
                      {"manifest_path", r.manifest_path.string()}}
                     .dump(4)
              << "\n";
    return 0;
}

int cmd_latest(const CtlArgs &args, const CatalogStore &catalog)
{
    auto latest = catalog.latest_artifacts(args.get("producer"), args.get("kind"));
    if (latest.is_error())
        return report_error(latest, "latest failed");
    json out = json::array();
    for (const auto &a : latest.content())
        out.push_back(to_json(a));
    std::cout << out.dump(4) << "\n";
    return 0;
}

int cmd_runs(const CtlArgs &args, const CatalogStore &catalog)
{
    RunFilter filter;
    filter.producer = args.get("producer");
    filter.kind = args.get("kind");
    filter.run_id = args.get("run-id");
    filter.created_from = args.get("from");
    filter.created_to = args.get("to");
    filter.limit = parse_int(args, "limit", filter.limit);
    auto runs = catalog.list_runs(filter);
    if (runs.is_error())
        return report_error(runs, "runs failed");
    json out = json::array();
    for (const auto &e : runs.content())
        out.push_back(to_json(e));
    std::cout << out.dump(4) << "\n";
    return 0;
}

int cmd_find(const CtlArgs &args, const CatalogStore &catalog)
{
    ArtifactIdentity identity;
    identity.run_id = args.get("run-id").value_or("");
    identity.producer = args.get("producer").value_or("");
    identity.kind = args.get("kind").value_or("");
    identity.artifact_id = args.get("artifact-id").value_or("");

    auto found = catalog.find_artifact(identity);
    if (found.is_error())
        return report_error(found, "find failed");
    if (!found.content())
    {
        std::cerr << "not committed: " << identity.to_string() << "\n";
        return 2;
    }
    std::cout << to_json(*found.content()).dump(4) << "\n";
    return 0;
}

int cmd_health(const DaemonConfig &config)
{
    auto catalog = CatalogStore::open(config.paths.catalog_path, CatalogStore::Mode::ReadOnly);
    CatalogHealth health;
    if (catalog.is_ok())
    {
        health = catalog.content()->health_check();
    }
    else
    {
        health.error = fmt::format("{}: {}", to_string(catalog.error()), catalog.error_message());
    }
    std::cout << json{{"available", health.available},
                      {"schema_version", health.schema_version},
                      {"error", health.error}}
                     .dump(4)
              << "\n";
    return health.available ? 0 : 1;
}

int cmd_status(const DaemonConfig &config)
{
    json out;
    std::error_code ec;
    auto ledger = read_json_file(config.paths.ledger_path(), &ec);
    out["exports"] = ledger ? *ledger : json::object();
    if (!ledger && ec && ec != std::errc::no_such_file_or_directory)
        out["exports_error"] = ec.message();

    CatalogLock lock(config.paths.lock_path);
    if (auto holder = lock.holder())
        out["lock_holder"] = holder->to_json();
    else
        out["lock_holder"] = nullptr;

    std::cout << out.dump(4) << "\n";
    return 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const CtlArgs args = parse_args(argc, argv);

    LifecycleGuard ctl_lifecycle(make_module_list(Logger::GetLifecycleModule(),
                                                FileLock::GetLifecycleModule(),
                                                artbus::crypto::GetLifecycleModule(),
                                                CatalogStore::GetLifecycleModule()));
    Logger::instance().set_level(Logger::Level::L_WARNING);

    DaemonConfig config;
    try
    {
        config = load_config(args);
        if (args.command == "submit")
            return cmd_submit(args, config);
        if (args.command == "health")
            return cmd_health(config);
        if (args.command == "status")
            return cmd_status(config);
        if (args.command == "latest" || args.command == "runs" || args.command == "find")
        {
            auto catalog =
                CatalogStore::open(config.paths.catalog_path, CatalogStore::Mode::ReadOnly);
            if (catalog.is_error())
                return report_error(catalog, "cannot open catalog");
            const CatalogStore &store = *catalog.content();
            if (args.command == "latest")
                return cmd_latest(args, store);
            if (args.command == "runs")
                return cmd_runs(args, store);
            return cmd_find(args, store);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command: " << args.command << "\n";
    print_usage(argv[0]);
    return 1;
}
