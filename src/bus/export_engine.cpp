/**
 * @file export_engine.cpp
 * @brief Golden-file refresh queue, optional worker thread and ledger persistence.
 */
#include "abus_service.hpp"
#include "bus/export_engine.hpp"

#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

namespace fs = std::filesystem;
using nlohmann::json;

namespace artbus::bus
{

namespace
{
constexpr const char *kGoldenFileName = "latest.parquet";
constexpr const char *kLedgerFileName = "export_status.json";

std::string ledger_key(const std::string &producer, const std::string &kind)
{
    return producer + "/" + kind;
}
} // namespace

// ============================================================================
// Ledger
// ============================================================================

json ExportLedger::to_json() const
{
    json out = json::object();
    for (const auto &[key, o] : exports)
    {
        out[key] = json{{"status", o.status},           {"at", o.at},
                        {"source_path", o.source_path}, {"content_hash", o.content_hash},
                        {"golden_path", o.golden_path}, {"error", o.error}};
    }
    return json{{"last_run_at", last_run_at}, {"exports", out}};
}

ExportLedger ExportLedger::from_json(const json &j)
{
    ExportLedger ledger;
    if (!j.is_object())
    {
        return ledger;
    }
    if (j.contains("last_run_at") && j["last_run_at"].is_string())
    {
        ledger.last_run_at = j["last_run_at"].get<std::string>();
    }
    if (!j.contains("exports") || !j["exports"].is_object())
    {
        return ledger;
    }
    for (const auto &[key, value] : j["exports"].items())
    {
        if (!value.is_object())
        {
            continue;
        }
        auto str = [&value](const char *field)
        {
            const auto it = value.find(field);
            return (it != value.end() && it->is_string()) ? it->get<std::string>() : std::string{};
        };
        ExportOutcome o;
        o.status = str("status");
        o.at = str("at");
        o.source_path = str("source_path");
        o.content_hash = str("content_hash");
        o.golden_path = str("golden_path");
        o.error = str("error");
        ledger.exports.emplace(key, std::move(o));
    }
    return ledger;
}

// ============================================================================
// Impl
// ============================================================================

struct ExportEngine::Impl
{
    StorageBackend &backend;
    const CatalogStore &catalog;
    fs::path export_dir;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::set<std::pair<std::string, std::string>> queue;
    ExportLedger ledger;

    std::mutex drain_mutex;
    std::thread worker;
    std::atomic<bool> running{false};
    bool stop_requested{false};

    Impl(StorageBackend &b, const CatalogStore &c, fs::path dir)
        : backend(b), catalog(c), export_dir(std::move(dir))
    {
    }

    fs::path golden_path(const std::string &producer, const std::string &kind) const
    {
        return export_dir / producer / kind / kGoldenFileName;
    }

    fs::path ledger_path() const { return export_dir / kLedgerFileName; }

    void load_ledger()
    {
        if (!backend.exists(ledger_path()))
        {
            return;
        }
        auto text = backend.read_file(ledger_path());
        if (text.is_error())
        {
            LOGGER_WARN("ExportEngine: cannot read ledger: {}", text.error_message());
            return;
        }
        json j = json::parse(text.content(), nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded())
        {
            LOGGER_WARN("ExportEngine: ledger '{}' is not valid JSON; starting empty",
                        ledger_path().string());
            return;
        }
        ledger = ExportLedger::from_json(j);
    }

    void record(const std::string &key, ExportOutcome outcome)
    {
        std::lock_guard<std::mutex> lock(mutex);
        ledger.exports[key] = std::move(outcome);
    }

    // Returns true if the golden file was rewritten.
    bool refresh_one(const std::string &producer, const std::string &kind)
    {
        const std::string key = ledger_key(producer, kind);
        const fs::path golden = golden_path(producer, kind);

        auto latest = catalog.latest_artifacts(producer, kind);
        if (latest.is_error())
        {
            LOGGER_ERROR("ExportEngine: {}: {} reading catalog: {}", key,
                         to_string(BusError::ExportError), latest.error_message());
            ExportOutcome o;
            o.status = "error";
            o.at = format_tools::iso8601_utc_now();
            o.golden_path = golden.string();
            o.error = fmt::format("{}: {}", to_string(latest.error()), latest.error_message());
            record(key, std::move(o));
            return false;
        }
        if (latest.content().empty())
        {
            LOGGER_DEBUG("ExportEngine: {}: nothing committed yet", key);
            return false;
        }
        const LatestArtifact &source = latest.content().front();

        {
            std::lock_guard<std::mutex> lock(mutex);
            const auto it = ledger.exports.find(key);
            if (it != ledger.exports.end() && it->second.ok() &&
                it->second.source_path == source.canonical_path &&
                it->second.content_hash == source.content_hash && backend.exists(golden))
            {
                return false;
            }
        }

        ExportOutcome o;
        o.at = format_tools::iso8601_utc_now();
        o.source_path = source.canonical_path;
        o.content_hash = source.content_hash;
        o.golden_path = golden.string();
        auto copied = backend.copy_file_atomic(source.canonical_path, golden);
        if (copied.is_error())
        {
            o.status = "error";
            o.error = copied.error_message();
            LOGGER_ERROR("ExportEngine: {}: {} refreshing '{}': {}", key,
                         to_string(BusError::ExportError), golden.string(), o.error);
            record(key, std::move(o));
            return false;
        }
        o.status = "ok";
        LOGGER_INFO("ExportEngine: {}: refreshed '{}' from {}", key, golden.string(),
                    source.identity.to_string());
        record(key, std::move(o));
        return true;
    }

    void persist_ledger()
    {
        std::string text;
        {
            std::lock_guard<std::mutex> lock(mutex);
            ledger.last_run_at = format_tools::iso8601_utc_now();
            text = ledger.to_json().dump(4);
        }
        if (auto written = backend.write_file_atomic(ledger_path(), text); written.is_error())
        {
            LOGGER_ERROR("ExportEngine: cannot write ledger: {}", written.error_message());
        }
    }

    size_t drain()
    {
        std::lock_guard<std::mutex> drain_lock(drain_mutex);
        std::set<std::pair<std::string, std::string>> batch;
        {
            std::lock_guard<std::mutex> lock(mutex);
            batch.swap(queue);
        }
        if (batch.empty())
        {
            return 0;
        }
        size_t rewritten = 0;
        for (const auto &[producer, kind] : batch)
        {
            if (refresh_one(producer, kind))
            {
                ++rewritten;
            }
        }
        persist_ledger();
        return rewritten;
    }

    void worker_loop()
    {
        LOGGER_DEBUG("ExportEngine: worker started");
        for (;;)
        {
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stop_requested || !queue.empty(); });
                if (stop_requested)
                {
                    break;
                }
            }
            drain();
        }
        LOGGER_DEBUG("ExportEngine: worker stopped");
    }
};

// ============================================================================
// ExportEngine
// ============================================================================

ExportEngine::ExportEngine(StorageBackend &backend, const CatalogStore &catalog,
                           fs::path export_dir)
    : pImpl(std::make_unique<Impl>(backend, catalog, std::move(export_dir)))
{
    pImpl->load_ledger();
}

ExportEngine::~ExportEngine()
{
    stop();
}

void ExportEngine::request_refresh(const std::string &producer, const std::string &kind)
{
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->queue.emplace(producer, kind);
    }
    pImpl->cv.notify_one();
}

size_t ExportEngine::drain()
{
    return pImpl->drain();
}

size_t ExportEngine::refresh_all()
{
    auto latest = pImpl->catalog.latest_artifacts();
    if (latest.is_error())
    {
        LOGGER_ERROR("ExportEngine: refresh_all cannot read catalog: {}", latest.error_message());
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        for (const auto &a : latest.content())
        {
            pImpl->queue.emplace(a.identity.producer, a.identity.kind);
        }
    }
    return pImpl->drain();
}

void ExportEngine::start()
{
    bool expected = false;
    if (!pImpl->running.compare_exchange_strong(expected, true))
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->stop_requested = false;
    }
    pImpl->worker = std::thread([this] { pImpl->worker_loop(); });
}

void ExportEngine::stop()
{
    if (!pImpl->running.exchange(false))
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->stop_requested = true;
    }
    pImpl->cv.notify_all();
    if (pImpl->worker.joinable())
    {
        pImpl->worker.join();
    }
}

bool ExportEngine::running() const noexcept
{
    return pImpl->running.load();
}

size_t ExportEngine::pending() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->queue.size();
}

ExportLedger ExportEngine::ledger() const
{
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->ledger;
}

fs::path ExportEngine::golden_path(const std::string &producer, const std::string &kind) const
{
    return pImpl->golden_path(producer, kind);
}

fs::path ExportEngine::ledger_path() const
{
    return pImpl->ledger_path();
}

} // namespace artbus::bus
