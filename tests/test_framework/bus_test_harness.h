// tests/test_framework/bus_test_harness.h
#pragma once

/**
 * @file bus_test_harness.h
 * @brief A complete bus (catalog, lock, exporter, daemon, producer) in a temp
 *        directory, on either storage backend.
 *
 * The catalog and the lock always live on the real filesystem under the temp
 * directory; bus files go through the chosen backend. With a MemoryBackend the
 * same paths are simply keys in memory.
 */
#include "abus_bus.hpp"
#include "shared_test_helpers.h"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace artbus::tests::helper
{

inline bus::ArtifactIdentity make_identity(std::string run_id, std::string producer,
                                           std::string kind, std::string artifact_id)
{
    bus::ArtifactIdentity id;
    id.run_id = std::move(run_id);
    id.producer = std::move(producer);
    id.kind = std::move(kind);
    id.artifact_id = std::move(artifact_id);
    return id;
}

class BusHarness
{
  public:
    using ConfigTweak = std::function<void(bus::DaemonConfig &)>;

    BusHarness(bus::StorageBackend &backend, const TempDir &dir, const ConfigTweak &tweak = {})
        : m_backend(backend), m_config(bus::DaemonConfig::for_root(dir.path()))
    {
        m_config.lock_timeout = std::chrono::milliseconds(2000);
        m_config.poll_interval = std::chrono::milliseconds(20);
        m_config.validate_workers = 2;
        m_config.known_schema_hints = {"fills_v1", "ohlcv_v2"};
        if (tweak)
        {
            tweak(m_config);
        }

        auto opened = bus::CatalogStore::open(m_config.paths.catalog_path,
                                              bus::CatalogStore::Mode::ReadWrite);
        if (opened.is_error())
        {
            throw std::runtime_error("BusHarness: catalog open failed: " + opened.error_message());
        }
        m_catalog = std::move(opened).content();
        m_lock = std::make_unique<bus::CatalogLock>(m_config.paths.lock_path);
        m_exporter =
            std::make_unique<bus::ExportEngine>(backend, *m_catalog, m_config.paths.export_dir);
        m_daemon = std::make_unique<bus::BusDaemon>(m_config, backend, *m_catalog, *m_lock,
                                                    *m_exporter);
        m_producer = std::make_unique<bus::ProducerClient>(backend, m_config.paths.inbox_dir);
        if (auto st = m_daemon->prepare(); st.is_error())
        {
            throw std::runtime_error("BusHarness: prepare failed: " + st.error_message());
        }
    }

    BusHarness(const BusHarness &) = delete;
    BusHarness &operator=(const BusHarness &) = delete;

    /// Writes `payload` to a producer-side source file and submits it.
    bus::BusResult<bus::SubmitReceipt> submit(const bus::ArtifactIdentity &id,
                                              std::string_view payload,
                                              std::optional<std::string> schema_hint = "fills_v1",
                                              int64_t rows = 10)
    {
        const fs::path src = m_config.paths.root / "producer_src" /
                             fmt::format("{}-{}-{}", id.run_id, id.artifact_id, ++m_sources);
        if (auto st = m_backend.write_file_atomic(src, payload); st.is_error())
        {
            return bus::BusResult<bus::SubmitReceipt>::error_from(st);
        }
        bus::SubmitRequest req;
        req.identity = id;
        req.data_path = src;
        req.schema_hint = std::move(schema_hint);
        req.rows = rows;
        return m_producer->submit_artifact(req);
    }

    [[nodiscard]] std::string read(const fs::path &path) const
    {
        auto text = m_backend.read_file(path);
        return text.is_ok() ? text.content() : std::string{};
    }

    [[nodiscard]] size_t count_in(const fs::path &dir) const
    {
        auto entries = m_backend.list(dir);
        return entries.is_ok() ? entries.content().size() : 0;
    }

    bus::StorageBackend &backend() { return m_backend; }
    const bus::DaemonConfig &config() const { return m_config; }
    const bus::BusPaths &paths() const { return m_config.paths; }
    bus::CatalogStore &catalog() { return *m_catalog; }
    bus::CatalogLock &lock() { return *m_lock; }
    bus::ExportEngine &exporter() { return *m_exporter; }
    bus::BusDaemon &daemon() { return *m_daemon; }
    bus::ProducerClient &producer() { return *m_producer; }

    /// Replaces the daemon, as a restart after a crash would. The new daemon is
    /// not prepared and holds no inbox claim.
    void restart_daemon()
    {
        m_daemon.reset();
        m_daemon = std::make_unique<bus::BusDaemon>(m_config, m_backend, *m_catalog, *m_lock,
                                                    *m_exporter);
    }

  private:
    bus::StorageBackend &m_backend;
    bus::DaemonConfig m_config;
    std::unique_ptr<bus::CatalogStore> m_catalog;
    std::unique_ptr<bus::CatalogLock> m_lock;
    std::unique_ptr<bus::ExportEngine> m_exporter;
    std::unique_ptr<bus::BusDaemon> m_daemon;
    std::unique_ptr<bus::ProducerClient> m_producer;
    std::atomic<int> m_sources{0};
};

} // namespace artbus::tests::helper
