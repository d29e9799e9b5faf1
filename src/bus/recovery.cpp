/**
 * @file recovery.cpp
 * @brief Commit-marker resolution and the store/catalog audit.
 *
 * A marker in `store/.pending/` means a commit started and did not finish. Which
 * copy of the data survives tells how far it got:
 *
 * | canonical file      | inbox data | action                                   |
 * |---------------------|------------|------------------------------------------|
 * | present, same hash  | any        | replay the upsert, finish the job        |
 * | absent / other hash | present    | clear the marker; the scan retries       |
 * | absent              | absent     | reject the manifest: data lost           |
 */
#include "abus_service.hpp"
#include "bus/bus_daemon.hpp"

#include <set>

namespace fs = std::filesystem;

namespace artbus::bus
{

namespace
{
std::string normalized(const fs::path &p)
{
    return p.lexically_normal().generic_string();
}
} // namespace

void BusDaemon::resolve_markers(RecoveryReport &report)
{
    auto markers = m_store.list_markers();
    if (markers.is_error())
    {
        LOGGER_ERROR("BusDaemon: cannot list commit markers: {}", markers.error_message());
        return;
    }

    for (const auto &marker : markers.content())
    {
        const std::string &job_id = marker.manifest.job_id;
        const fs::path canonical(marker.canonical_path);

        bool stored = false;
        if (m_backend.exists(canonical))
        {
            auto hash = m_backend.hash_file(canonical);
            if (hash.is_error())
            {
                LOGGER_WARN("BusDaemon: job {} deferred: cannot hash '{}': {}", job_id,
                            canonical.string(), hash.error_message());
                ++report.deferred;
                continue;
            }
            stored = (hash.content() == marker.manifest.content_hash);
        }

        if (stored)
        {
            auto upserted = finish_commit(marker);
            if (upserted.is_error())
            {
                if (upserted.error() == BusError::ValidationError)
                {
                    LOGGER_ERROR("BusDaemon: job {} cannot be replayed: {}; marker kept", job_id,
                                 upserted.error_message());
                }
                else
                {
                    LOGGER_WARN("BusDaemon: job {} replay deferred: {}: {}", job_id,
                                to_string(upserted.error()), upserted.error_message());
                }
                ++report.deferred;
                continue;
            }
            LOGGER_INFO("BusDaemon: replayed commit of job {} as {} (catalog {})", job_id,
                        marker.manifest.identity.to_string(), to_string(upserted.content()));
            ++report.replayed;
            continue;
        }

        if (m_backend.exists(marker.inbox_data))
        {
            if (auto cleared = m_store.clear_marker(job_id); cleared.is_error())
            {
                LOGGER_ERROR("BusDaemon: cannot clear marker of job {}: {}", job_id,
                             cleared.error_message());
                ++report.deferred;
                continue;
            }
            LOGGER_INFO("BusDaemon: job {} was not moved before the interruption; retrying",
                        job_id);
            ++report.retried;
            continue;
        }

        if (!move_to_rejected(job_id, marker.inbox_manifest, fs::path{}, BusError::Corruption,
                              "data lost during commit"))
        {
            ++report.deferred;
            continue;
        }
        if (auto cleared = m_store.clear_marker(job_id); cleared.is_error())
        {
            LOGGER_ERROR("BusDaemon: cannot clear marker of job {}: {}", job_id,
                         cleared.error_message());
        }
        LOGGER_ERROR("BusDaemon: job {} ({}) rejected: data lost during commit", job_id,
                     marker.manifest.identity.to_string());
        ++report.lost;
    }
}

void BusDaemon::audit_store(RecoveryReport &report)
{
    auto artifacts = m_catalog.all_artifacts();
    if (artifacts.is_error())
    {
        LOGGER_ERROR("BusDaemon: store audit skipped: {}", artifacts.error_message());
        return;
    }

    std::set<std::string> known;
    for (const auto &a : artifacts.content())
    {
        known.insert(normalized(a.canonical_path));
        if (!m_backend.exists(a.canonical_path))
        {
            LOGGER_ERROR("BusDaemon: {}: {} is cataloged but '{}' is missing",
                         to_string(BusError::Corruption), a.identity.to_string(),
                         a.canonical_path);
            report.corrupt.push_back(a.canonical_path);
        }
    }

    auto markers = m_store.list_markers();
    if (markers.is_ok())
    {
        for (const auto &m : markers.content())
        {
            known.insert(normalized(m.canonical_path));
        }
    }

    auto files = m_store.stored_files();
    if (files.is_error())
    {
        LOGGER_ERROR("BusDaemon: cannot list store: {}", files.error_message());
        return;
    }
    for (const auto &f : files.content())
    {
        if (known.count(normalized(f)) == 0)
        {
            LOGGER_WARN("BusDaemon: orphan store file '{}' has no catalog row", f.string());
            report.orphans.push_back(f.string());
        }
    }
}

RecoveryReport BusDaemon::recover()
{
    LOGGER_INFO("BusDaemon: recovery starting");
    RecoveryReport report;
    resolve_markers(report);
    audit_store(report);
    LOGGER_INFO("BusDaemon: recovery done: replayed {}, retried {}, lost {}, deferred {}, "
                "corrupt {}, orphans {}",
                report.replayed, report.retried, report.lost, report.deferred,
                report.corrupt.size(), report.orphans.size());
    return report;
}

} // namespace artbus::bus
