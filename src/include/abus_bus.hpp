#pragma once
/**
 * @file abus_bus.hpp
 * @brief Layer 3: The artifact bus, built on abus_service.
 *
 * Provides the complete bus API for all roles:
 *   - Producer: ProducerClient::submit_artifact
 *   - Daemon:   BusDaemon (scan, validate, commit, crash recovery), ExportEngine
 *   - Readers:  CatalogStore opened read-only (latest_artifacts, list_runs)
 *
 * Include this single header for the full bus, its configuration, storage
 * backends and the catalog lock.
 */
#include "abus_service.hpp"

#include <nlohmann/json.hpp>

#include "bus/bus_types.hpp"
#include "bus/manifest.hpp"
#include "bus/storage_backend.hpp"
#include "bus/bus_config.hpp"
#include "bus/catalog_lock.hpp"
#include "bus/catalog_store.hpp"
#include "bus/artifact_store.hpp"
#include "bus/export_engine.hpp"
#include "bus/producer_client.hpp"
#include "bus/bus_daemon.hpp"
