#pragma once
/**
 * @file abus_service.hpp
 * @brief Layer 2: Service modules built on abus_base.
 *
 * Provides lifecycle management, file locking, logging, content hashing, backoff
 * strategies, the Result error type and crash-safe JSON file I/O.
 * Include this when you need application lifecycle, FileLock, Logger, CryptoUtils,
 * or atomic file writes.
 */
#include "abus_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/file_lock.hpp"
#include "utils/json_io.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/result.hpp"
