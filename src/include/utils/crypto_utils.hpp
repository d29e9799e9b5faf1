#pragma once
/**
 * @file crypto_utils.hpp
 * @brief Content hashes (BLAKE2b-256) and random numbers, on libsodium.
 *
 * An artifact's content hash is written `blake2b-256:<64 lowercase hex>`.
 * Producers compute it before submitting; the daemon recomputes it when it
 * validates a submission and when it replays a commit; the export engine uses
 * it to tell whether a golden file is current.
 *
 * The "CryptoUtils" lifecycle module initializes libsodium. Every function here
 * also initializes it on first use.
 */
#include "artbus_export.h"
#include "utils/module_def.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace artbus::crypto
{

inline constexpr size_t kDigestBytes = 32;
inline constexpr std::string_view kContentHashPrefix = "blake2b-256:";
inline constexpr size_t kContentHashLength = kContentHashPrefix.size() + 2 * kDigestBytes;

using Digest = std::array<uint8_t, kDigestBytes>;

/// BLAKE2b-256 of `len` bytes at `data`. Panics if libsodium cannot start.
ARTBUS_EXPORT Digest digest_of(const void *data, size_t len) noexcept;

/// `format_content_hash(digest_of(bytes))`.
ARTBUS_EXPORT std::string content_hash_of(std::string_view bytes);

/// Constant-time comparison.
ARTBUS_EXPORT bool digest_equal(const Digest &lhs, const Digest &rhs) noexcept;

/// BLAKE2b-256 fed in pieces.
class ARTBUS_EXPORT ContentHasher
{
  public:
    ContentHasher();
    ~ContentHasher();
    ContentHasher(const ContentHasher &) = delete;
    ContentHasher &operator=(const ContentHasher &) = delete;

    void update(const void *data, size_t len) noexcept;

    /// Ends the hash; further updates are ignored and a second call returns zeros.
    Digest finalize() noexcept;

  private:
    struct State;
    std::unique_ptr<State> m_state;
};

/// Streams a file through BLAKE2b-256. On error `ec` is set and the digest is zero.
ARTBUS_EXPORT Digest hash_file(const std::filesystem::path &path, std::error_code &ec) noexcept;

/// Lowercase hex.
ARTBUS_EXPORT std::string to_hex(const Digest &digest);

ARTBUS_EXPORT std::string format_content_hash(const Digest &digest);

/// Accepts exactly `blake2b-256:` followed by 64 lowercase hex digits.
ARTBUS_EXPORT std::optional<Digest> parse_content_hash(std::string_view text) noexcept;

ARTBUS_EXPORT bool is_valid_content_hash(std::string_view text) noexcept;

ARTBUS_EXPORT uint64_t generate_random_u64() noexcept;

/// Lifecycle module "CryptoUtils"; depends on "Logger".
ARTBUS_EXPORT artbus::utils::ModuleDef GetLifecycleModule();

} // namespace artbus::crypto
