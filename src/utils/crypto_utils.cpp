/**
 * @file crypto_utils.cpp
 * @brief BLAKE2b-256 content hashes and randomness via libsodium.
 */
#include "utils/crypto_utils.hpp"
#include "abus_service.hpp"

#include <sodium.h>

#include <cerrno>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace artbus::crypto
{

namespace
{
constexpr size_t kReadChunk = size_t{1} << 20;

/// sodium_init() is idempotent and thread-safe; a failure is not recoverable.
void require_sodium() noexcept
{
    static const bool ready = [] {
        const int rc = sodium_init();
        if (rc == 0)
        {
            LOGGER_DEBUG("CryptoUtils: libsodium {} initialized", sodium_version_string());
        }
        return rc != -1;
    }();
    if (!ready)
    {
        ABUS_PANIC("CryptoUtils: sodium_init() failed");
    }
}

bool is_lower_hex(std::string_view text) noexcept
{
    for (const char c : text)
    {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
        {
            return false;
        }
    }
    return true;
}
} // namespace

Digest digest_of(const void *data, size_t len) noexcept
{
    require_sodium();
    Digest out{};
    crypto_generichash(out.data(), out.size(), static_cast<const unsigned char *>(data), len,
                       nullptr, 0);
    return out;
}

std::string content_hash_of(std::string_view bytes)
{
    return format_content_hash(digest_of(bytes.data(), bytes.size()));
}

bool digest_equal(const Digest &lhs, const Digest &rhs) noexcept
{
    return sodium_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

// ============================================================================
// ContentHasher
// ============================================================================

struct ContentHasher::State
{
    crypto_generichash_state sodium;
    bool done{false};
};

ContentHasher::ContentHasher() : m_state(std::make_unique<State>())
{
    require_sodium();
    crypto_generichash_init(&m_state->sodium, nullptr, 0, kDigestBytes);
}

ContentHasher::~ContentHasher()
{
    sodium_memzero(&m_state->sodium, sizeof(m_state->sodium));
}

void ContentHasher::update(const void *data, size_t len) noexcept
{
    if (!m_state->done && len > 0)
    {
        crypto_generichash_update(&m_state->sodium, static_cast<const unsigned char *>(data), len);
    }
}

Digest ContentHasher::finalize() noexcept
{
    Digest out{};
    if (!m_state->done)
    {
        crypto_generichash_final(&m_state->sodium, out.data(), out.size());
        m_state->done = true;
    }
    return out;
}

Digest hash_file(const std::filesystem::path &path, std::error_code &ec) noexcept
{
    ec.clear();
    try
    {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1)
        {
            ec = std::error_code(errno, std::generic_category());
            return {};
        }
        auto close_fd = artbus::basics::make_scope_guard([fd] { ::close(fd); });

        std::vector<unsigned char> chunk(kReadChunk);
        ContentHasher hasher;
        for (;;)
        {
            const ssize_t got = ::read(fd, chunk.data(), chunk.size());
            if (got == 0)
            {
                return hasher.finalize();
            }
            if (got < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                ec = std::error_code(errno, std::generic_category());
                return {};
            }
            hasher.update(chunk.data(), static_cast<size_t>(got));
        }
    }
    catch (const std::bad_alloc &)
    {
        ec = std::make_error_code(std::errc::not_enough_memory);
        return {};
    }
}

// ============================================================================
// Text form
// ============================================================================

std::string to_hex(const Digest &digest)
{
    std::string hex(2 * digest.size() + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    hex.resize(2 * digest.size());
    return hex;
}

std::string format_content_hash(const Digest &digest)
{
    return std::string(kContentHashPrefix) + to_hex(digest);
}

std::optional<Digest> parse_content_hash(std::string_view text) noexcept
{
    if (text.size() != kContentHashLength || !text.starts_with(kContentHashPrefix))
    {
        return std::nullopt;
    }
    const std::string_view hex = text.substr(kContentHashPrefix.size());
    // Uppercase would give one digest two spellings.
    if (!is_lower_hex(hex))
    {
        return std::nullopt;
    }
    require_sodium();
    Digest out{};
    size_t decoded = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &decoded,
                       nullptr) != 0 ||
        decoded != out.size())
    {
        return std::nullopt;
    }
    return out;
}

bool is_valid_content_hash(std::string_view text) noexcept
{
    return parse_content_hash(text).has_value();
}

uint64_t generate_random_u64() noexcept
{
    require_sodium();
    uint64_t value = 0;
    randombytes_buf(&value, sizeof(value));
    return value;
}

// ============================================================================
// Lifecycle
// ============================================================================

namespace
{
void start_crypto(const char *)
{
    require_sodium();
}
} // namespace

artbus::utils::ModuleDef GetLifecycleModule()
{
    artbus::utils::ModuleDef module("CryptoUtils");
    module.depends_on("Logger").on_start(&start_crypto);
    return module;
}

} // namespace artbus::crypto
