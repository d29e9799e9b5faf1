/**
 * @file test_crypto_utils.cpp
 * @brief Layer 2 tests for content hashes and random numbers.
 */
#include "abus_service.hpp"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <string>

using namespace artbus;
using namespace artbus::tests::helper;

namespace
{
// BLAKE2b with a 32-byte digest over no input.
constexpr std::string_view kEmptyInputHex =
    "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8";
} // namespace

TEST(CryptoUtilsTest, EmptyInputMatchesReferenceDigest)
{
    EXPECT_EQ(crypto::to_hex(crypto::digest_of(nullptr, 0)), kEmptyInputHex);
    EXPECT_EQ(crypto::content_hash_of(""), "blake2b-256:" + std::string(kEmptyInputHex));
}

TEST(CryptoUtilsTest, SameBytesSameDigest)
{
    const std::string a = "fills-0001";
    const std::string b = "fills-0002";
    EXPECT_TRUE(crypto::digest_equal(crypto::digest_of(a.data(), a.size()),
                                     crypto::digest_of(a.data(), a.size())));
    EXPECT_FALSE(crypto::digest_equal(crypto::digest_of(a.data(), a.size()),
                                      crypto::digest_of(b.data(), b.size())));
}

TEST(CryptoUtilsTest, PiecewiseHashMatchesWholeHash)
{
    const std::string payload = make_payload(100000, 7);
    crypto::ContentHasher hasher;
    size_t offset = 0;
    for (size_t piece = 1; offset < payload.size(); piece = piece * 3 + 1)
    {
        const size_t n = std::min(piece, payload.size() - offset);
        hasher.update(payload.data() + offset, n);
        offset += n;
    }
    EXPECT_EQ(hasher.finalize(), crypto::digest_of(payload.data(), payload.size()));
}

TEST(CryptoUtilsTest, FileHashSpansSeveralReads)
{
    TempDir dir("crypto");
    const std::string payload = make_payload(3 * 1024 * 1024 + 17, 11);
    write_file(dir / "data.parquet", payload);

    std::error_code ec;
    const auto digest = crypto::hash_file(dir / "data.parquet", ec);
    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(crypto::format_content_hash(digest), crypto::content_hash_of(payload));
}

TEST(CryptoUtilsTest, FileHashReportsMissingFile)
{
    TempDir dir("crypto");
    std::error_code ec;
    (void)crypto::hash_file(dir / "absent.parquet", ec);
    EXPECT_EQ(ec, std::errc::no_such_file_or_directory);
}

TEST(CryptoUtilsTest, ContentHashTextParsesBack)
{
    const auto digest = crypto::digest_of("x", 1);
    const std::string text = crypto::format_content_hash(digest);
    EXPECT_EQ(text.size(), crypto::kContentHashLength);
    EXPECT_TRUE(text.starts_with(crypto::kContentHashPrefix));

    const auto parsed = crypto::parse_content_hash(text);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, digest);
}

TEST(CryptoUtilsTest, MalformedContentHashesAreRejected)
{
    const std::string good = crypto::content_hash_of("x");
    const std::string hex = good.substr(crypto::kContentHashPrefix.size());
    std::string upper = hex;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    EXPECT_TRUE(crypto::is_valid_content_hash(good));
    EXPECT_FALSE(crypto::is_valid_content_hash(""));
    EXPECT_FALSE(crypto::is_valid_content_hash(hex));
    EXPECT_FALSE(crypto::is_valid_content_hash(good.substr(0, good.size() - 1)));
    EXPECT_FALSE(crypto::is_valid_content_hash(good + "0"));
    EXPECT_FALSE(crypto::is_valid_content_hash("sha256:" + hex));
    EXPECT_FALSE(crypto::is_valid_content_hash("blake2b-256:" + std::string(64, 'g')));
    if (upper != hex)
    {
        EXPECT_FALSE(crypto::is_valid_content_hash("blake2b-256:" + upper));
    }
}

TEST(CryptoUtilsTest, RandomValuesDoNotRepeat)
{
    std::set<uint64_t> seen;
    for (int i = 0; i < 1000; ++i)
    {
        seen.insert(crypto::generate_random_u64());
    }
    EXPECT_EQ(seen.size(), 1000u);
}
