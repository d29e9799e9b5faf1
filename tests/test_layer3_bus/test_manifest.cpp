/**
 * @file test_manifest.cpp
 * @brief Manifest parsing: required fields, type checks and job ids.
 */
#include "abus_bus.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>

using namespace artbus;
using namespace artbus::bus;
using nlohmann::json;

namespace
{

std::string some_hash()
{
    const std::string payload = "payload";
    return crypto::content_hash_of(payload);
}

json valid_manifest_json()
{
    return json{{"manifest_version", 1},
                {"job_id", "job-1760700000000-3f2a9c01d4e5b6a7"},
                {"run_id", "r1"},
                {"producer", "simulation"},
                {"kind", "fills"},
                {"artifact_id", "fills-0001"},
                {"data_file", "job-1760700000000-3f2a9c01d4e5b6a7.parquet"},
                {"schema_hint", "fills_v1"},
                {"rows", 1000},
                {"bytes", 7},
                {"content_hash", some_hash()},
                {"meta", {{"strategy", "momentum"}}},
                {"submitted_at", "2026-10-17T12:00:00.000Z"},
                {"producer_pid", 4242}};
}

} // namespace

TEST(ManifestTest, ParsesCompleteManifest)
{
    auto parsed = Manifest::from_json(valid_manifest_json());
    ASSERT_TRUE(parsed.is_ok()) << parsed.error_message();
    const Manifest &m = parsed.content();
    EXPECT_EQ(m.job_id, "job-1760700000000-3f2a9c01d4e5b6a7");
    EXPECT_EQ(m.identity.to_string(), "simulation/fills/r1/fills-0001");
    EXPECT_EQ(m.rows, 1000);
    EXPECT_EQ(m.bytes, 7u);
    ASSERT_TRUE(m.schema_hint.has_value());
    EXPECT_EQ(*m.schema_hint, "fills_v1");
    EXPECT_FALSE(m.is_untyped());
    EXPECT_EQ(m.meta["strategy"], "momentum");
    EXPECT_EQ(m.producer_pid, 4242u);
}

TEST(ManifestTest, ToJsonParsesBack)
{
    auto first = Manifest::from_json(valid_manifest_json());
    ASSERT_TRUE(first.is_ok());
    auto again = Manifest::parse(first.content().to_json().dump());
    ASSERT_TRUE(again.is_ok()) << again.error_message();
    EXPECT_EQ(again.content().identity, first.content().identity);
    EXPECT_EQ(again.content().content_hash, first.content().content_hash);
    EXPECT_EQ(again.content().meta, first.content().meta);
}

TEST(ManifestTest, OptionalFieldsMayBeAbsent)
{
    json j = valid_manifest_json();
    j.erase("schema_hint");
    j.erase("meta");
    j.erase("submitted_at");
    j.erase("producer_pid");
    auto parsed = Manifest::from_json(j);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error_message();
    EXPECT_TRUE(parsed.content().is_untyped());
    EXPECT_TRUE(parsed.content().meta.is_object());
    EXPECT_TRUE(parsed.content().meta.empty());
}

TEST(ManifestTest, UntypedHintCountsAsAbsent)
{
    json j = valid_manifest_json();
    j["schema_hint"] = "untyped";
    auto parsed = Manifest::from_json(j);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.content().is_untyped());
}

/**
 * Each required field, when missing, yields a ValidationError naming it.
 */
TEST(ManifestTest, MissingRequiredFieldIsValidationError)
{
    for (const char *key : {"job_id", "run_id", "producer", "kind", "artifact_id", "data_file",
                            "rows", "bytes", "content_hash", "manifest_version"})
    {
        json j = valid_manifest_json();
        j.erase(key);
        auto parsed = Manifest::from_json(j);
        ASSERT_TRUE(parsed.is_error()) << key;
        EXPECT_EQ(parsed.error(), BusError::ValidationError) << key;
        EXPECT_NE(parsed.error_message().find(key), std::string::npos) << parsed.error_message();
    }
}

TEST(ManifestTest, RejectsBadValues)
{
    auto expect_invalid = [](json j, const char *what)
    {
        auto parsed = Manifest::from_json(j);
        ASSERT_TRUE(parsed.is_error()) << what;
        EXPECT_EQ(parsed.error(), BusError::ValidationError) << what;
    };

    json j = valid_manifest_json();
    j["rows"] = -1;
    expect_invalid(j, "negative rows");

    j = valid_manifest_json();
    j["rows"] = "1000";
    expect_invalid(j, "string rows");

    j = valid_manifest_json();
    j["bytes"] = -5;
    expect_invalid(j, "negative bytes");

    j = valid_manifest_json();
    j["content_hash"] = "sha256:abc";
    expect_invalid(j, "foreign hash");

    j = valid_manifest_json();
    j["data_file"] = "../escape.parquet";
    expect_invalid(j, "path in data_file");

    j = valid_manifest_json();
    j["producer"] = "sim/ulation";
    expect_invalid(j, "separator in producer");

    j = valid_manifest_json();
    j["meta"] = json::array({1, 2});
    expect_invalid(j, "array meta");

    j = valid_manifest_json();
    j["manifest_version"] = 2;
    expect_invalid(j, "future version");

    expect_invalid(json::array(), "not an object");
}

TEST(ManifestTest, ParseRejectsMalformedJson)
{
    auto parsed = Manifest::parse("{\"manifest_version\": 1, ");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error(), BusError::ValidationError);
    EXPECT_NE(parsed.error_message().find("JSON"), std::string::npos);
}

TEST(ManifestTest, JobIdsAreUniqueAndWellFormed)
{
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i)
    {
        const std::string id = make_job_id();
        EXPECT_TRUE(is_valid_identifier(id)) << id;
        EXPECT_EQ(id.rfind("job-", 0), 0u);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 200u);
}

TEST(ManifestTest, FileNames)
{
    EXPECT_EQ(manifest_file_name("job-1"), "job-1.manifest.json");
    EXPECT_EQ(data_file_name("job-1"), "job-1.parquet");
}
