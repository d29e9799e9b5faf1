/**
 * @file test_bus_config.cpp
 * @brief DaemonConfig parsing, path resolution and environment overrides.
 */
#include "abus_bus.hpp"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

using namespace artbus::bus;
using namespace artbus::tests::helper;
using nlohmann::json;
using namespace std::chrono_literals;

namespace
{

// Clears the override variables for the duration of a test.
class ConfigTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        ::unsetenv("ARTBUS_ROOT");
        ::unsetenv("ARTBUS_LOCK_TIMEOUT_S");
    }
    void TearDown() override
    {
        ::unsetenv("ARTBUS_ROOT");
        ::unsetenv("ARTBUS_LOCK_TIMEOUT_S");
    }
};

} // namespace

TEST_F(ConfigTest, DefaultsUnderRoot)
{
    const DaemonConfig cfg = DaemonConfig::from_json(json{{"bus", {{"root", "/data/bus"}}}}, "/etc");
    EXPECT_EQ(cfg.paths.root, fs::path("/data/bus"));
    EXPECT_EQ(cfg.paths.inbox_dir, fs::path("/data/bus/inbox"));
    EXPECT_EQ(cfg.paths.rejected_dir, fs::path("/data/bus/rejected"));
    EXPECT_EQ(cfg.paths.store_dir, fs::path("/data/bus/store"));
    EXPECT_EQ(cfg.paths.export_dir, fs::path("/data/bus/exports"));
    EXPECT_EQ(cfg.paths.catalog_path, fs::path("/data/bus/catalog.sqlite"));
    EXPECT_EQ(cfg.paths.lock_path, fs::path("/data/bus/catalog.lock"));
    EXPECT_EQ(cfg.paths.pending_dir(), fs::path("/data/bus/store/.pending"));
    EXPECT_EQ(cfg.paths.ledger_path(), fs::path("/data/bus/exports/export_status.json"));
    EXPECT_EQ(cfg.lock_timeout, 10s);
    EXPECT_EQ(cfg.poll_interval, 1000ms);
    EXPECT_EQ(cfg.validate_workers, 4);
    EXPECT_TRUE(cfg.allow_untyped);
    EXPECT_TRUE(cfg.known_schema_hints.empty());
}

TEST_F(ConfigTest, RelativePathsResolve)
{
    const json j{{"bus",
                  {{"root", "bus"},
                   {"inbox_dir", "incoming"},
                   {"catalog_path", "/var/lib/artbus/catalog.sqlite"},
                   {"log_file", "logs/daemon.log"}}}};
    const DaemonConfig cfg = DaemonConfig::from_json(j, "/srv");
    EXPECT_EQ(cfg.paths.root, fs::path("/srv/bus"));
    EXPECT_EQ(cfg.paths.inbox_dir, fs::path("/srv/bus/incoming"));
    EXPECT_EQ(cfg.paths.catalog_path, fs::path("/var/lib/artbus/catalog.sqlite"));
    EXPECT_EQ(cfg.log_file, "/srv/bus/logs/daemon.log");
}

TEST_F(ConfigTest, TuningFields)
{
    const json j{{"bus",
                  {{"root", "/b"},
                   {"lock_timeout_s", 2.5},
                   {"poll_interval_ms", 250},
                   {"validate_workers", 8},
                   {"known_schema_hints", json::array({"fills_v1", "ohlcv_v2"})},
                   {"allow_untyped", false},
                   {"log_level", "debug"}}}};
    const DaemonConfig cfg = DaemonConfig::from_json(j, "/");
    EXPECT_EQ(cfg.lock_timeout, 2500ms);
    EXPECT_EQ(cfg.poll_interval, 250ms);
    EXPECT_EQ(cfg.validate_workers, 8);
    EXPECT_EQ(cfg.known_schema_hints, (std::vector<std::string>{"fills_v1", "ohlcv_v2"}));
    EXPECT_FALSE(cfg.allow_untyped);
    EXPECT_EQ(cfg.log_level, "debug");
}

/**
 * Each invalid value is reported as a runtime_error naming the key.
 */
TEST_F(ConfigTest, InvalidValuesThrow)
{
    auto expect_error = [](const json &bus, const std::string &key)
    {
        try
        {
            (void)DaemonConfig::from_json(json{{"bus", bus}}, "/");
            ADD_FAILURE() << "no error for " << key;
        }
        catch (const std::runtime_error &e)
        {
            EXPECT_NE(std::string(e.what()).find(key), std::string::npos) << e.what();
        }
    };

    expect_error(json::object(), "root");
    expect_error({{"root", "/b"}, {"lock_timeout_s", 0}}, "lock_timeout_s");
    expect_error({{"root", "/b"}, {"lock_timeout_s", "ten"}}, "lock_timeout_s");
    expect_error({{"root", "/b"}, {"lock_timeout_s", 86401}}, "lock_timeout_s");
    expect_error({{"root", "/b"}, {"lock_timeout_s", 1e300}}, "lock_timeout_s");
    expect_error({{"root", "/b"}, {"poll_interval_ms", -1}}, "poll_interval_ms");
    expect_error({{"root", "/b"}, {"poll_interval_ms", int64_t{1} << 62}}, "poll_interval_ms");
    expect_error({{"root", "/b"}, {"validate_workers", 0}}, "validate_workers");
    expect_error({{"root", "/b"}, {"validate_workers", 1000}}, "validate_workers");
    expect_error({{"root", "/b"}, {"known_schema_hints", "fills_v1"}}, "known_schema_hints");
    expect_error({{"root", "/b"}, {"known_schema_hints", json::array({""})}}, "known_schema_hints");
    expect_error({{"root", "/b"}, {"allow_untyped", "yes"}}, "allow_untyped");
    expect_error({{"root", "/b"}, {"log_level", "loud"}}, "log_level");
    expect_error({{"root", 5}}, "root");

    EXPECT_THROW((void)DaemonConfig::from_json(json{{"other", 1}}, "/"), std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentOverridesFile)
{
    ::setenv("ARTBUS_ROOT", "/override/bus", 1);
    ::setenv("ARTBUS_LOCK_TIMEOUT_S", "0.5", 1);
    const DaemonConfig cfg =
        DaemonConfig::from_json(json{{"bus", {{"root", "/data/bus"}, {"lock_timeout_s", 30}}}}, "/");
    EXPECT_EQ(cfg.paths.root, fs::path("/override/bus"));
    EXPECT_EQ(cfg.paths.inbox_dir, fs::path("/override/bus/inbox"));
    EXPECT_EQ(cfg.lock_timeout, 500ms);

    ::setenv("ARTBUS_LOCK_TIMEOUT_S", "-3", 1);
    EXPECT_THROW((void)DaemonConfig::from_json(json{{"bus", {{"root", "/b"}}}}, "/"),
                 std::runtime_error);

    for (const char *too_long : {"86400.5", "1e10", "inf"})
    {
        ::setenv("ARTBUS_LOCK_TIMEOUT_S", too_long, 1);
        try
        {
            (void)DaemonConfig::from_json(json{{"bus", {{"root", "/b"}}}}, "/");
            ADD_FAILURE() << "no error for " << too_long;
        }
        catch (const std::runtime_error &e)
        {
            EXPECT_NE(std::string(e.what()).find("ARTBUS_LOCK_TIMEOUT_S"), std::string::npos)
                << e.what();
        }
    }

    ::setenv("ARTBUS_LOCK_TIMEOUT_S", "86400", 1);
    EXPECT_EQ(DaemonConfig::from_json(json{{"bus", {{"root", "/b"}}}}, "/").lock_timeout,
              std::chrono::hours(24));
}

TEST_F(ConfigTest, FromFileResolvesAgainstFileDirectory)
{
    TempDir dir("config");
    write_file(dir / "artbus.json", R"({"bus": {"root": "bus", "known_schema_hints": ["fills_v1"]}})");
    const DaemonConfig cfg = DaemonConfig::from_json_file(dir / "artbus.json");
    EXPECT_EQ(cfg.paths.root, (dir.path() / "bus").lexically_normal());
    ASSERT_EQ(cfg.known_schema_hints.size(), 1u);

    write_file(dir / "broken.json", "{\"bus\": ");
    EXPECT_THROW((void)DaemonConfig::from_json_file(dir / "broken.json"), std::runtime_error);
    EXPECT_THROW((void)DaemonConfig::from_json_file(dir / "absent.json"), std::runtime_error);
}

TEST_F(ConfigTest, ToJsonParsesBack)
{
    DaemonConfig cfg = DaemonConfig::for_root("/data/bus");
    cfg.known_schema_hints = {"fills_v1"};
    cfg.allow_untyped = false;
    cfg.lock_timeout = 1500ms;
    const DaemonConfig back = DaemonConfig::from_json(cfg.to_json(), "/");
    EXPECT_EQ(back.paths.store_dir, cfg.paths.store_dir);
    EXPECT_EQ(back.lock_timeout, cfg.lock_timeout);
    EXPECT_EQ(back.known_schema_hints, cfg.known_schema_hints);
    EXPECT_FALSE(back.allow_untyped);
}
