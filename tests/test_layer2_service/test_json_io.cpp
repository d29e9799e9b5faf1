/**
 * @file test_json_io.cpp
 * @brief Layer 2 tests for the crash-safe write primitives in json_io.
 */
#include "abus_service.hpp"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

using namespace artbus::utils;
using namespace artbus::tests::helper;
using nlohmann::json;

namespace
{
size_t count_entries(const fs::path &dir)
{
    size_t n = 0;
    for ([[maybe_unused]] const auto &e : fs::directory_iterator(dir))
        ++n;
    return n;
}
} // namespace

TEST(JsonIoTest, TempFileNames)
{
    EXPECT_TRUE(is_temp_file_name(".export_status.json.tmp.AbC123"));
    EXPECT_FALSE(is_temp_file_name("export_status.json"));
    EXPECT_FALSE(is_temp_file_name(".hidden"));
    EXPECT_FALSE(is_temp_file_name("x.tmp.y"));
}

/**
 * Write then read back; the directory holds only the target afterwards.
 */
TEST(JsonIoTest, AtomicWriteJson_RoundTripsAndLeavesNoTemp)
{
    TempDir dir("jsonio");
    const fs::path target = dir / "nested" / "ledger.json";
    const json doc{{"last_run_at", "2026-10-17T12:00:00.000Z"}, {"exports", json::object()}};

    std::error_code ec;
    ASSERT_TRUE(atomic_write_json(target, doc, &ec)) << ec.message();
    EXPECT_FALSE(ec);

    auto back = read_json_file(target, &ec);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, doc);
    EXPECT_EQ(count_entries(target.parent_path()), 1u);
}

TEST(JsonIoTest, AtomicWriteFile_ReplacesExistingContent)
{
    TempDir dir("jsonio");
    const fs::path target = dir / "golden.parquet";
    std::error_code ec;
    ASSERT_TRUE(atomic_write_file(target, "first", &ec));
    ASSERT_TRUE(atomic_write_file(target, "second, longer", &ec));

    std::string contents;
    ASSERT_TRUE(read_file_contents(target, contents));
    EXPECT_EQ(contents, "second, longer");
    EXPECT_EQ(count_entries(dir.path()), 1u);
}

TEST(JsonIoTest, AtomicWriteFile_RefusesSymlinkTarget)
{
    TempDir dir("jsonio");
    write_file(dir / "real.json", "{}");
    fs::create_symlink(dir / "real.json", dir / "link.json");

    std::error_code ec;
    EXPECT_FALSE(atomic_write_file(dir / "link.json", "{\"a\":1}", &ec));
    EXPECT_TRUE(ec);

    std::string contents;
    ASSERT_TRUE(read_file_contents(dir / "real.json", contents));
    EXPECT_EQ(contents, "{}");
}

TEST(JsonIoTest, ReadJsonFile_MissingFile)
{
    TempDir dir("jsonio");
    std::error_code ec;
    EXPECT_FALSE(read_json_file(dir / "absent.json", &ec).has_value());
    EXPECT_TRUE(ec == std::errc::no_such_file_or_directory) << ec.message();
}

TEST(JsonIoTest, ReadJsonFile_InvalidJson)
{
    TempDir dir("jsonio");
    write_file(dir / "broken.json", "{\"exports\": ");
    std::error_code ec;
    EXPECT_FALSE(read_json_file(dir / "broken.json", &ec).has_value());
    EXPECT_TRUE(ec == std::errc::illegal_byte_sequence) << ec.message();
}

TEST(JsonIoTest, FsyncDirectory)
{
    TempDir dir("jsonio");
    std::error_code ec;
    EXPECT_TRUE(fsync_directory(dir.path(), &ec)) << ec.message();
    EXPECT_FALSE(fsync_directory(dir / "absent", &ec));
    EXPECT_TRUE(ec);
}
