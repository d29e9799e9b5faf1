/**
 * @file test_producer_client.cpp
 * @brief Producer submissions: inbox layout, manifest contents and cleanup on failure.
 */
#include "abus_bus.hpp"
#include "bus_test_harness.h"
#include "shared_test_helpers.h"

#include <gtest/gtest.h>

#include <cerrno>
#include <set>

using namespace artbus;
using namespace artbus::bus;
using namespace artbus::tests::helper;
using nlohmann::json;

namespace
{
const fs::path kInbox = "/bus/inbox";
const fs::path kSource = "/work/out/fills.parquet";

SubmitRequest request_for(std::string artifact_id = "fills-0001")
{
    SubmitRequest req;
    req.identity = make_identity("r1", "simulation", "fills", std::move(artifact_id));
    req.data_path = kSource;
    req.schema_hint = "fills_v1";
    req.rows = 1000;
    req.meta = {{"strategy", "momentum"}};
    return req;
}
} // namespace

TEST(ProducerClientTest, SubmitWritesDataAndManifest)
{
    MemoryBackend backend;
    const std::string payload = make_payload(2048, 11);
    backend.put(kSource, payload);
    ProducerClient client(backend, kInbox);

    auto receipt = client.submit_artifact(request_for());
    ASSERT_TRUE(receipt.is_ok()) << receipt.error_message();
    const SubmitReceipt &r = receipt.content();

    EXPECT_EQ(r.bytes, payload.size());
    EXPECT_EQ(r.content_hash, crypto::content_hash_of(payload));
    EXPECT_EQ(r.data_path, kInbox / data_file_name(r.job_id));
    EXPECT_EQ(r.manifest_path, kInbox / manifest_file_name(r.job_id));
    EXPECT_EQ(backend.read_file(r.data_path).content(), payload);
    EXPECT_TRUE(backend.exists(kSource));

    auto manifest = Manifest::parse(backend.read_file(r.manifest_path).content());
    ASSERT_TRUE(manifest.is_ok()) << manifest.error_message();
    const Manifest &m = manifest.content();
    EXPECT_EQ(m.job_id, r.job_id);
    EXPECT_EQ(m.identity, request_for().identity);
    EXPECT_EQ(m.data_file, r.data_path.filename().string());
    EXPECT_EQ(m.rows, 1000);
    EXPECT_EQ(m.bytes, payload.size());
    EXPECT_EQ(m.content_hash, r.content_hash);
    EXPECT_EQ(m.meta["strategy"], "momentum");
    EXPECT_EQ(m.producer_pid, platform::get_pid());
    EXPECT_FALSE(m.submitted_at.empty());
}

TEST(ProducerClientTest, EverySubmissionGetsItsOwnJob)
{
    MemoryBackend backend;
    backend.put(kSource, "same bytes");
    ProducerClient client(backend, kInbox);

    std::set<std::string> jobs;
    for (int i = 0; i < 5; ++i)
    {
        auto receipt = client.submit_artifact(request_for());
        ASSERT_TRUE(receipt.is_ok());
        jobs.insert(receipt.content().job_id);
    }
    EXPECT_EQ(jobs.size(), 5u);
    EXPECT_EQ(backend.list(kInbox).content().size(), 10u);
}

TEST(ProducerClientTest, InvalidRequestsWriteNothing)
{
    MemoryBackend backend;
    backend.put(kSource, "x");
    ProducerClient client(backend, kInbox);

    SubmitRequest bad_id = request_for("../escape");
    SubmitRequest bad_rows = request_for();
    bad_rows.rows = -1;
    SubmitRequest bad_meta = request_for();
    bad_meta.meta = json::array();
    SubmitRequest bad_hint = request_for();
    bad_hint.schema_hint = "";

    for (const SubmitRequest *req : {&bad_id, &bad_rows, &bad_meta, &bad_hint})
    {
        auto receipt = client.submit_artifact(*req);
        ASSERT_TRUE(receipt.is_error());
        EXPECT_EQ(receipt.error(), BusError::ValidationError);
    }
    EXPECT_TRUE(backend.list(kInbox).content().empty());
}

TEST(ProducerClientTest, MissingDataFileIsIoError)
{
    MemoryBackend backend;
    ProducerClient client(backend, kInbox);
    auto receipt = client.submit_artifact(request_for());
    ASSERT_TRUE(receipt.is_error());
    EXPECT_EQ(receipt.error(), BusError::IoError);
    EXPECT_EQ(receipt.error_code(), ENOENT);
}

/**
 * If the manifest cannot be written, the already copied data file is removed.
 */
TEST(ProducerClientTest, ManifestFailureRemovesData)
{
    MemoryBackend backend;
    backend.put(kSource, "payload");
    backend.fail_next(MemoryBackend::FaultOp::Write);
    ProducerClient client(backend, kInbox);

    auto receipt = client.submit_artifact(request_for());
    ASSERT_TRUE(receipt.is_error());
    EXPECT_EQ(receipt.error(), BusError::IoError);
    EXPECT_TRUE(backend.list(kInbox).content().empty());
}

TEST(ProducerClientTest, CopyFailureLeavesInboxEmpty)
{
    MemoryBackend backend;
    backend.put(kSource, "payload");
    backend.fail_next(MemoryBackend::FaultOp::Copy);
    ProducerClient client(backend, kInbox);

    auto receipt = client.submit_artifact(request_for());
    ASSERT_TRUE(receipt.is_error());
    EXPECT_EQ(receipt.error(), BusError::IoError);
    EXPECT_TRUE(backend.list(kInbox).content().empty());
}

TEST(ProducerClientTest, SubmitOnFilesystemLeavesNoTempFiles)
{
    TempDir dir("producer");
    FilesystemBackend backend;
    write_file(dir / "src.parquet", make_payload(100000, 5));
    ProducerClient client(backend, dir / "inbox");

    SubmitRequest req = request_for();
    req.data_path = dir / "src.parquet";
    req.schema_hint.reset();
    auto receipt = client.submit_artifact(req);
    ASSERT_TRUE(receipt.is_ok()) << receipt.error_message();

    size_t files = 0;
    for (const auto &entry : fs::directory_iterator(dir / "inbox"))
    {
        EXPECT_FALSE(utils::is_temp_file_name(entry.path().filename().string()))
            << entry.path();
        ++files;
    }
    EXPECT_EQ(files, 2u);

    auto manifest = Manifest::parse(backend.read_file(receipt.content().manifest_path).content());
    ASSERT_TRUE(manifest.is_ok());
    EXPECT_TRUE(manifest.content().is_untyped());
}
